// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <string>
#include "tapra6_error.hpp"

namespace {

class tapra6_category_impl : public boost::system::error_category
{
public:
    const char *name() const noexcept override { return "tapra6"; }
    std::string message(int ev) const override
    {
        switch (static_cast<tapra6_errc>(ev)) {
        case tapra6_errc::resolve_failed:
            return "unable to get interface";
        case tapra6_errc::inspect_failed:
            return "failed getting routes for interface";
        case tapra6_errc::ineligible:
            return "neither host nor subnet routes to this tap; "
                   "this may be a private vlan interface";
        }
        return "unknown tapra6 error";
    }
};

}

const boost::system::error_category &tapra6_category()
{
    static const tapra6_category_impl cat;
    return cat;
}
