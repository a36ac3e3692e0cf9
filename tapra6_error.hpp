// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_ERROR_HPP_
#define TAPRA6_ERROR_HPP_

#include <type_traits>
#include <boost/system/error_code.hpp>

// Reasons a tap handle could not be constructed.
enum class tapra6_errc
{
    resolve_failed = 1, // interface vanished before it could be resolved
    inspect_failed,     // kernel route query failed
    ineligible,         // neither host nor subnet routes point at the tap
};

const boost::system::error_category &tapra6_category();

inline boost::system::error_code make_error_code(tapra6_errc e)
{
    return boost::system::error_code(static_cast<int>(e), tapra6_category());
}

namespace boost::system {
template <> struct is_error_code_enum<tapra6_errc> : std::true_type {};
}

#endif
