// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include "tap.hpp"
#include "tapra6_error.hpp"
#include "log.hpp"

std::shared_ptr<Tap> Tap::create(boost::asio::io_context &io, int ifindex,
                                 NetQuery &nq, NdpDialer &dialer,
                                 const ra6_config &cfg,
                                 boost::system::error_code &ec)
{
    boost::system::error_code qec;
    auto ifinfo = nq.get_link(ifindex, qec);
    if (!ifinfo) {
        log_debug("tap: unable to get interface {}: {}", ifindex, qec.message());
        ec = tapra6_errc::resolve_failed;
        return {};
    }

    route_set routes;
    if (!inspect_routes(nq, ifinfo->index, routes, qec)) {
        log_debug("tap: failed getting routes for if {}: {}", ifinfo->name, qec.message());
        ec = tapra6_errc::inspect_failed;
        return {};
    }

    log_debug("tap: host routes found on {}: {}", ifinfo->name, routes_str(routes.hosts));
    log_debug("tap: subnet routes found on {}: {}", ifinfo->name, routes_str(routes.subnets));

    if (routes.empty()) {
        ec = tapra6_errc::ineligible;
        return {};
    }

    auto prefix = advert_prefix(routes);
    if (!prefix) {
        log_warn("tap: {} has no host routes, only advertising RA without prefix for SLAAC",
                 ifinfo->name);
    }
    if (!ifinfo->has_macaddr) {
        log_warn("tap: {} has no ethernet address, advertising without a link-layer address",
                 ifinfo->name);
    }
    log_line("tap: {} found: {}", ifinfo->name, prefix ? prefix->to_string() + "/64" : "<nil>");

    auto ret = std::make_shared<Tap>(private_tag{}, *ifinfo, std::move(routes), prefix);
    ret->listener_ = std::make_shared<RA6Listener>(io, ret->ifinfo_, ret->prefix_, dialer, cfg);
    ec = {};
    return ret;
}
