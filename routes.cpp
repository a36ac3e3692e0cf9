// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <linux/rtnetlink.h>
#include <fmt/format.h>
#include "routes.hpp"

namespace ba = boost::asio;

route_set classify_routes(const std::vector<route6_entry> &routes, int ifindex)
{
    route_set ret;
    for (const auto &i: routes) {
        if (i.oif != ifindex || i.table != RT_TABLE_MAIN)
            continue;
        ba::ip::network_v6 net(i.dst, i.dst_len);
        if (i.dst_len == 128) ret.hosts.push_back(net);
        else ret.subnets.push_back(net);
    }
    return ret;
}

bool inspect_routes(NetQuery &nq, int ifindex, route_set &out,
                    boost::system::error_code &ec)
{
    auto routes = nq.get_routes6(ec);
    if (ec) return false;
    out = classify_routes(routes, ifindex);
    return true;
}

std::optional<ba::ip::address_v6> advert_prefix(const route_set &rs)
{
    if (rs.hosts.empty()) return {};
    // Bits 65-128 of the first host route are cleared.
    return ba::ip::network_v6(rs.hosts.front().address(), 64).network();
}

std::string routes_str(const std::vector<ba::ip::network_v6> &nets)
{
    std::vector<std::string> v;
    v.reserve(nets.size());
    for (const auto &i: nets) v.emplace_back(i.to_string());
    return fmt::format("[{}]", fmt::join(v, " "));
}
