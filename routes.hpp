// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_ROUTES_HPP_
#define TAPRA6_ROUTES_HPP_

#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "nlsocket.hpp"

// Routes that egress through one interface, split by prefix length.
// Both lists keep kernel enumeration order.
struct route_set
{
    std::vector<boost::asio::ip::network_v6> hosts;   // /128 entries
    std::vector<boost::asio::ip::network_v6> subnets; // everything else, ::/0 included

    [[nodiscard]] bool empty() const { return hosts.empty() && subnets.empty(); }
};

[[nodiscard]] route_set classify_routes(const std::vector<route6_entry> &routes, int ifindex);

// Queries the kernel and classifies the main table routes of ifindex.  An
// empty result is not an error here.
[[nodiscard]] bool inspect_routes(NetQuery &nq, int ifindex, route_set &out,
                                  boost::system::error_code &ec);

// The /64 that contains the first host route, if there is one.
[[nodiscard]] std::optional<boost::asio::ip::address_v6> advert_prefix(const route_set &rs);

std::string routes_str(const std::vector<boost::asio::ip::network_v6> &nets);

#endif
