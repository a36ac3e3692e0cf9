// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_TAP_HPP_
#define TAPRA6_TAP_HPP_

#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "nlsocket.hpp"
#include "ndpconn.hpp"
#include "radv6.hpp"
#include "routes.hpp"

// A managed tap interface: the link and routing snapshot taken when it was
// created, plus the listener that advertises on it.
//
// The prefix is assumed to match the address the guest derives from its own
// MAC with SLAAC.  Nothing here can verify that; a mismatch still gets
// advertised.
class Tap
{
public:
    // Resolves the interface and inspects its routes.  Fails with
    // tapra6_errc::resolve_failed, inspect_failed or ineligible.  The
    // listener is not started.
    [[nodiscard]] static std::shared_ptr<Tap> create(boost::asio::io_context &io, int ifindex,
                                                     NetQuery &nq, NdpDialer &dialer,
                                                     const ra6_config &cfg,
                                                     boost::system::error_code &ec);
    Tap(const Tap &) = delete;
    Tap &operator=(const Tap &) = delete;

    void run(RA6Listener::exit_handler h) { listener_->start(std::move(h)); }
    void cancel() { listener_->cancel(); }

    int index() const { return ifinfo_.index; }
    const std::string &name() const { return ifinfo_.name; }
    const netif_info &ifinfo() const { return ifinfo_; }
    const std::optional<boost::asio::ip::address_v6> &prefix() const { return prefix_; }
    const route_set &routes() const { return routes_; }
    RA6Listener::State state() const { return listener_->state(); }
    const RA6Listener &listener() const { return *listener_; }
private:
    struct private_tag { explicit private_tag() = default; };
public:
    Tap(private_tag, netif_info ifinfo, route_set routes,
        std::optional<boost::asio::ip::address_v6> prefix)
        : ifinfo_(std::move(ifinfo)), routes_(std::move(routes)), prefix_(std::move(prefix)) {}
private:

    netif_info ifinfo_;
    route_set routes_;
    std::optional<boost::asio::ip::address_v6> prefix_;
    std::shared_ptr<RA6Listener> listener_;
};

#endif
