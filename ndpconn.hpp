// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_NDPCONN_HPP_
#define TAPRA6_NDPCONN_HPP_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "nlsocket.hpp"

// One ICMPv6 socket bound to a single tap.  Completion handlers run on the
// executor the connection was dialed with.
class NdpConn
{
public:
    using recv_handler = std::function<void(const boost::system::error_code &, std::size_t,
                                            const boost::asio::ip::address_v6 &)>;
    using send_handler = std::function<void(const boost::system::error_code &)>;

    virtual ~NdpConn() = default;
    // Drop every inbound ICMPv6 type but Router Solicitation.
    virtual void set_rs_filter(boost::system::error_code &ec) = 0;
    virtual void join_allrouters(boost::system::error_code &ec) = 0;
    virtual void async_receive(boost::asio::mutable_buffer buf, recv_handler h) = 0;
    // Sends to the all-nodes group on the tap.
    virtual void async_send_advert(boost::asio::const_buffer buf, send_handler h) = 0;
    // Pending operations complete with operation_aborted.
    virtual void close() = 0;
    virtual boost::asio::ip::address_v6 local_address() const = 0;
};

class NdpDialer
{
public:
    virtual ~NdpDialer() = default;
    [[nodiscard]] virtual std::unique_ptr<NdpConn> dial(const netif_info &ifinfo,
                                                        const boost::asio::any_io_executor &ex,
                                                        boost::system::error_code &ec) = 0;
};

// Dials by binding a raw ICMPv6 socket to the link-local address of the
// interface.  That fails until the kernel has finished bringing up a new
// tap, which can take 15 seconds or more.
class LinkLocalDialer final : public NdpDialer
{
public:
    [[nodiscard]] std::unique_ptr<NdpConn> dial(const netif_info &ifinfo,
                                                const boost::asio::any_io_executor &ex,
                                                boost::system::error_code &ec) override;
};

[[nodiscard]] std::optional<boost::asio::ip::address_v6>
find_link_local(const std::string &ifname, boost::system::error_code &ec);

#endif
