// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/icmp6.h>
#include <sys/socket.h>
#include "ndpconn.hpp"

namespace ba = boost::asio;

static const auto mc6_allnodes = ba::ip::make_address_v6("ff02::1");
static const auto mc6_allrouters = ba::ip::make_address_v6("ff02::2");

namespace {

class AsioNdpConn final : public NdpConn
{
public:
    AsioNdpConn(const ba::any_io_executor &ex, const netif_info &ifinfo)
        : socket_(ex), ifindex_(ifinfo.index) {}

    [[nodiscard]] bool open(const ba::ip::address_v6 &lla, boost::system::error_code &ec);

    void set_rs_filter(boost::system::error_code &ec) override;
    void join_allrouters(boost::system::error_code &ec) override;
    void async_receive(ba::mutable_buffer buf, recv_handler h) override;
    void async_send_advert(ba::const_buffer buf, send_handler h) override;
    void close() override;
    ba::ip::address_v6 local_address() const override { return lla_; }
private:
    ba::ip::icmp::socket socket_;
    ba::ip::icmp::endpoint remote_endpoint_;
    ba::ip::icmp::endpoint allnodes_;
    ba::ip::address_v6 lla_;
    int ifindex_;
};

bool AsioNdpConn::open(const ba::ip::address_v6 &lla, boost::system::error_code &ec)
{
    auto scope = static_cast<unsigned long>(ifindex_);
    lla_ = lla;
    lla_.scope_id(scope);
    auto mc = mc6_allnodes;
    mc.scope_id(scope);
    allnodes_ = ba::ip::icmp::endpoint(mc, 0);

    socket_.open(ba::ip::icmp::v6(), ec);
    if (ec) return false;
    socket_.set_option(ba::ip::multicast::outbound_interface(static_cast<unsigned>(ifindex_)), ec);
    if (ec) return false;
    // Neighbor Discovery messages are dropped unless the hop limit is 255.
    socket_.set_option(ba::ip::multicast::hops(255), ec);
    if (ec) return false;
    socket_.set_option(ba::ip::unicast::hops(255), ec);
    if (ec) return false;
    socket_.set_option(ba::ip::multicast::enable_loopback(false), ec);
    if (ec) return false;
    // Fails with EADDRNOTAVAIL while the address is still tentative.
    socket_.bind(ba::ip::icmp::endpoint(lla_, 0), ec);
    return !ec;
}

void AsioNdpConn::set_rs_filter(boost::system::error_code &ec)
{
    icmp6_filter f;
    ICMP6_FILTER_SETBLOCKALL(&f);
    ICMP6_FILTER_SETPASS(ND_ROUTER_SOLICIT, &f);
    if (setsockopt(socket_.native_handle(), IPPROTO_ICMPV6, ICMP6_FILTER, &f, sizeof f) < 0) {
        ec = boost::system::error_code(errno, boost::system::system_category());
        return;
    }
    ec = {};
}

void AsioNdpConn::join_allrouters(boost::system::error_code &ec)
{
    // We are now a "router".
    socket_.set_option(ba::ip::multicast::join_group(mc6_allrouters, static_cast<unsigned long>(ifindex_)), ec);
}

void AsioNdpConn::async_receive(ba::mutable_buffer buf, recv_handler h)
{
    socket_.async_receive_from(buf, remote_endpoint_,
        [this, h = std::move(h)](const boost::system::error_code &ec, std::size_t bytes_xferred)
        {
            auto sender = remote_endpoint_.address();
            h(ec, bytes_xferred, sender.is_v6() ? sender.to_v6() : ba::ip::address_v6());
        });
}

void AsioNdpConn::async_send_advert(ba::const_buffer buf, send_handler h)
{
    socket_.async_send_to(buf, allnodes_,
        [h = std::move(h)](const boost::system::error_code &ec, std::size_t)
        {
            h(ec);
        });
}

void AsioNdpConn::close()
{
    boost::system::error_code ec;
    socket_.close(ec);
}

}

std::optional<ba::ip::address_v6>
find_link_local(const std::string &ifname, boost::system::error_code &ec)
{
    struct ifaddrs *ifaddr, *ifa;
    if (getifaddrs(&ifaddr) == -1) {
        ec = boost::system::error_code(errno, boost::system::system_category());
        return {};
    }
    std::optional<ba::ip::address_v6> ret;
    for (ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr)
            continue;
        if (strcmp(ifa->ifa_name, ifname.c_str()))
            continue;
        if (ifa->ifa_addr->sa_family != AF_INET6)
            continue;
        auto sin6 = reinterpret_cast<const sockaddr_in6 *>(ifa->ifa_addr);
        ba::ip::address_v6::bytes_type b;
        memcpy(b.data(), &sin6->sin6_addr, b.size());
        ba::ip::address_v6 a(b);
        if (a.is_link_local()) {
            ret = a;
            break;
        }
    }
    freeifaddrs(ifaddr);
    if (!ret)
        ec = boost::system::errc::make_error_code(boost::system::errc::address_not_available);
    else
        ec = {};
    return ret;
}

std::unique_ptr<NdpConn> LinkLocalDialer::dial(const netif_info &ifinfo,
                                               const ba::any_io_executor &ex,
                                               boost::system::error_code &ec)
{
    auto lla = find_link_local(ifinfo.name, ec);
    if (!lla) return {};
    auto c = std::make_unique<AsioNdpConn>(ex, ifinfo);
    if (!c->open(*lla, ec)) return {};
    return c;
}
