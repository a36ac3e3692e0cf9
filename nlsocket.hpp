// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_NLSOCKET_HPP_
#define TAPRA6_NLSOCKET_HPP_

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <linux/netlink.h>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

struct netif_info
{
    std::string name;
    std::array<uint8_t, 6> macaddr{};
    int index = -1;
    unsigned int mtu = 0;
    bool has_macaddr = false;
};

struct route6_entry
{
    boost::asio::ip::address_v6 dst;
    uint8_t dst_len = 0;
    int oif = 0;
    uint32_t table = 0;
};

std::string macaddr_str(const std::array<uint8_t, 6> &mac);

// Decoders for single rtnetlink messages.  They return nothing for
// messages of another type or family and for truncated messages.
[[nodiscard]] std::optional<netif_info> parse_link_msg(const nlmsghdr *nlh);
[[nodiscard]] std::optional<route6_entry> parse_route6_msg(const nlmsghdr *nlh);

// The kernel state the tap handles are built from.
class NetQuery
{
public:
    virtual ~NetQuery() = default;
    // Current snapshot of one link; an error if the index no longer exists.
    [[nodiscard]] virtual std::optional<netif_info> get_link(int ifindex, boost::system::error_code &ec) = 0;
    // The IPv6 route tables in kernel enumeration order.
    [[nodiscard]] virtual std::vector<route6_entry> get_routes6(boost::system::error_code &ec) = 0;
};

// Answers NetQuery requests with synchronous rtnetlink round trips.  Every
// request uses its own socket, so concurrent callers do not interfere.
class NLQuery final : public NetQuery
{
public:
    explicit NLQuery(boost::asio::io_context &io);
    NLQuery(const NLQuery &) = delete;
    NLQuery &operator=(const NLQuery &) = delete;

    [[nodiscard]] std::optional<netif_info> get_link(int ifindex, boost::system::error_code &ec) override;
    [[nodiscard]] std::vector<route6_entry> get_routes6(boost::system::error_code &ec) override;
private:
    using reply_fn = std::function<void(const nlmsghdr *)>;
    [[nodiscard]] bool request(nlmsghdr *req, const reply_fn &fn, boost::system::error_code &ec);
    boost::asio::io_context &io_;
    std::atomic<uint32_t> nlseq_;
};

#endif
