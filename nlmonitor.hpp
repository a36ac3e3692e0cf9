// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_NLMONITOR_HPP_
#define TAPRA6_NLMONITOR_HPP_

#include <array>
#include <cstdint>
#include <regex>
#include <linux/netlink.h>
#include <boost/asio.hpp>
#include "asio_netlink.hpp"
#include "engine.hpp"

// Watches rtnetlink link events and hands interfaces whose name matches
// the configured expression to the Engine.  Links that exist at startup
// are picked up from an initial dump.
class LinkMonitor
{
public:
    LinkMonitor(boost::asio::io_context &io, Engine &engine, std::regex ifname_re);
    LinkMonitor(const LinkMonitor &) = delete;
    LinkMonitor &operator=(const LinkMonitor &) = delete;

    [[nodiscard]] bool start();
    // Stops watching and then closes every tap the Engine holds.
    void shutdown();

    void process_receive(const char *buf, std::size_t bytes_xferred);
private:
    void request_links();
    void start_receive();
    void process_link_msg(const nlmsghdr *nlh);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    nl_protocol::socket socket_;
    Engine &engine_;
    std::regex ifname_re_;
    alignas(nlmsghdr) std::array<char, 32768> recv_buffer_;
    uint32_t nlseq_;
    bool stopped_;
};

#endif
