// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <cstring>
#include <sys/socket.h>
#include <linux/rtnetlink.h>
#include "nlmonitor.hpp"
#include "nlsocket.hpp"
#include "log.hpp"

// The NLMSG_* macros include c-style casts.
#ifdef __GNUC__
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

namespace ba = boost::asio;

LinkMonitor::LinkMonitor(ba::io_context &io, Engine &engine, std::regex ifname_re)
    : strand_(ba::make_strand(io)), socket_(strand_), engine_(engine),
      ifname_re_(std::move(ifname_re)), nlseq_(1), stopped_(false)
{}

bool LinkMonitor::start()
{
    boost::system::error_code ec;
    socket_.open(nl_protocol(NETLINK_ROUTE), ec);
    if (ec) {
        log_error("nlmonitor: failed to create netlink socket: {}", ec.message());
        return false;
    }
    socket_.bind(nl_protocol::endpoint(RTMGRP_LINK), ec);
    if (ec) {
        log_error("nlmonitor: failed to bind netlink socket: {}", ec.message());
        return false;
    }
    ba::post(strand_, [this] {
        request_links();
        start_receive();
    });
    return true;
}

void LinkMonitor::shutdown()
{
    ba::post(strand_, [this] {
        stopped_ = true;
        boost::system::error_code ec;
        socket_.close(ec);
        engine_.close_all();
    });
}

void LinkMonitor::request_links()
{
    struct {
        nlmsghdr nlh;
        ifinfomsg ifm;
    } req;
    memset(&req, 0, sizeof req);
    req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof req.ifm);
    req.nlh.nlmsg_type = RTM_GETLINK;
    req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    req.nlh.nlmsg_seq = nlseq_++;
    req.ifm.ifi_family = AF_UNSPEC;

    boost::system::error_code ec;
    socket_.send(ba::buffer(&req, req.nlh.nlmsg_len), 0, ec);
    if (ec) suicide("nlmonitor: failed to request link state: {}", ec.message());
}

void LinkMonitor::start_receive()
{
    socket_.async_receive(ba::buffer(recv_buffer_),
        [this](const boost::system::error_code &ec, std::size_t bytes_xferred)
        {
            if (stopped_) return;
            if (ec == ba::error::no_buffer_space) {
                // The kernel dropped events; resynchronize from a full dump.
                log_warn("nlmonitor: netlink receive overrun, requesting links again");
                request_links();
                start_receive();
                return;
            }
            if (ec) suicide("nlmonitor: receive failed: {}", ec.message());
            process_receive(recv_buffer_.data(), bytes_xferred);
            start_receive();
        });
}

void LinkMonitor::process_receive(const char *buf, std::size_t bytes_xferred)
{
    auto nlh = reinterpret_cast<const nlmsghdr *>(buf);
    for (; NLMSG_OK(nlh, bytes_xferred); nlh = NLMSG_NEXT(nlh, bytes_xferred)) {
        switch (nlh->nlmsg_type) {
        case RTM_NEWLINK:
        case RTM_DELLINK:
            process_link_msg(nlh);
            break;
        case NLMSG_ERROR: {
            auto nle = reinterpret_cast<const nlmsgerr *>(NLMSG_DATA(nlh));
            if (nle->error)
                log_error("nlmonitor: received a NLMSG_ERROR: {}", strerror(-nle->error));
            break;
        }
        case NLMSG_OVERRUN:
            log_warn("nlmonitor: received a NLMSG_OVERRUN");
            break;
        default:
            break;
        }
    }
}

void LinkMonitor::process_link_msg(const nlmsghdr *nlh)
{
    auto nii = parse_link_msg(nlh);
    if (!nii || nii->name.empty()) return;
    if (!std::regex_search(nii->name, ifname_re_)) {
        log_debug("nlmonitor: {} does not match, ignoring", nii->name);
        return;
    }
    if (nlh->nlmsg_type == RTM_DELLINK) {
        log_line("nlmonitor: {} (ifIndex {}) removed", nii->name, nii->index);
        engine_.close(nii->index);
        return;
    }
    // New links are announced many times as their flags change.
    if (engine_.check(nii->index))
        return;
    log_line("nlmonitor: {} (ifIndex {}) appeared", nii->name, nii->index);
    engine_.add(nii->index);
}
