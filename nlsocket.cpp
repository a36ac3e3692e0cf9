// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <cstring>
#include <net/if.h>
#include <sys/socket.h>
#include <linux/rtnetlink.h>
#include <linux/if_link.h>
#include <fmt/format.h>
#include "asio_netlink.hpp"
#include "nlsocket.hpp"

// The NLMSG_* and RTA_* macros include c-style casts.
#ifdef __GNUC__
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

std::string macaddr_str(const std::array<uint8_t, 6> &mac)
{
    return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}",
                       mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
}

std::optional<netif_info> parse_link_msg(const nlmsghdr *nlh)
{
    if (nlh->nlmsg_type != RTM_NEWLINK && nlh->nlmsg_type != RTM_DELLINK)
        return {};
    if (nlh->nlmsg_len < NLMSG_LENGTH(sizeof(ifinfomsg)))
        return {};
    auto ifm = reinterpret_cast<const ifinfomsg *>(NLMSG_DATA(nlh));

    netif_info nii;
    nii.index = ifm->ifi_index;
    int rtalen = static_cast<int>(IFLA_PAYLOAD(nlh));
    for (auto rta = IFLA_RTA(ifm); RTA_OK(rta, rtalen); rta = RTA_NEXT(rta, rtalen)) {
        switch (rta->rta_type) {
        case IFLA_IFNAME: {
            auto v = reinterpret_cast<const char *>(RTA_DATA(rta));
            nii.name.assign(v, strnlen(v, RTA_PAYLOAD(rta)));
            break;
        }
        case IFLA_ADDRESS:
            // Only ethernet-style hardware addresses can go into an RA.
            if (RTA_PAYLOAD(rta) == nii.macaddr.size()) {
                memcpy(nii.macaddr.data(), RTA_DATA(rta), nii.macaddr.size());
                nii.has_macaddr = true;
            }
            break;
        case IFLA_MTU:
            if (RTA_PAYLOAD(rta) >= sizeof nii.mtu)
                memcpy(&nii.mtu, RTA_DATA(rta), sizeof nii.mtu);
            break;
        default: break;
        }
    }
    return nii;
}

std::optional<route6_entry> parse_route6_msg(const nlmsghdr *nlh)
{
    if (nlh->nlmsg_type != RTM_NEWROUTE)
        return {};
    if (nlh->nlmsg_len < NLMSG_LENGTH(sizeof(rtmsg)))
        return {};
    auto rtm = reinterpret_cast<const rtmsg *>(NLMSG_DATA(nlh));
    if (rtm->rtm_family != AF_INET6 || rtm->rtm_dst_len > 128)
        return {};

    route6_entry r;
    r.dst_len = rtm->rtm_dst_len;
    r.table = rtm->rtm_table;
    int rtalen = static_cast<int>(RTM_PAYLOAD(nlh));
    for (auto rta = RTM_RTA(rtm); RTA_OK(rta, rtalen); rta = RTA_NEXT(rta, rtalen)) {
        switch (rta->rta_type) {
        case RTA_DST: {
            boost::asio::ip::address_v6::bytes_type b;
            if (RTA_PAYLOAD(rta) != b.size()) return {};
            memcpy(b.data(), RTA_DATA(rta), b.size());
            r.dst = boost::asio::ip::address_v6(b);
            break;
        }
        case RTA_OIF:
            if (RTA_PAYLOAD(rta) >= sizeof r.oif)
                memcpy(&r.oif, RTA_DATA(rta), sizeof r.oif);
            break;
        case RTA_TABLE:
            // Tables above 255 are only named here.
            if (RTA_PAYLOAD(rta) >= sizeof r.table)
                memcpy(&r.table, RTA_DATA(rta), sizeof r.table);
            break;
        default: break;
        }
    }
    return r;
}

NLQuery::NLQuery(boost::asio::io_context &io) : io_(io), nlseq_(1) {}

bool NLQuery::request(nlmsghdr *req, const reply_fn &fn, boost::system::error_code &ec)
{
    nl_protocol::socket s(io_);
    s.open(nl_protocol(NETLINK_ROUTE), ec);
    if (ec) return false;
    s.bind(nl_protocol::endpoint(0), ec);
    if (ec) return false;

    const auto seq = nlseq_++;
    req->nlmsg_seq = seq;
    s.send(boost::asio::buffer(req, req->nlmsg_len), 0, ec);
    if (ec) return false;

    const bool is_dump = req->nlmsg_flags & NLM_F_DUMP;
    std::vector<char> buf(32768);
    for (;;) {
        auto buflen = s.receive(boost::asio::buffer(buf), 0, ec);
        if (ec) return false;
        auto nlh = reinterpret_cast<const nlmsghdr *>(buf.data());
        for (; NLMSG_OK(nlh, buflen); nlh = NLMSG_NEXT(nlh, buflen)) {
            if (nlh->nlmsg_seq != seq)
                continue;
            switch (nlh->nlmsg_type) {
            case NLMSG_DONE: return true;
            case NLMSG_ERROR: {
                auto nle = reinterpret_cast<const nlmsgerr *>(NLMSG_DATA(nlh));
                if (!nle->error) return true;
                ec = boost::system::error_code(-nle->error, boost::system::system_category());
                return false;
            }
            case NLMSG_NOOP:
            case NLMSG_OVERRUN:
                break;
            default:
                fn(nlh);
                if (!is_dump) return true;
                break;
            }
        }
    }
}

std::optional<netif_info> NLQuery::get_link(int ifindex, boost::system::error_code &ec)
{
    struct {
        nlmsghdr nlh;
        ifinfomsg ifm;
    } req;
    memset(&req, 0, sizeof req);
    req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof req.ifm);
    req.nlh.nlmsg_type = RTM_GETLINK;
    req.nlh.nlmsg_flags = NLM_F_REQUEST;
    req.ifm.ifi_family = AF_UNSPEC;
    req.ifm.ifi_index = ifindex;

    std::optional<netif_info> ret;
    if (!request(&req.nlh, [&ret](const nlmsghdr *nlh) { ret = parse_link_msg(nlh); }, ec))
        return {};
    if (!ret)
        ec = boost::system::errc::make_error_code(boost::system::errc::no_such_device);
    return ret;
}

std::vector<route6_entry> NLQuery::get_routes6(boost::system::error_code &ec)
{
    struct {
        nlmsghdr nlh;
        rtmsg rtm;
    } req;
    memset(&req, 0, sizeof req);
    req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof req.rtm);
    req.nlh.nlmsg_type = RTM_GETROUTE;
    req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    req.rtm.rtm_family = AF_INET6;

    std::vector<route6_entry> ret;
    if (!request(&req.nlh, [&ret](const nlmsghdr *nlh) {
            if (auto r = parse_route6_msg(nlh)) ret.emplace_back(std::move(*r));
        }, ec))
        return {};
    return ret;
}
