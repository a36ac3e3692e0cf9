// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_ASIO_NETLINK_HPP_
#define TAPRA6_ASIO_NETLINK_HPP_

#include <cstddef>
#include <cstring>
#include <asm/types.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <boost/asio.hpp>

template <typename Proto>
class nl_endpoint
{
public:
    typedef Proto protocol_type;
    typedef boost::asio::detail::socket_addr_type data_type;

    // A portid of zero lets the kernel pick a unique one, so several
    // netlink sockets can coexist in one process.
    explicit nl_endpoint(unsigned groups, unsigned portid = 0) {
        memset(&sockaddr_, 0, sizeof sockaddr_);
        sockaddr_.nl_family = AF_NETLINK;
        sockaddr_.nl_groups = groups;
        sockaddr_.nl_pid = portid;
    }

    nl_endpoint() : nl_endpoint(0) {}

    protocol_type protocol() const { return protocol_type(); }
    data_type *data() {
        return reinterpret_cast<struct sockaddr *>(&sockaddr_);
    }
    const data_type *data() const {
        return reinterpret_cast<const struct sockaddr *>(&sockaddr_);
    }
    void resize(std::size_t) {}
    std::size_t size() const { return sizeof sockaddr_; }
    std::size_t capacity() const { return sizeof sockaddr_; }
    unsigned portid() const { return sockaddr_.nl_pid; }
    unsigned groups() const { return sockaddr_.nl_groups; }

    friend bool operator==(const nl_endpoint<Proto> &self,
                           const nl_endpoint<Proto> &other) {
        return self.sockaddr_.nl_pid == other.sockaddr_.nl_pid
            && self.sockaddr_.nl_groups == other.sockaddr_.nl_groups;
    }
    friend bool operator!=(const nl_endpoint<Proto> &self,
                           const nl_endpoint<Proto> &other) {
        return !(self == other);
    }
private:
    sockaddr_nl sockaddr_;
};

class nl_protocol
{
public:
    nl_protocol() : proto_(0) {}
    explicit nl_protocol(int proto) : proto_(proto) {}
    int type() const { return SOCK_RAW; }
    int protocol() const { return proto_; }
    int family() const { return AF_NETLINK; }
    typedef nl_endpoint<nl_protocol> endpoint;
    typedef boost::asio::basic_raw_socket<nl_protocol> socket;
private:
    int proto_;
};

#endif
