// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_RADV6_HPP_
#define TAPRA6_RADV6_HPP_

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <boost/asio.hpp>
#include "nlsocket.hpp"
#include "ndpconn.hpp"

struct ra6_config
{
    std::chrono::milliseconds advert_interval{std::chrono::seconds(10)};
    std::chrono::milliseconds retry_backoff{std::chrono::seconds(1)};
    uint16_t router_lifetime = 30;
};

// Router advertisement state machine for one tap:
//
//   Idle -> Connecting -> Active -> Closed
//
// Connecting retries the dial every retry_backoff until it succeeds or the
// listener is canceled; there is no retry limit.  Active sends an RA right
// away, then every advert_interval and whenever a valid Router Solicitation
// arrives.  All work happens on a private strand.
class RA6Listener : public std::enable_shared_from_this<RA6Listener>
{
public:
    enum class State { Idle, Connecting, Active, Closed };
    // operation_aborted means canceled; anything else is a failure.
    using exit_handler = std::function<void(const boost::system::error_code &)>;

    RA6Listener(boost::asio::io_context &io, const netif_info &ifinfo,
                const std::optional<boost::asio::ip::address_v6> &prefix,
                NdpDialer &dialer, const ra6_config &cfg);
    RA6Listener(const RA6Listener &) = delete;
    RA6Listener &operator=(const RA6Listener &) = delete;

    void start(exit_handler h);
    void cancel();
    State state() const { return state_; }
    unsigned dial_attempts() const { return dial_attempts_; }
    const std::vector<uint8_t> &advert() const { return advert_; }
private:
    void dial();
    void activate();
    void start_receive();
    void arm_periodic();
    void send_advert();
    void process_receive(std::size_t buflen, const boost::asio::ip::address_v6 &sender);
    void finish(const boost::system::error_code &ec);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    netif_info ifinfo_;
    std::vector<uint8_t> advert_;
    NdpDialer &dialer_;
    ra6_config cfg_;
    std::unique_ptr<NdpConn> conn_;
    exit_handler on_exit_;
    std::array<uint8_t, 8192> recv_buffer_;
    std::atomic<State> state_;
    std::atomic<unsigned> dial_attempts_;
    bool canceled_:1;
    bool sending_:1;
    bool send_pending_:1;
};


#endif
