// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include "radv6.hpp"
#include "ra6wire.hpp"
#include "log.hpp"

namespace ba = boost::asio;

RA6Listener::RA6Listener(ba::io_context &io, const netif_info &ifinfo,
                         const std::optional<ba::ip::address_v6> &prefix,
                         NdpDialer &dialer, const ra6_config &cfg)
    : strand_(ba::make_strand(io)), timer_(strand_), ifinfo_(ifinfo),
      dialer_(dialer), cfg_(cfg), state_(State::Idle), dial_attempts_(0),
      canceled_(false), sending_(false), send_pending_(false)
{
    // The routing snapshot never changes for the lifetime of the listener,
    // so every advertisement is byte-for-byte the same.
    ra6_advert_params p;
    if (ifinfo_.has_macaddr) p.macaddr = ifinfo_.macaddr;
    p.prefix = prefix;
    p.router_lifetime = cfg_.router_lifetime;
    advert_ = build_router_advert(p);
}

void RA6Listener::start(exit_handler h)
{
    ba::post(strand_, [self = shared_from_this(), h = std::move(h)]() mutable {
        if (self->state_ != State::Idle) return;
        self->on_exit_ = std::move(h);
        self->dial();
    });
}

void RA6Listener::cancel()
{
    ba::post(strand_, [self = shared_from_this()] {
        self->canceled_ = true;
        // Not started yet; dial() sees the flag.
        if (self->state_ == State::Idle) return;
        self->finish(ba::error::operation_aborted);
    });
}

void RA6Listener::dial()
{
    if (canceled_) {
        finish(ba::error::operation_aborted);
        return;
    }
    state_ = State::Connecting;
    ++dial_attempts_;
    boost::system::error_code ec;
    conn_ = dialer_.dial(ifinfo_, strand_, ec);
    if (!conn_) {
        log_warn("ra6: {}: unable to dial linklocal: {}, retrying...", ifinfo_.name, ec.message());
        timer_.expires_after(cfg_.retry_backoff);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code &error) {
            if (self->state_ == State::Closed) return;
            if (error || self->canceled_) {
                self->finish(ba::error::operation_aborted);
                return;
            }
            self->dial();
        });
        return;
    }
    log_debug("ra6: {}: successfully dialed linklocal", ifinfo_.name);
    activate();
}

void RA6Listener::activate()
{
    boost::system::error_code ec;
    conn_->set_rs_filter(ec);
    if (ec) {
        log_error("ra6: {}: failed to apply ICMP type filter: {}", ifinfo_.name, ec.message());
        finish(ec);
        return;
    }
    conn_->join_allrouters(ec);
    if (ec) {
        log_error("ra6: {}: failed to join multicast group: {}", ifinfo_.name, ec.message());
        finish(ec);
        return;
    }
    state_ = State::Active;
    log_debug("ra6: handling interface: {}, mac: {}, mtu: {}, src ip: {}", ifinfo_.name,
              ifinfo_.has_macaddr ? macaddr_str(ifinfo_.macaddr) : "none",
              ifinfo_.mtu, conn_->local_address().to_string());
    start_receive();
    send_advert();
}

void RA6Listener::start_receive()
{
    conn_->async_receive(ba::buffer(recv_buffer_),
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t bytes_xferred,
                                    const ba::ip::address_v6 &sender)
        {
            if (self->state_ == State::Closed) return;
            if (ec) {
                if (ec == ba::error::operation_aborted) {
                    self->finish(ec);
                } else {
                    log_error("ra6: {}: receive failed: {}", self->ifinfo_.name, ec.message());
                    self->finish(ec);
                }
                return;
            }
            self->process_receive(bytes_xferred, sender);
            self->start_receive();
        });
}

void RA6Listener::arm_periodic()
{
    timer_.expires_after(cfg_.advert_interval);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
        if (self->state_ == State::Closed) return;
        // Re-armed after a solicited advertisement.
        if (ec == ba::error::operation_aborted) return;
        self->send_advert();
    });
}

void RA6Listener::send_advert()
{
    // One advertisement in flight at a time; a trigger that arrives
    // meanwhile is sent once the current one completes.
    if (sending_) {
        send_pending_ = true;
        return;
    }
    sending_ = true;
    conn_->async_send_advert(ba::buffer(advert_),
        [self = shared_from_this()](const boost::system::error_code &ec) {
            self->sending_ = false;
            if (self->state_ == State::Closed) return;
            if (ec) {
                if (ec == ba::error::operation_aborted) {
                    self->finish(ec);
                    return;
                }
                if (ec == ba::error::no_buffer_space || ec == ba::error::would_block) {
                    log_warn("ra6: {}: dropped router advertisement: {}", self->ifinfo_.name, ec.message());
                } else {
                    log_error("ra6: {}: sendto failed: {}", self->ifinfo_.name, ec.message());
                    self->finish(ec);
                    return;
                }
            }
            if (self->send_pending_) {
                self->send_pending_ = false;
                self->send_advert();
                return;
            }
            self->arm_periodic();
        });
}

void RA6Listener::process_receive(std::size_t buflen, const ba::ip::address_v6 &sender)
{
    auto v = check_router_solicit(recv_buffer_.data(), buflen, sender.is_unspecified());
    if (v != rs_verdict::ok) {
        log_debug("ra6: {}: ignoring solicitation from {}: {}", ifinfo_.name,
                  sender.to_string(), rs_verdict_str(v));
        return;
    }
    log_debug("ra6: {}: router solicitation from {}", ifinfo_.name, sender.to_string());
    send_advert();
}

void RA6Listener::finish(const boost::system::error_code &ec)
{
    if (state_ == State::Closed) return;
    state_ = State::Closed;
    timer_.cancel();
    if (conn_) conn_->close();
    auto h = std::move(on_exit_);
    on_exit_ = nullptr;
    if (h) h(ec);
}
