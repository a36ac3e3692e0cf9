// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <mutex>
#include <vector>
#include "engine.hpp"
#include "tapra6_error.hpp"
#include "log.hpp"

bool Engine::add(int ifindex)
{
    boost::system::error_code ec;
    auto t = factory_(ifindex, ec);
    if (!t) {
        // Not an operator error: the tap is just not ours to serve.
        if (ec == tapra6_errc::ineligible)
            log_line("engine: ignoring ifIndex {}: {}", ifindex, ec.message());
        else
            log_error("engine: failed adding ifIndex {}: {}", ifindex, ec.message());
        return false;
    }

    std::shared_ptr<Tap> prev;
    {
        std::unique_lock<std::shared_mutex> wl(lock_);
        auto &slot = taps_[ifindex];
        prev = std::move(slot);
        slot = t;
    }
    if (prev) {
        log_warn("engine: {} was already registered, replacing its handler", t->name());
        prev->cancel();
    }

    t->run([this, ifindex, wt = std::weak_ptr<Tap>(t), name = t->name()](const boost::system::error_code &result) {
        on_tap_exit(ifindex, wt, name, result);
    });
    return true;
}

void Engine::on_tap_exit(int ifindex, const std::weak_ptr<Tap> &tap, const std::string &name,
                         const boost::system::error_code &ec)
{
    // Cancellation is routine shutdown or interface removal.
    if (ec == boost::asio::error::operation_aborted)
        log_line("engine: {} closed", name);
    else
        log_error("engine: {} failed with {}", name, ec.message());

    std::unique_lock<std::shared_mutex> wl(lock_);
    auto i = taps_.find(ifindex);
    // A newer tap may have replaced this one under the same index.  An
    // expired tap was already closed and can never match.
    auto self = tap.lock();
    if (self && i != taps_.end() && i->second == self)
        taps_.erase(i);
}

bool Engine::check(int ifindex) const
{
    std::shared_lock<std::shared_mutex> rl(lock_);
    return taps_.find(ifindex) != taps_.end();
}

std::shared_ptr<Tap> Engine::get(int ifindex) const
{
    std::shared_lock<std::shared_mutex> rl(lock_);
    auto i = taps_.find(ifindex);
    return i != taps_.end() ? i->second : nullptr;
}

void Engine::close(int ifindex)
{
    std::shared_ptr<Tap> t;
    {
        std::unique_lock<std::shared_mutex> wl(lock_);
        auto i = taps_.find(ifindex);
        if (i == taps_.end()) return;
        t = std::move(i->second);
        taps_.erase(i);
    }
    t->cancel();
}

void Engine::close_all()
{
    std::vector<std::shared_ptr<Tap>> v;
    {
        std::unique_lock<std::shared_mutex> wl(lock_);
        v.reserve(taps_.size());
        for (auto &i: taps_) v.emplace_back(std::move(i.second));
        taps_.clear();
    }
    for (auto &i: v) i->cancel();
}

std::size_t Engine::size() const
{
    std::shared_lock<std::shared_mutex> rl(lock_);
    return taps_.size();
}
