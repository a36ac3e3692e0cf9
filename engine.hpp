// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_ENGINE_HPP_
#define TAPRA6_ENGINE_HPP_

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <boost/system/error_code.hpp>
#include "tap.hpp"

// Registry of every running tap, keyed by interface index.  Registry calls
// never wait on a tap's listener; each listener removes its own entry when
// it exits for any reason.
class Engine
{
public:
    using tap_factory = std::function<std::shared_ptr<Tap>(int ifindex, boost::system::error_code &ec)>;

    explicit Engine(tap_factory factory) : factory_(std::move(factory)) {}
    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    // Builds a tap for ifindex and starts advertising on it.  Returns false,
    // leaving the index unregistered, if the tap could not be built.
    bool add(int ifindex);
    [[nodiscard]] bool check(int ifindex) const;
    // nullptr if ifindex is not registered.
    [[nodiscard]] std::shared_ptr<Tap> get(int ifindex) const;
    void close(int ifindex);
    void close_all();
    [[nodiscard]] std::size_t size() const;
private:
    void on_tap_exit(int ifindex, const std::weak_ptr<Tap> &tap, const std::string &name,
                     const boost::system::error_code &ec);

    tap_factory factory_;
    mutable std::shared_mutex lock_;
    std::unordered_map<int, std::shared_ptr<Tap>> taps_;
};

#endif
