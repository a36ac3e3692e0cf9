// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_LOG_HPP_
#define TAPRA6_LOG_HPP_

#include <cstdlib>
#include <string_view>
#include <utility>
#include <fmt/format.h>

enum class log_level { debug, info, warning, error, crit };

void log_set_level(log_level v);
void log_use_syslog(bool v);
[[nodiscard]] bool log_enabled(log_level v);
void log_write(log_level lvl, std::string_view msg);

template <typename... Args>
void log_msg(log_level lvl, fmt::format_string<Args...> f, Args &&...args)
{
    if (!log_enabled(lvl)) return;
    log_write(lvl, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args &&...args)
{
    log_msg(log_level::debug, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_line(fmt::format_string<Args...> f, Args &&...args)
{
    log_msg(log_level::info, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args &&...args)
{
    log_msg(log_level::warning, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args &&...args)
{
    log_msg(log_level::error, f, std::forward<Args>(args)...);
}

// Only for conditions that leave the whole daemon unable to continue.
template <typename... Args>
[[noreturn]] void suicide(fmt::format_string<Args...> f, Args &&...args)
{
    log_write(log_level::crit, fmt::format(f, std::forward<Args>(args)...));
    std::exit(EXIT_FAILURE);
}

#endif
