// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <atomic>
#include <mutex>
#include <string>
#include <syslog.h>
#include <stdio.h>
#include "log.hpp"

static std::mutex log_mtx;
static std::atomic<log_level> log_threshold{log_level::info};
static std::atomic<bool> log_to_syslog{false};

static int syslog_prio(log_level lvl)
{
    switch (lvl) {
    case log_level::debug: return LOG_DEBUG;
    case log_level::info: return LOG_INFO;
    case log_level::warning: return LOG_WARNING;
    case log_level::error: return LOG_ERR;
    case log_level::crit: return LOG_CRIT;
    }
    return LOG_INFO;
}

static const char *level_tag(log_level lvl)
{
    switch (lvl) {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warning: return "warning";
    case log_level::error: return "error";
    case log_level::crit: return "crit";
    }
    return "info";
}

void log_set_level(log_level v)
{
    log_threshold = v;
}

void log_use_syslog(bool v)
{
    std::lock_guard<std::mutex> ml(log_mtx);
    if (v && !log_to_syslog) openlog("tapra6", LOG_PID, LOG_DAEMON);
    else if (!v && log_to_syslog) closelog();
    log_to_syslog = v;
}

bool log_enabled(log_level v)
{
    return v >= log_threshold.load();
}

void log_write(log_level lvl, std::string_view msg)
{
    std::lock_guard<std::mutex> ml(log_mtx);
    if (log_to_syslog) {
        syslog(syslog_prio(lvl), "%.*s", static_cast<int>(msg.size()), msg.data());
        return;
    }
    fmt::print(stderr, "[{}] {}\n", level_tag(lvl), msg);
    fflush(stderr);
}
