// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <charconv>
#include <cstring>
#include <regex>
#include <getopt.h>
#include <stdio.h>
#include <fmt/format.h>
#include "cfg.hpp"

static bool parse_uint(const char *s, unsigned lo, unsigned hi, unsigned &out)
{
    unsigned v;
    auto end = s + strlen(s);
    auto r = std::from_chars(s, end, v);
    if (r.ec != std::errc() || r.ptr != end) return false;
    if (v < lo || v > hi) return false;
    out = v;
    return true;
}

bool parse_options(int ac, char *av[], tapra6_config &cfg,
                   cfg_action &act, std::string &err)
{
    static const struct option long_options[] = {
        {"regex", 1, nullptr, 'r'},
        {"interval", 1, nullptr, 'i'},
        {"threads", 1, nullptr, 't'},
        {"syslog", 0, nullptr, 's'},
        {"verbose", 0, nullptr, 'v'},
        {"version", 0, nullptr, 'V'},
        {"help", 0, nullptr, 'h'},
        {nullptr, 0, nullptr, 0 }
    };
    act = cfg_action::run;
    // Rescan from the start on every call.
    optind = 0;
    opterr = 0;
    for (;;) {
        auto c = getopt_long(ac, av, ":r:i:t:svVh", long_options, nullptr);
        if (c == -1) break;
        switch (c) {
        case 'r':
            try {
                std::regex re(optarg);
            } catch (const std::regex_error &e) {
                err = fmt::format("invalid interface regex '{}': {}", optarg, e.what());
                return false;
            }
            cfg.ifname_regex = optarg;
            break;
        case 'i':
            if (!parse_uint(optarg, 4, 1800, cfg.advert_interval_s)) {
                err = fmt::format("invalid advertisement interval '{}': must be 4-1800 seconds", optarg);
                return false;
            }
            break;
        case 't':
            if (!parse_uint(optarg, 1, 64, cfg.threads)) {
                err = fmt::format("invalid thread count '{}': must be 1-64", optarg);
                return false;
            }
            break;
        case 's': cfg.use_syslog = true; break;
        case 'v': cfg.verbose = true; break;
        case 'V': act = cfg_action::version; return true;
        case 'h': act = cfg_action::help; return true;
        case ':':
            err = fmt::format("option '{}' requires an argument", av[optind - 1]);
            return false;
        default:
            if (optopt) err = fmt::format("unknown option '-{}'", static_cast<char>(optopt));
            else err = fmt::format("unknown option '{}'", av[optind - 1]);
            return false;
        }
    }
    if (optind < ac) {
        err = fmt::format("unexpected argument '{}'", av[optind]);
        return false;
    }
    return true;
}

ra6_config make_ra6_config(const tapra6_config &cfg)
{
    ra6_config ret;
    ret.advert_interval = std::chrono::seconds(cfg.advert_interval_s);
    ret.retry_backoff = std::chrono::seconds(1);
    ret.router_lifetime = static_cast<uint16_t>(std::min(3 * cfg.advert_interval_s, 9000U));
    return ret;
}

void usage()
{
    fmt::print("tapra6 " TAPRA6_VERSION ", IPv6 router advertisement responder for tap interfaces.\n");
    fmt::print("tapra6 [options]...\n\nOptions:\n");
    fmt::print("--regex           -r []  Manage interfaces whose name matches this regex (default ^tap).\n");
    fmt::print("--interval        -i []  Seconds between unsolicited advertisements (4-1800, default 10).\n");
    fmt::print("--threads         -t []  Number of event loop threads (default 2).\n");
    fmt::print("--syslog          -s     Log to syslog instead of stderr.\n");
    fmt::print("--verbose         -v     Log debug messages.\n");
    fmt::print("--version         -V     Print version and exit.\n");
    fmt::print("--help            -h     Print this help and exit.\n");
}

void print_version()
{
    fmt::print("tapra6 " TAPRA6_VERSION ", ipv6 router advertisement responder for tap interfaces.\n"
               "Copyright 2024 Nicholas J. Kain\n"
               "Released under the MIT license.\n");
}
