// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_CFG_HPP_
#define TAPRA6_CFG_HPP_

#include <string>
#include "radv6.hpp"

#define TAPRA6_VERSION "1.0"

struct tapra6_config
{
    std::string ifname_regex = "^tap";
    unsigned advert_interval_s = 10;
    unsigned threads = 2;
    bool use_syslog = false;
    bool verbose = false;
};

enum class cfg_action { run, help, version };

// Parses the command line into cfg.  On failure err describes the problem
// and nothing has been printed.
[[nodiscard]] bool parse_options(int ac, char *av[], tapra6_config &cfg,
                                 cfg_action &act, std::string &err);

[[nodiscard]] ra6_config make_ra6_config(const tapra6_config &cfg);

void usage();
void print_version();

#endif
