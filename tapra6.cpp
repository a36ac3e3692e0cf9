// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <regex>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <boost/asio.hpp>
#include <fmt/format.h>
#include "cfg.hpp"
#include "engine.hpp"
#include "ndpconn.hpp"
#include "nlmonitor.hpp"
#include "nlsocket.hpp"
#include "tap.hpp"
#include "log.hpp"

namespace ba = boost::asio;

int main(int ac, char *av[])
{
    tapra6_config cfg;
    cfg_action act;
    std::string err;
    if (!parse_options(ac, av, cfg, act, err)) {
        fmt::print(stderr, "tapra6: {}\n", err);
        usage();
        return EXIT_FAILURE;
    }
    switch (act) {
    case cfg_action::help: usage(); return EXIT_SUCCESS;
    case cfg_action::version: print_version(); return EXIT_SUCCESS;
    case cfg_action::run: break;
    }

    log_use_syslog(cfg.use_syslog);
    if (cfg.verbose) log_set_level(log_level::debug);
    signal(SIGPIPE, SIG_IGN);

    ba::io_context io;
    NLQuery nl_query(io);
    LinkLocalDialer dialer;
    const auto racfg = make_ra6_config(cfg);

    Engine engine([&](int ifindex, boost::system::error_code &ec) {
        return Tap::create(io, ifindex, nl_query, dialer, racfg, ec);
    });
    LinkMonitor monitor(io, engine, std::regex(cfg.ifname_regex));
    if (!monitor.start())
        suicide("tapra6: unable to watch for interfaces");

    ba::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&monitor](const boost::system::error_code &ec, int signo) {
        if (ec) return;
        log_line("tapra6: received signal {}, closing all taps", signo);
        monitor.shutdown();
    });

    log_line("tapra6 " TAPRA6_VERSION " managing interfaces matching '{}'", cfg.ifname_regex);

    std::vector<std::thread> workers;
    workers.reserve(cfg.threads - 1);
    for (unsigned i = 1; i < cfg.threads; ++i)
        workers.emplace_back([&io] { io.run(); });
    io.run();
    for (auto &i: workers) i.join();

    log_line("tapra6: all taps closed, exiting");
    return EXIT_SUCCESS;
}
