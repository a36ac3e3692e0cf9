// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "cfg.hpp"

using namespace std::chrono_literals;

class ParseOptionsTest : public ::testing::Test
{
protected:
    bool parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "tapra6");
        std::vector<char *> av;
        for (auto &i: args) av.push_back(i.data());
        av.push_back(nullptr);
        return parse_options(static_cast<int>(args.size()), av.data(), cfg_, act_, err_);
    }

    tapra6_config cfg_;
    cfg_action act_ = cfg_action::run;
    std::string err_;
};

TEST_F(ParseOptionsTest, Defaults)
{
    ASSERT_TRUE(parse({}));
    EXPECT_EQ(act_, cfg_action::run);
    EXPECT_EQ(cfg_.ifname_regex, "^tap");
    EXPECT_EQ(cfg_.advert_interval_s, 10u);
    EXPECT_EQ(cfg_.threads, 2u);
    EXPECT_FALSE(cfg_.use_syslog);
    EXPECT_FALSE(cfg_.verbose);
}

TEST_F(ParseOptionsTest, ShortOptions)
{
    ASSERT_TRUE(parse({ "-r", "^vnet", "-i", "30", "-t", "4", "-s", "-v" })) << err_;
    EXPECT_EQ(cfg_.ifname_regex, "^vnet");
    EXPECT_EQ(cfg_.advert_interval_s, 30u);
    EXPECT_EQ(cfg_.threads, 4u);
    EXPECT_TRUE(cfg_.use_syslog);
    EXPECT_TRUE(cfg_.verbose);
}

TEST_F(ParseOptionsTest, LongOptions)
{
    ASSERT_TRUE(parse({ "--regex=^tap[0-9]+$", "--interval", "1800", "--threads=1", "--syslog" })) << err_;
    EXPECT_EQ(cfg_.ifname_regex, "^tap[0-9]+$");
    EXPECT_EQ(cfg_.advert_interval_s, 1800u);
    EXPECT_EQ(cfg_.threads, 1u);
    EXPECT_TRUE(cfg_.use_syslog);
}

TEST_F(ParseOptionsTest, InvalidRegex)
{
    EXPECT_FALSE(parse({ "-r", "tap[" }));
    EXPECT_NE(err_.find("regex"), std::string::npos);
    EXPECT_EQ(cfg_.ifname_regex, "^tap");
}

TEST_F(ParseOptionsTest, IntervalOutOfRange)
{
    EXPECT_FALSE(parse({ "-i", "3" }));
    EXPECT_FALSE(parse({ "-i", "1801" }));
    EXPECT_FALSE(parse({ "-i", "ten" }));
    EXPECT_FALSE(parse({ "-i", "10s" }));
    EXPECT_FALSE(parse({ "-i", "-5" }));
    EXPECT_EQ(cfg_.advert_interval_s, 10u);
}

TEST_F(ParseOptionsTest, ThreadsOutOfRange)
{
    EXPECT_FALSE(parse({ "-t", "0" }));
    EXPECT_FALSE(parse({ "-t", "65" }));
}

TEST_F(ParseOptionsTest, MissingArgument)
{
    EXPECT_FALSE(parse({ "-i" }));
    EXPECT_NE(err_.find("requires an argument"), std::string::npos);
}

TEST_F(ParseOptionsTest, UnknownOption)
{
    EXPECT_FALSE(parse({ "-x" }));
    EXPECT_NE(err_.find("-x"), std::string::npos);
    EXPECT_FALSE(parse({ "--bogus" }));
    EXPECT_NE(err_.find("--bogus"), std::string::npos);
}

TEST_F(ParseOptionsTest, StrayArgument)
{
    EXPECT_FALSE(parse({ "tap0" }));
    EXPECT_NE(err_.find("tap0"), std::string::npos);
}

TEST_F(ParseOptionsTest, HelpAndVersion)
{
    ASSERT_TRUE(parse({ "-h" }));
    EXPECT_EQ(act_, cfg_action::help);
    ASSERT_TRUE(parse({ "--version" }));
    EXPECT_EQ(act_, cfg_action::version);
}

TEST(MakeRa6Config, DerivesTimers)
{
    tapra6_config cfg;
    auto rc = make_ra6_config(cfg);
    EXPECT_EQ(rc.advert_interval, 10s);
    EXPECT_EQ(rc.retry_backoff, 1s);
    EXPECT_EQ(rc.router_lifetime, 30);

    cfg.advert_interval_s = 1800;
    rc = make_ra6_config(cfg);
    EXPECT_EQ(rc.advert_interval, 1800s);
    EXPECT_EQ(rc.router_lifetime, 5400);
}
