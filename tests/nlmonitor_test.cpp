// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <chrono>
#include <regex>
#include <vector>
#include <gtest/gtest.h>
#include "nlmonitor.hpp"
#include "test_util.hpp"

namespace ba = boost::asio;
using namespace std::chrono_literals;
using tapra6_test::FakeDialer;
using tapra6_test::FakeNetQuery;
using tapra6_test::link_msg;

class LinkMonitorTest : public ::testing::Test
{
protected:
    LinkMonitorTest()
        : engine_([this](int ifindex, boost::system::error_code &ec) {
              return Tap::create(io_, ifindex, nq_, dialer_, cfg_, ec);
          }),
          monitor_(io_, engine_, std::regex("^tap"))
    {
        cfg_.advert_interval = 30s;
        cfg_.retry_backoff = 5ms;
        for (int i: { 5, 6 }) {
            nq_.add_link(i, "tap" + std::to_string(i));
            nq_.add_route(i == 5 ? "2001:db8:1:1::5" : "2001:db8:1:1::6", 128, i);
        }
        nq_.add_link(2, "eth0");
        nq_.add_route("::", 0, 2);
        nq_.add_link(8, "mytap0");
        nq_.add_route("::", 0, 8);
    }
    ~LinkMonitorTest() override
    {
        engine_.close_all();
        io_.restart();
        io_.run_for(1s);
    }

    void deliver(const tapra6_test::NlMsgBuilder &b)
    {
        monitor_.process_receive(b.bytes().data(), b.msg()->nlmsg_len);
    }

    ba::io_context io_;
    FakeNetQuery nq_;
    FakeDialer dialer_;
    ra6_config cfg_;
    Engine engine_;
    LinkMonitor monitor_;
};

TEST_F(LinkMonitorTest, MatchingNewLinkIsAdded)
{
    deliver(link_msg(RTM_NEWLINK, 5, "tap5"));
    EXPECT_TRUE(engine_.check(5));
    EXPECT_EQ(engine_.size(), 1u);
}

TEST_F(LinkMonitorTest, NonMatchingLinkIsIgnored)
{
    deliver(link_msg(RTM_NEWLINK, 2, "eth0"));
    EXPECT_FALSE(engine_.check(2));
    // Anchored expression; the name only contains "tap".
    deliver(link_msg(RTM_NEWLINK, 8, "mytap0"));
    EXPECT_FALSE(engine_.check(8));
    EXPECT_EQ(engine_.size(), 0u);
}

TEST_F(LinkMonitorTest, RepeatedNewLinkKeepsExistingTap)
{
    deliver(link_msg(RTM_NEWLINK, 5, "tap5"));
    auto t = engine_.get(5);
    ASSERT_TRUE(t);
    deliver(link_msg(RTM_NEWLINK, 5, "tap5"));
    EXPECT_EQ(engine_.get(5), t);
}

TEST_F(LinkMonitorTest, DelLinkCloses)
{
    deliver(link_msg(RTM_NEWLINK, 5, "tap5"));
    auto t = engine_.get(5);
    ASSERT_TRUE(t);
    io_.run_for(20ms);
    deliver(link_msg(RTM_DELLINK, 5, "tap5"));
    EXPECT_FALSE(engine_.check(5));
    io_.run_for(50ms);
    EXPECT_EQ(t->state(), RA6Listener::State::Closed);
}

TEST_F(LinkMonitorTest, DelLinkForUnknownIsHarmless)
{
    deliver(link_msg(RTM_DELLINK, 6, "tap6"));
    EXPECT_EQ(engine_.size(), 0u);
}

TEST_F(LinkMonitorTest, IneligibleLinkIsNotAdded)
{
    nq_.add_link(9, "tap9");
    deliver(link_msg(RTM_NEWLINK, 9, "tap9"));
    EXPECT_FALSE(engine_.check(9));
}

TEST_F(LinkMonitorTest, SeveralMessagesInOneDatagram)
{
    std::vector<char> buf;
    for (const auto &b: { link_msg(RTM_NEWLINK, 5, "tap5"),
                          link_msg(RTM_NEWLINK, 2, "eth0"),
                          link_msg(RTM_NEWLINK, 6, "tap6") }) {
        const auto &bytes = b.bytes();
        buf.insert(buf.end(), bytes.begin(), bytes.begin() + NLMSG_ALIGN(b.msg()->nlmsg_len));
    }
    monitor_.process_receive(buf.data(), buf.size());
    EXPECT_TRUE(engine_.check(5));
    EXPECT_TRUE(engine_.check(6));
    EXPECT_FALSE(engine_.check(2));
}

TEST_F(LinkMonitorTest, ShutdownClosesEverything)
{
    deliver(link_msg(RTM_NEWLINK, 5, "tap5"));
    deliver(link_msg(RTM_NEWLINK, 6, "tap6"));
    auto t5 = engine_.get(5);
    auto t6 = engine_.get(6);
    io_.run_for(20ms);
    monitor_.shutdown();
    io_.run_for(50ms);
    EXPECT_EQ(engine_.size(), 0u);
    EXPECT_EQ(t5->state(), RA6Listener::State::Closed);
    EXPECT_EQ(t6->state(), RA6Listener::State::Closed);
}
