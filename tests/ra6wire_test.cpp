// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <vector>
#include <gtest/gtest.h>
#include "ra6wire.hpp"
#include "test_util.hpp"

namespace ba = boost::asio;
using tapra6_test::decode_advert;
using tapra6_test::router_solicit;
using tapra6_test::test_mac;

TEST(BuildRouterAdvert, PrefixAndSourceLla)
{
    ra6_advert_params p;
    p.macaddr = test_mac;
    p.prefix = ba::ip::make_address_v6("2001:db8:1:1::");
    p.router_lifetime = 1800;
    auto v = build_router_advert(p);
    ASSERT_EQ(v.size(), icmp_header::size + ra6_advert_header::size
                        + ra6_source_lla_opt::size + ra6_prefix_info_opt::size);

    auto d = decode_advert(v);
    ASSERT_TRUE(d.ok);
    EXPECT_EQ(d.icmp.type(), icmp6_type_router_advert);
    EXPECT_EQ(d.icmp.code(), 0);
    EXPECT_EQ(d.icmp.checksum(), 0);

    EXPECT_EQ(d.hdr.hoplimit(), ra6_cur_hoplimit);
    EXPECT_FALSE(d.hdr.managed_addresses());
    EXPECT_FALSE(d.hdr.other_stateful());
    EXPECT_EQ(d.hdr.default_router_preference(), ra6_advert_header::RouterPref::Medium);
    EXPECT_EQ(d.hdr.router_lifetime(), 1800);
    EXPECT_EQ(d.hdr.reachable_time(), 0u);
    EXPECT_EQ(d.hdr.retransmit_timer(), 0u);

    ASSERT_EQ(d.source_llas.size(), 1u);
    EXPECT_EQ(d.source_llas[0].length(), 8);
    EXPECT_EQ(d.source_llas[0].macaddr(), test_mac);

    ASSERT_EQ(d.prefixes.size(), 1u);
    const auto &pi = d.prefixes[0];
    EXPECT_EQ(pi.length(), 32);
    EXPECT_EQ(pi.prefix_length(), 64);
    EXPECT_TRUE(pi.on_link());
    EXPECT_TRUE(pi.auto_addr_cfg());
    EXPECT_EQ(pi.valid_lifetime(), ra6_prefix_valid_lifetime);
    EXPECT_EQ(pi.preferred_lifetime(), ra6_prefix_preferred_lifetime);
    EXPECT_EQ(pi.prefix(), ba::ip::make_address_v6("2001:db8:1:1::"));
}

TEST(BuildRouterAdvert, OptionOrderIsSourceLlaThenPrefix)
{
    ra6_advert_params p;
    p.macaddr = test_mac;
    p.prefix = ba::ip::make_address_v6("2001:db8:1:1::");
    auto v = build_router_advert(p);
    const auto opts = icmp_header::size + ra6_advert_header::size;
    ASSERT_GT(v.size(), opts + ra6_source_lla_opt::size);
    EXPECT_EQ(v[opts], nd_opt_source_lla);
    EXPECT_EQ(v[opts + 1], 1);
    EXPECT_EQ(v[opts + ra6_source_lla_opt::size], nd_opt_prefix_info);
    EXPECT_EQ(v[opts + ra6_source_lla_opt::size + 1], 4);
}

TEST(BuildRouterAdvert, NoPrefix)
{
    ra6_advert_params p;
    p.macaddr = test_mac;
    auto v = build_router_advert(p);
    EXPECT_EQ(v.size(), icmp_header::size + ra6_advert_header::size + ra6_source_lla_opt::size);

    auto d = decode_advert(v);
    ASSERT_TRUE(d.ok);
    EXPECT_TRUE(d.prefixes.empty());
    ASSERT_EQ(d.source_llas.size(), 1u);
    EXPECT_EQ(d.source_llas[0].macaddr(), test_mac);
}

TEST(BuildRouterAdvert, NoMacaddr)
{
    ra6_advert_params p;
    p.prefix = ba::ip::make_address_v6("2001:db8:1:1::");
    auto d = decode_advert(build_router_advert(p));
    ASSERT_TRUE(d.ok);
    EXPECT_TRUE(d.source_llas.empty());
    EXPECT_EQ(d.prefixes.size(), 1u);
}

TEST(PrefixInfoOpt, HostBitsAreCleared)
{
    ra6_prefix_info_opt o;
    o.prefix(ba::ip::make_address_v6("2001:db8:1:1:dead:beef:1:5"), 64);
    EXPECT_EQ(o.prefix(), ba::ip::make_address_v6("2001:db8:1:1::"));
    EXPECT_EQ(o.prefix_length(), 64);

    o.prefix(ba::ip::make_address_v6("2001:db8:1:1ff::"), 60);
    EXPECT_EQ(o.prefix(), ba::ip::make_address_v6("2001:db8:1:1f0::"));
}

TEST(AdvertHeader, RouterPreferenceBits)
{
    ra6_advert_header h;
    h.default_router_preference(ra6_advert_header::RouterPref::High);
    EXPECT_EQ(h.default_router_preference(), ra6_advert_header::RouterPref::High);
    h.default_router_preference(ra6_advert_header::RouterPref::Low);
    EXPECT_EQ(h.default_router_preference(), ra6_advert_header::RouterPref::Low);
    h.default_router_preference(ra6_advert_header::RouterPref::Medium);
    EXPECT_EQ(h.default_router_preference(), ra6_advert_header::RouterPref::Medium);
}

static rs_verdict check(const std::vector<uint8_t> &v, bool unspecified = false)
{
    return check_router_solicit(v.data(), v.size(), unspecified);
}

TEST(CheckRouterSolicit, Valid)
{
    EXPECT_EQ(check(router_solicit()), rs_verdict::ok);
    EXPECT_EQ(check(router_solicit(false)), rs_verdict::ok);
    EXPECT_EQ(check(router_solicit(false), true), rs_verdict::ok);
}

TEST(CheckRouterSolicit, TooShort)
{
    std::vector<uint8_t> v = { icmp6_type_router_solicit, 0, 0, 0, 0, 0, 0 };
    EXPECT_EQ(check(v), rs_verdict::too_short);
    EXPECT_EQ(check({}), rs_verdict::too_short);
}

TEST(CheckRouterSolicit, WrongType)
{
    auto v = router_solicit();
    v[0] = 135;
    EXPECT_EQ(check(v), rs_verdict::bad_type);
    // Type is checked before code.
    v[1] = 1;
    EXPECT_EQ(check(v), rs_verdict::bad_type);
}

TEST(CheckRouterSolicit, NonzeroCode)
{
    auto v = router_solicit();
    v[1] = 1;
    EXPECT_EQ(check(v), rs_verdict::bad_code);
}

TEST(CheckRouterSolicit, ZeroLengthOption)
{
    auto v = router_solicit();
    v[9] = 0;
    EXPECT_EQ(check(v), rs_verdict::bad_option_length);
}

TEST(CheckRouterSolicit, OptionPastEnd)
{
    auto v = router_solicit();
    v[9] = 2;
    EXPECT_EQ(check(v), rs_verdict::bad_option_length);

    auto t = router_solicit(false);
    t.push_back(nd_opt_source_lla);
    EXPECT_EQ(check(t), rs_verdict::bad_option_length);
}

TEST(CheckRouterSolicit, DuplicateSourceLla)
{
    auto v = router_solicit();
    v.insert(v.end(), { nd_opt_source_lla, 1, 0x52, 0x54, 0x00, 0x12, 0x34, 0x57 });
    EXPECT_EQ(check(v), rs_verdict::duplicate_source_lla);
}

TEST(CheckRouterSolicit, SourceLlaWrongSize)
{
    std::vector<uint8_t> v = { icmp6_type_router_solicit, 0, 0, 0, 0, 0, 0, 0,
                               nd_opt_source_lla, 2, 0, 0, 0, 0, 0, 0,
                               0, 0, 0, 0, 0, 0, 0, 0 };
    EXPECT_EQ(check(v), rs_verdict::bad_source_lla);
}

TEST(CheckRouterSolicit, UnspecifiedSenderWithSourceLla)
{
    EXPECT_EQ(check(router_solicit(), true), rs_verdict::unspecified_with_source_lla);
}

TEST(CheckRouterSolicit, UnknownOptionsAreSkipped)
{
    auto v = router_solicit();
    // A nonce option followed by an unassigned type.
    v.insert(v.end(), { 14, 1, 1, 2, 3, 4, 5, 6 });
    v.insert(v.end(), { 200, 1, 0, 0, 0, 0, 0, 0 });
    EXPECT_EQ(check(v), rs_verdict::ok);
}

TEST(RsVerdictStr, Describes)
{
    EXPECT_STREQ(rs_verdict_str(rs_verdict::ok), "ok");
    EXPECT_STRNE(rs_verdict_str(rs_verdict::bad_type), "unknown");
}
