// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include "ra6wire.hpp"

namespace ba = boost::asio;

static inline void toggle_bit(bool v, uint8_t *data, size_t arrayidx, unsigned char bitidx)
{
    if (v) data[arrayidx] |= bitidx;
    else data[arrayidx] &= static_cast<uint8_t>(~bitidx);
}

static inline void encode32be(uint32_t v, uint8_t *d)
{
    d[0] = static_cast<uint8_t>(v >> 24);
    d[1] = static_cast<uint8_t>(v >> 16);
    d[2] = static_cast<uint8_t>(v >> 8);
    d[3] = static_cast<uint8_t>(v);
}

static inline void encode16be(uint16_t v, uint8_t *d)
{
    d[0] = static_cast<uint8_t>(v >> 8);
    d[1] = static_cast<uint8_t>(v);
}

static inline uint32_t decode32be(const uint8_t *s)
{
    return (static_cast<uint32_t>(s[0]) << 24) | (static_cast<uint32_t>(s[1]) << 16)
         | (static_cast<uint32_t>(s[2]) << 8) | static_cast<uint32_t>(s[3]);
}

static inline uint16_t decode16be(const uint8_t *s)
{
    return static_cast<uint16_t>((s[0] << 8) | s[1]);
}

uint16_t icmp_header::checksum() const { return decode16be(data_ + 2); }
void icmp_header::checksum(uint16_t v) { encode16be(v, data_ + 2); }

uint16_t ra6_advert_header::router_lifetime() const { return decode16be(data_ + 2); }
uint32_t ra6_advert_header::reachable_time() const { return decode32be(data_ + 4); }
uint32_t ra6_advert_header::retransmit_timer() const { return decode32be(data_ + 8); }
void ra6_advert_header::managed_addresses(bool v) { toggle_bit(v, data_, 1, 1 << 7); }
void ra6_advert_header::other_stateful(bool v) { toggle_bit(v, data_, 1, 1 << 6); }
void ra6_advert_header::router_lifetime(uint16_t v) { encode16be(v, data_ + 2); }
void ra6_advert_header::reachable_time(uint32_t v) { encode32be(v, data_ + 4); }
void ra6_advert_header::retransmit_timer(uint32_t v) { encode32be(v, data_ + 8); }

ra6_advert_header::RouterPref ra6_advert_header::default_router_preference() const
{
    switch ((data_[1] >> 3) & 0x3) {
    case 1: return RouterPref::High;
    case 3: return RouterPref::Low;
    default: return RouterPref::Medium; // 2 is reserved and treated as medium
    }
}

void ra6_advert_header::default_router_preference(RouterPref v)
{
    switch (v) {
    case RouterPref::High:
        toggle_bit(false, data_, 1, 1 << 4);
        toggle_bit(true, data_, 1, 1 << 3);
        break;
    case RouterPref::Medium:
        toggle_bit(false, data_, 1, 1 << 4);
        toggle_bit(false, data_, 1, 1 << 3);
        break;
    case RouterPref::Low:
        toggle_bit(true, data_, 1, 1 << 4);
        toggle_bit(true, data_, 1, 1 << 3);
        break;
    }
}

std::array<uint8_t, 6> ra6_source_lla_opt::macaddr() const
{
    std::array<uint8_t, 6> ret;
    memcpy(ret.data(), data_ + 2, ret.size());
    return ret;
}

uint32_t ra6_prefix_info_opt::valid_lifetime() const { return decode32be(data_ + 4); }
uint32_t ra6_prefix_info_opt::preferred_lifetime() const { return decode32be(data_ + 8); }
void ra6_prefix_info_opt::on_link(bool v) { toggle_bit(v, data_, 3, 1 << 7); }
void ra6_prefix_info_opt::auto_addr_cfg(bool v) { toggle_bit(v, data_, 3, 1 << 6); }
void ra6_prefix_info_opt::valid_lifetime(uint32_t v) { encode32be(v, data_ + 4); }
void ra6_prefix_info_opt::preferred_lifetime(uint32_t v) { encode32be(v, data_ + 8); }

ba::ip::address_v6 ra6_prefix_info_opt::prefix() const
{
    ba::ip::address_v6::bytes_type b;
    memcpy(b.data(), data_ + 16, b.size());
    return ba::ip::address_v6(b);
}

void ra6_prefix_info_opt::prefix(const ba::ip::address_v6 &v, uint8_t pl)
{
    auto a6 = v.to_bytes();
    if (pl > 128) pl = 128;
    data_[2] = pl;
    uint8_t keep_bytes = pl / 8;
    uint8_t keep_bits = pl % 8;
    if (keep_bits == 0)
        memset(a6.data() + keep_bytes, 0, 16 - keep_bytes);
    else {
        memset(a6.data() + keep_bytes + 1, 0, 16 - keep_bytes - 1);
        uint8_t mask = 0xff;
        while (keep_bits--)
            mask >>= 1;
        a6[keep_bytes] &= static_cast<uint8_t>(~mask);
    }
    memcpy(data_ + 16, a6.data(), a6.size());
}

std::vector<uint8_t> build_router_advert(const ra6_advert_params &p)
{
    icmp_header icmp_hdr;
    ra6_advert_header ra6adv_hdr;

    icmp_hdr.type(icmp6_type_router_advert);
    icmp_hdr.code(0);
    icmp_hdr.checksum(0);

    ra6adv_hdr.hoplimit(ra6_cur_hoplimit);
    ra6adv_hdr.managed_addresses(false);
    ra6adv_hdr.other_stateful(false);
    ra6adv_hdr.default_router_preference(ra6_advert_header::RouterPref::Medium);
    ra6adv_hdr.router_lifetime(p.router_lifetime);
    ra6adv_hdr.reachable_time(0);
    ra6adv_hdr.retransmit_timer(0);

    std::vector<uint8_t> ret;
    ret.reserve(icmp_header::size + ra6_advert_header::size
                + ra6_source_lla_opt::size + ra6_prefix_info_opt::size);
    icmp_hdr.write(ret);
    ra6adv_hdr.write(ret);

    if (p.macaddr) {
        ra6_source_lla_opt ra6_slla;
        ra6_slla.macaddr(*p.macaddr);
        ra6_slla.write(ret);
    }

    if (p.prefix) {
        ra6_prefix_info_opt ra6_pfxi;
        ra6_pfxi.prefix(*p.prefix, 64);
        ra6_pfxi.on_link(true);
        ra6_pfxi.auto_addr_cfg(true);
        ra6_pfxi.valid_lifetime(ra6_prefix_valid_lifetime);
        ra6_pfxi.preferred_lifetime(ra6_prefix_preferred_lifetime);
        ra6_pfxi.write(ret);
    }
    return ret;
}

const char *rs_verdict_str(rs_verdict v)
{
    switch (v) {
    case rs_verdict::ok: return "ok";
    case rs_verdict::too_short: return "ICMP message is too short";
    case rs_verdict::bad_type: return "ICMP type != 133";
    case rs_verdict::bad_code: return "ICMP code != 0";
    case rs_verdict::bad_option_length: return "invalid option length";
    case rs_verdict::duplicate_source_lla: return "more than one Source Link-Layer Address option";
    case rs_verdict::bad_source_lla: return "Source Link-Layer Address is wrong size for ethernet";
    case rs_verdict::unspecified_with_source_lla:
        return "unspecified source address with Source Link-Layer Address option";
    }
    return "unknown";
}

rs_verdict check_router_solicit(const uint8_t *buf, size_t buflen, bool sender_unspecified)
{
    // Discard if the ICMP length < 8 octets.
    if (buflen < icmp_header::size + ra6_solicit_header::size)
        return rs_verdict::too_short;

    sbufs rs{ buf, buf + buflen };
    icmp_header icmp_hdr;
    if (!icmp_hdr.read(rs)) return rs_verdict::too_short;
    if (icmp_hdr.type() != icmp6_type_router_solicit) return rs_verdict::bad_type;
    if (icmp_hdr.code() != 0) return rs_verdict::bad_code;

    ra6_solicit_header ra6_solicit_hdr;
    if (!ra6_solicit_hdr.read(rs)) return rs_verdict::too_short;

    bool got_macaddr(false);
    while (rs.brem() > 0) {
        if (rs.brem() < 2) return rs_verdict::bad_option_length;
        auto opt_type = rs.si[0];
        size_t opt_length = 8 * static_cast<size_t>(rs.si[1]);
        if (opt_length == 0 || opt_length > rs.brem())
            return rs_verdict::bad_option_length;
        if (opt_type == nd_opt_source_lla) {
            if (got_macaddr) return rs_verdict::duplicate_source_lla;
            if (opt_length != ra6_source_lla_opt::size) return rs_verdict::bad_source_lla;
            got_macaddr = true;
        }
        // Other option types are skipped.
        rs.si += opt_length;
    }

    if (got_macaddr && sender_unspecified)
        return rs_verdict::unspecified_with_source_lla;
    return rs_verdict::ok;
}
