// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef TAPRA6_RA6WIRE_HPP_
#define TAPRA6_RA6WIRE_HPP_

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>
#include <boost/asio.hpp>
#include "sbufs.h"

enum : uint8_t {
    icmp6_type_router_solicit = 133,
    icmp6_type_router_advert = 134,
    nd_opt_source_lla = 1,
    nd_opt_prefix_info = 3,
};

#define DEF_RW_MEMBERS() \
    bool read(sbufs &rbuf) \
    { \
        if (rbuf.brem() < size) return false; \
        memcpy(&data_, rbuf.si, sizeof data_); \
        rbuf.si += size; \
        return true; \
    } \
    void write(std::vector<uint8_t> &sbuf) const \
    { \
        sbuf.insert(sbuf.end(), data_, data_ + size); \
    }

class icmp_header
{
public:
    uint8_t type() const { return data_[0]; }
    uint8_t code() const { return data_[1]; }
    uint16_t checksum() const;
    void type(uint8_t v) { data_[0] = v; }
    void code(uint8_t v) { data_[1] = v; }
    void checksum(uint16_t v);
    static constexpr size_t size = 4;
    DEF_RW_MEMBERS()
private:
    uint8_t data_[4] = {};
};

class ra6_solicit_header
{
public:
    // Just a reserved 32-bit field, followed by options.
    static constexpr size_t size = 4;
    DEF_RW_MEMBERS()
private:
    uint8_t data_[4] = {};
};

class ra6_advert_header
{
public:
    uint8_t hoplimit() const { return data_[0]; }
    bool managed_addresses() const { return data_[1] & (1 << 7); }
    bool other_stateful() const { return data_[1] & (1 << 6); }
    uint16_t router_lifetime() const;
    uint32_t reachable_time() const;
    uint32_t retransmit_timer() const;
    void hoplimit(uint8_t v) { data_[0] = v; }
    void managed_addresses(bool v);
    void other_stateful(bool v);
    enum class RouterPref { High, Medium, Low };
    RouterPref default_router_preference() const;
    void default_router_preference(RouterPref v);
    void router_lifetime(uint16_t v);
    void reachable_time(uint32_t v);
    void retransmit_timer(uint32_t v);
    static constexpr size_t size = 12;
    DEF_RW_MEMBERS()
private:
    uint8_t data_[12] = {};
};

class ra6_source_lla_opt
{
public:
    uint8_t type() const { return data_[0]; }
    uint8_t length() const { return data_[1] * 8; }
    std::array<uint8_t, 6> macaddr() const;
    void macaddr(const std::array<uint8_t, 6> &mac) { memcpy(data_ + 2, mac.data(), mac.size()); }
    static constexpr size_t size = 8;
    DEF_RW_MEMBERS()
private:
    uint8_t data_[8] = { nd_opt_source_lla, 1 };
};

class ra6_prefix_info_opt
{
public:
    uint8_t type() const { return data_[0]; }
    uint8_t length() const { return data_[1] * 8; }
    uint8_t prefix_length() const { return data_[2]; }
    bool on_link() const { return data_[3] & (1 << 7); }
    bool auto_addr_cfg() const { return data_[3] & (1 << 6); }
    uint32_t valid_lifetime() const;
    uint32_t preferred_lifetime() const;
    boost::asio::ip::address_v6 prefix() const;
    void on_link(bool v);
    void auto_addr_cfg(bool v);
    void valid_lifetime(uint32_t v);
    void preferred_lifetime(uint32_t v);
    // Bits past pl are cleared.
    void prefix(const boost::asio::ip::address_v6 &v, uint8_t pl);
    static constexpr size_t size = 32;
    DEF_RW_MEMBERS()
private:
    uint8_t data_[32] = { nd_opt_prefix_info, 4 };
};
#undef DEF_RW_MEMBERS

// Lifetimes recommended by RFC 4861 for advertised prefixes.
constexpr uint32_t ra6_prefix_valid_lifetime = 2592000;    // 30d
constexpr uint32_t ra6_prefix_preferred_lifetime = 604800; // 7d
constexpr uint8_t ra6_cur_hoplimit = 64;

struct ra6_advert_params
{
    std::optional<std::array<uint8_t, 6>> macaddr;
    std::optional<boost::asio::ip::address_v6> prefix;
    uint16_t router_lifetime = 1800;
};

// ICMPv6 Router Advertisement, checksum left zero for the kernel to fill.
[[nodiscard]] std::vector<uint8_t> build_router_advert(const ra6_advert_params &p);

enum class rs_verdict
{
    ok,
    too_short,
    bad_type,
    bad_code,
    bad_option_length,
    duplicate_source_lla,
    bad_source_lla,
    unspecified_with_source_lla,
};

const char *rs_verdict_str(rs_verdict v);

// RFC 4861 6.1.1 validity checks for a received solicitation.
[[nodiscard]] rs_verdict check_router_solicit(const uint8_t *buf, size_t buflen,
                                              bool sender_unspecified);

#endif
