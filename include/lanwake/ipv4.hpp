/*
 * File: include/lanwake/ipv4.hpp
 * Project: LanWake
 * Purpose: Dotted-quad helpers: broadcast / network derivation and validation
 * Notes:
 *  - See DESIGN.md
 *  - broadcast == (ip AND mask) OR (NOT mask), bytewise
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace lanwake
{

using Ipv4Octets = std::array<std::uint8_t, 4>;

// Strict dotted quad: four decimal fields 0..255, no sign, no empty field.
inline std::optional<Ipv4Octets> parse_ipv4(const std::string &s)
{
    Ipv4Octets out{};
    std::size_t field = 0;
    int value = -1;
    int digits = 0;
    for (char c : s)
    {
        if (c >= '0' && c <= '9')
        {
            if (++digits > 3)
                return std::nullopt;
            value = (value < 0 ? 0 : value * 10) + (c - '0');
        }
        else if (c == '.')
        {
            if (value < 0 || value > 255 || field >= 3)
                return std::nullopt;
            out[field++] = static_cast<std::uint8_t>(value);
            value = -1;
            digits = 0;
        }
        else
        {
            return std::nullopt;
        }
    }
    if (field != 3 || value < 0 || value > 255)
        return std::nullopt;
    out[3] = static_cast<std::uint8_t>(value);
    return out;
}

inline std::string format_ipv4(const Ipv4Octets &o)
{
    return std::to_string(o[0]) + "." + std::to_string(o[1]) + "." +
           std::to_string(o[2]) + "." + std::to_string(o[3]);
}

inline bool is_valid_ipv4(const std::string &s) { return parse_ipv4(s).has_value(); }

// Ones followed only by zeros
inline bool is_valid_subnet_mask(const std::string &s)
{
    auto m = parse_ipv4(s);
    if (!m)
        return false;
    std::uint32_t bits = (std::uint32_t((*m)[0]) << 24) | (std::uint32_t((*m)[1]) << 16) |
                         (std::uint32_t((*m)[2]) << 8) | std::uint32_t((*m)[3]);
    std::uint32_t inverted = ~bits;
    return (inverted & (inverted + 1)) == 0;
}

inline std::optional<std::string> calculate_broadcast(const std::string &ip, const std::string &mask)
{
    auto a = parse_ipv4(ip);
    auto m = parse_ipv4(mask);
    if (!a || !m)
        return std::nullopt;
    Ipv4Octets b{};
    for (std::size_t i = 0; i < 4; ++i)
        b[i] = static_cast<std::uint8_t>(((*a)[i] & (*m)[i]) | (~(*m)[i] & 0xFF));
    return format_ipv4(b);
}

inline std::optional<std::string> calculate_network(const std::string &ip, const std::string &mask)
{
    auto a = parse_ipv4(ip);
    auto m = parse_ipv4(mask);
    if (!a || !m)
        return std::nullopt;
    Ipv4Octets n{};
    for (std::size_t i = 0; i < 4; ++i)
        n[i] = static_cast<std::uint8_t>((*a)[i] & (*m)[i]);
    return format_ipv4(n);
}

inline bool is_valid_broadcast(const std::string &ip, const std::string &mask, const std::string &broadcast)
{
    if (!is_valid_ipv4(ip) || !is_valid_subnet_mask(mask) || !is_valid_ipv4(broadcast))
        return false;
    auto expected = calculate_broadcast(ip, mask);
    // compare canonical forms so "192.168.001.255" is not a false mismatch
    return expected && *expected == format_ipv4(*parse_ipv4(broadcast));
}

struct NetworkSettings
{
    std::string mask;
    std::string broadcast;
};

// Private-range defaults: 10/8, 172.16-31/16, 192.168/24, anything else /24.
inline std::optional<NetworkSettings> auto_network_settings(const std::string &ip)
{
    auto a = parse_ipv4(ip);
    if (!a)
        return std::nullopt;
    std::string mask = "255.255.255.0";
    if ((*a)[0] == 10)
        mask = "255.0.0.0";
    else if ((*a)[0] == 172 && (*a)[1] >= 16 && (*a)[1] <= 31)
        mask = "255.255.0.0";
    auto b = calculate_broadcast(ip, mask);
    if (!b)
        return std::nullopt;
    return NetworkSettings{mask, *b};
}

} // namespace lanwake
