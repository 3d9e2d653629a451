/*
 * File: include/lanwake/mac_codec.hpp
 * Project: LanWake
 * Purpose: MAC address parsing and magic packet construction
 * Notes:
 *  - See DESIGN.md
 *  - Control thread owns FleetStatus / WakeSession; I/O completions are posted back
 *  - Magic packet is fire-and-forget; no delivery confirmation exists
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace lanwake
{

using MacBytes = std::array<std::uint8_t, 6>;

// 6 x 0xFF synchronization header followed by the MAC repeated 16 times
constexpr std::size_t kMagicHeaderLen = 6;
constexpr std::size_t kMagicRepeats = 16;
constexpr std::size_t kMagicPacketLen = kMagicHeaderLen + kMagicRepeats * 6;

using MagicPacket = std::array<std::uint8_t, kMagicPacketLen>;

enum class MacError
{
    None,
    WrongLength,
    InvalidCharacter
};

struct MacParseResult
{
    MacBytes bytes{};
    MacError error = MacError::None;
    std::string reason;

    bool ok() const { return error == MacError::None; }
    explicit operator bool() const { return ok(); }
};

class InvalidMacFormat : public std::runtime_error
{
public:
    InvalidMacFormat(MacError kind, const std::string &what)
        : std::runtime_error(what), kind_(kind) {}
    MacError kind() const { return kind_; }

private:
    MacError kind_;
};

// Strips ':' '-' '.' and ' ' separators and lower-cases the rest.
inline std::string normalize_mac(const std::string &input)
{
    std::string out;
    out.reserve(input.size());
    for (char c : input)
    {
        if (c == ':' || c == '-' || c == '.' || c == ' ')
            continue;
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
        out.push_back(c);
    }
    return out;
}

inline int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

inline MacParseResult parse_mac(const std::string &input)
{
    MacParseResult r;
    const std::string cleaned = normalize_mac(input);
    if (cleaned.size() != 12)
    {
        r.error = MacError::WrongLength;
        r.reason = "MAC address must be 12 hex characters, got " + std::to_string(cleaned.size());
        return r;
    }
    for (std::size_t i = 0; i < 6; ++i)
    {
        const int hi = hex_value(cleaned[2 * i]);
        const int lo = hex_value(cleaned[2 * i + 1]);
        if (hi < 0 || lo < 0)
        {
            r.error = MacError::InvalidCharacter;
            r.reason = "MAC address contains invalid characters: \"" + cleaned.substr(2 * i, 2) + "\"";
            return r;
        }
        r.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return r;
}

inline MacBytes parse_mac_or_throw(const std::string &input)
{
    auto r = parse_mac(input);
    if (!r)
        throw InvalidMacFormat(r.error, r.reason);
    return r.bytes;
}

inline MagicPacket build_magic_packet(const MacBytes &mac)
{
    MagicPacket packet{};
    std::size_t pos = 0;
    for (; pos < kMagicHeaderLen; ++pos)
        packet[pos] = 0xFF;
    for (std::size_t rep = 0; rep < kMagicRepeats; ++rep)
        for (std::uint8_t b : mac)
            packet[pos++] = b;
    return packet;
}

// aa:bb:cc:dd:ee:ff
inline std::string format_mac(const MacBytes &mac)
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buf;
}

} // namespace lanwake
