/*
 * File: tests/test_mac_codec.cpp
 * Project: LanWake
 * Purpose: MAC parsing and magic packet layout
 * Notes:
 *  - See DESIGN.md
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "lanwake/mac_codec.hpp"

using namespace lanwake;

TEST_CASE("mac parsing ignores separator style and case")
{
    const MacBytes expected{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    auto input = GENERATE(as<std::string>{},
                          "AA:BB:CC:DD:EE:FF",
                          "aa-bb-cc-dd-ee-ff",
                          "aabbccddeeff",
                          "aabb.ccdd.eeff",
                          "AA BB CC DD EE FF",
                          "Aa:bB-cc.DD ee:Ff");
    auto r = parse_mac(input);
    REQUIRE(r.ok());
    REQUIRE(r.bytes == expected);
}

TEST_CASE("mac parsing reports wrong length and bad characters separately")
{
    auto shorty = parse_mac("12:34:56");
    REQUIRE_FALSE(shorty.ok());
    REQUIRE(shorty.error == MacError::WrongLength);
    REQUIRE_THAT(shorty.reason, Catch::Matchers::ContainsSubstring("got 6"));

    auto nonhex = parse_mac("gg:hh:ii:jj:kk:ll");
    REQUIRE_FALSE(nonhex.ok());
    REQUIRE(nonhex.error == MacError::InvalidCharacter);

    REQUIRE(parse_mac("").error == MacError::WrongLength);
    REQUIRE(parse_mac("aa:bb:cc:dd:ee:ff:00").error == MacError::WrongLength);
    REQUIRE(parse_mac("aa:bb:cc:dd:ee:f+").error == MacError::InvalidCharacter);
}

TEST_CASE("parse_mac_or_throw raises InvalidMacFormat")
{
    REQUIRE_THROWS_AS(parse_mac_or_throw("12:34:56"), InvalidMacFormat);
    try
    {
        parse_mac_or_throw("zz:zz:zz:zz:zz:zz");
        FAIL("expected throw");
    }
    catch (const InvalidMacFormat &e)
    {
        REQUIRE(e.kind() == MacError::InvalidCharacter);
    }
    REQUIRE(parse_mac_or_throw("01:23:45:67:89:ab")[5] == 0xAB);
}

TEST_CASE("magic packet is 6 x 0xFF then the mac 16 times")
{
    const MacBytes mac{0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    auto packet = build_magic_packet(mac);
    REQUIRE(packet.size() == 102);
    for (std::size_t i = 0; i < 6; ++i)
        REQUIRE(packet[i] == 0xFF);
    for (std::size_t rep = 0; rep < 16; ++rep)
        for (std::size_t b = 0; b < 6; ++b)
            REQUIRE(packet[6 + rep * 6 + b] == mac[b]);
}

TEST_CASE("format_mac prints canonical lower-case colon form")
{
    REQUIRE(format_mac(parse_mac("AABB.CCDD.EEFF").bytes) == "aa:bb:cc:dd:ee:ff");
}
