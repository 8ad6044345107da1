// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace lanwake::util;

TEST_CASE("SafeParsePort", "[util][parsing]") {
    SECTION("Valid ports") {
        REQUIRE(SafeParsePort("1") == uint16_t{1});
        REQUIRE(SafeParsePort("9") == uint16_t{9});
        REQUIRE(SafeParsePort("3000") == uint16_t{3000});
        REQUIRE(SafeParsePort("65535") == uint16_t{65535});
    }

    SECTION("Invalid ports") {
        REQUIRE_FALSE(SafeParsePort(""));
        REQUIRE_FALSE(SafeParsePort("0"));
        REQUIRE_FALSE(SafeParsePort("65536"));
        REQUIRE_FALSE(SafeParsePort("-1"));
        REQUIRE_FALSE(SafeParsePort("+80"));
        REQUIRE_FALSE(SafeParsePort(" 80"));
        REQUIRE_FALSE(SafeParsePort("80 "));
        REQUIRE_FALSE(SafeParsePort("8o"));
        REQUIRE_FALSE(SafeParsePort("99999999999999999999999"));
    }
}

TEST_CASE("SafeParseInt64 and SafeParseUInt32", "[util][parsing]") {
    REQUIRE(SafeParseInt64("5000") == int64_t{5000});
    REQUIRE(SafeParseInt64("-7") == int64_t{-7});
    REQUIRE_FALSE(SafeParseInt64("1.5"));
    REQUIRE_FALSE(SafeParseInt64("9223372036854775808"));

    REQUIRE(SafeParseUInt32("4294967295") == uint32_t{4294967295u});
    REQUIRE_FALSE(SafeParseUInt32("4294967296"));
    REQUIRE_FALSE(SafeParseUInt32("-1"));
}

TEST_CASE("Whitespace and comment helpers", "[util][parsing]") {
    SECTION("TrimWhitespace") {
        REQUIRE(TrimWhitespace("  nas\t\r\n") == "nas");
        REQUIRE(TrimWhitespace("   ").empty());
        REQUIRE(TrimWhitespace("a b") == "a b");
    }

    SECTION("SplitWhitespace") {
        auto tokens = SplitWhitespace("192.168.1.10\tnas   nas.lan\r");
        REQUIRE(tokens.size() == 3);
        REQUIRE(tokens[0] == "192.168.1.10");
        REQUIRE(tokens[1] == "nas");
        REQUIRE(tokens[2] == "nas.lan");
        REQUIRE(SplitWhitespace("").empty());
        REQUIRE(SplitWhitespace(" \t ").empty());
    }

    SECTION("StripComment") {
        REQUIRE(StripComment("10.0.0.1 router # gateway") == "10.0.0.1 router ");
        REQUIRE(StripComment("# whole line").empty());
        REQUIRE(StripComment("no comment") == "no comment");
    }

    SECTION("ToLower") {
        REQUIRE(ToLower("NAS.Example") == "nas.example");
    }
}

TEST_CASE("HexValue", "[util][parsing]") {
    REQUIRE(HexValue('0') == 0);
    REQUIRE(HexValue('9') == 9);
    REQUIRE(HexValue('a') == 10);
    REQUIRE(HexValue('F') == 15);
    REQUIRE(HexValue('g') == -1);
    REQUIRE(HexValue(':') == -1);
    REQUIRE(HexValue(' ') == -1);
    REQUIRE(HexValue('\0') == -1);
}
