// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/time.hpp"

using namespace lanwake::util;

TEST_CASE("Time: Mock time", "[util][time]") {
    SECTION("MockTimeScope overrides and restores") {
        const int64_t before = GetMockTime();
        {
            MockTimeScope scope(1700000000);
            REQUIRE(GetTime() == 1700000000);
            {
                MockTimeScope inner(1700000500);
                REQUIRE(GetTime() == 1700000500);
            }
            REQUIRE(GetTime() == 1700000000);
        }
        REQUIRE(GetMockTime() == before);
    }

    SECTION("Real clock when mock time is disabled") {
        MockTimeScope scope(0);
        // Any date after 2024-01-01 is plausible
        REQUIRE(GetTime() > 1704067200);
    }
}

TEST_CASE("Time: FormatTime", "[util][time]") {
    REQUIRE(FormatTime(0) == "1970-01-01T00:00:00Z");
    REQUIRE(FormatTime(1700000000) == "2023-11-14T22:13:20Z");
    REQUIRE(FormatTime(951782400) == "2000-02-29T00:00:00Z");
}

TEST_CASE("Time: FormatAge", "[util][time]") {
    REQUIRE(FormatAge(0) == "0 s");
    REQUIRE(FormatAge(59) == "59 s");
    REQUIRE(FormatAge(60) == "1 m");
    REQUIRE(FormatAge(3599) == "59 m");
    REQUIRE(FormatAge(3600) == "1 h");
    REQUIRE(FormatAge(86399) == "23 h");
    REQUIRE(FormatAge(86400 * 3) == "3 d");

    SECTION("Clock skew never shows a negative age") {
        REQUIRE(FormatAge(-5) == "0 s");
    }
}
