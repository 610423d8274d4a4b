// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/time.hpp"

#include <chrono>

using namespace netdash::util;

TEST_CASE("Mock time", "[time]") {
    SECTION("GetTime follows the mock value") {
        MockTimeScope mock(1700000000);
        REQUIRE(GetTime() == 1700000000);
        REQUIRE(GetTimeMillis() == 1700000000000);
        SetMockTime(1700000042);
        REQUIRE(GetTime() == 1700000042);
    }

    SECTION("Scope restores the previous value") {
        {
            MockTimeScope outer(1000);
            {
                MockTimeScope inner(2000);
                REQUIRE(GetTime() == 2000);
            }
            REQUIRE(GetTime() == 1000);
        }
        REQUIRE(GetMockTime() == 0);
        REQUIRE(GetTime() > 1600000000);
    }

    SECTION("Steady time advances with the mock clock") {
        MockTimeScope mock(1700000000);
        const auto t0 = GetSteadyTime();
        SetMockTime(1700000060);
        const auto t1 = GetSteadyTime();
        REQUIRE(std::chrono::duration_cast<std::chrono::seconds>(t1 - t0).count() == 60);
    }
}

TEST_CASE("FormatTime", "[time]") {
    REQUIRE(FormatTime(0) == "1970-01-01 00:00:00 UTC");
    REQUIRE(FormatTime(1700000000) == "2023-11-14 22:13:20 UTC");
}
