// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

#include <cstdlib>

using namespace netdash::util;

TEST_CASE("SafeParseInt", "[string_parsing]") {
    REQUIRE(SafeParseInt("42", 0, 100) == 42);
    REQUIRE(SafeParseInt("-5", -10, 10) == -5);
    REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("42abc", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
}

TEST_CASE("SafeParsePort", "[string_parsing]") {
    REQUIRE(SafeParsePort("9100") == 9100);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
}

TEST_CASE("Text helpers", "[string_parsing]") {
    REQUIRE(Trim("  eth0 \t") == "eth0");
    REQUIRE(ToLower("REACHABLE") == "reachable");

    auto words = SplitWhitespace("192.168.1.1  dev eth0\tlladdr aa:bb");
    REQUIRE(words.size() == 5);
    REQUIRE(words[2] == "eth0");

    auto lines = SplitLines("a\r\nb\nc");
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == "a");
    REQUIRE(lines[1] == "b");

    REQUIRE(StartsWithAny("utun3", {"tun", "utun"}));
    REQUIRE_FALSE(StartsWithAny("eth0", {"tun", "utun"}));
}

TEST_CASE("Environment helpers", "[string_parsing]") {
    SECTION("EnvFlag truthy spellings") {
        setenv("NETDASH_TEST_FLAG", "Yes", 1);
        REQUIRE(EnvFlag("NETDASH_TEST_FLAG"));
        setenv("NETDASH_TEST_FLAG", "ON", 1);
        REQUIRE(EnvFlag("NETDASH_TEST_FLAG"));
        setenv("NETDASH_TEST_FLAG", "0", 1);
        REQUIRE_FALSE(EnvFlag("NETDASH_TEST_FLAG"));
        unsetenv("NETDASH_TEST_FLAG");
        REQUIRE_FALSE(EnvFlag("NETDASH_TEST_FLAG"));
    }

    SECTION("EnvInt only accepts positive integers") {
        setenv("NETDASH_TEST_INT", "12", 1);
        REQUIRE(EnvInt("NETDASH_TEST_INT", 96) == 12);
        setenv("NETDASH_TEST_INT", "0", 1);
        REQUIRE(EnvInt("NETDASH_TEST_INT", 96) == 96);
        setenv("NETDASH_TEST_INT", "-3", 1);
        REQUIRE(EnvInt("NETDASH_TEST_INT", 96) == 96);
        setenv("NETDASH_TEST_INT", "many", 1);
        REQUIRE(EnvInt("NETDASH_TEST_INT", 96) == 96);
        unsetenv("NETDASH_TEST_INT");
        REQUIRE(EnvInt("NETDASH_TEST_INT", 96) == 96);
    }
}
