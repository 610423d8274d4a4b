// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/process.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace netdash::util;

TEST_CASE("RunProcess", "[process]") {
    SECTION("Captures stdout and exit status") {
        auto result = RunProcess({"sh", "-c", "echo neighbor; exit 3"}, 5);
        REQUIRE(result.exit_code == 3);
        REQUIRE(result.out == "neighbor\n");
        REQUIRE_FALSE(result.ok());
    }

    SECTION("Captures stderr separately") {
        auto result = RunProcess({"sh", "-c", "echo oops 1>&2"}, 5);
        REQUIRE(result.ok());
        REQUIRE(result.out.empty());
        REQUIRE(result.err == "oops\n");
    }

    SECTION("Runs with a C.UTF-8 locale") {
        auto result = RunProcess({"sh", "-c", "printf %s \"$LC_ALL\""}, 5);
        REQUIRE(result.out == "C.UTF-8");
    }

    SECTION("Missing binary yields the failure sentinel") {
        auto result = RunProcess({"netdash-definitely-not-a-tool"}, 5);
        REQUIRE(result.exit_code == ProcessResult::FAILED);
        REQUIRE_FALSE(result.err.empty());
    }

    SECTION("Timeout kills the child") {
        auto result = RunProcess({"sleep", "10"}, 1);
        REQUIRE(result.exit_code == ProcessResult::FAILED);
        REQUIRE(result.err == "timeout");
    }

    SECTION("Empty argv") {
        auto result = RunProcess({}, 1);
        REQUIRE(result.exit_code == ProcessResult::FAILED);
    }
}

TEST_CASE("RunProcess: concurrent children do not hold each other's pipes", "[process]") {
    using Clock = std::chrono::steady_clock;
    std::atomic<bool> stop{false};

    // Slow children keep being spawned while the fast command runs
    std::vector<std::thread> slow;
    for (int i = 0; i < 4; ++i) {
        slow.emplace_back([&stop]() {
            while (!stop) {
                RunProcess({"sleep", "1"}, 5);
            }
        });
    }

    auto longest = std::chrono::milliseconds(0);
    bool all_ok = true;
    const auto until = Clock::now() + std::chrono::seconds(3);
    while (Clock::now() < until) {
        const auto start = Clock::now();
        auto result = RunProcess({"sh", "-c", "echo up"}, 5);
        const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        longest = std::max(longest, took);
        all_ok = all_ok && result.ok() && result.out == "up\n";
    }
    stop = true;
    for (auto& t : slow) {
        t.join();
    }

    REQUIRE(all_ok);
    REQUIRE(longest < std::chrono::milliseconds(800));
}
