// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/concurrency.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace netdash::util;

TEST_CASE("ConcurrencyLimiter", "[concurrency]") {
    SECTION("Capacity is at least one") {
        ConcurrencyLimiter limiter(0);
        REQUIRE(limiter.capacity() == 1);
    }

    SECTION("Slots acquire and release") {
        ConcurrencyLimiter limiter(2);
        {
            ConcurrencyLimiter::Slot a(limiter);
            ConcurrencyLimiter::Slot b(limiter);
            REQUIRE(limiter.in_use() == 2);
        }
        REQUIRE(limiter.in_use() == 0);
        REQUIRE(limiter.peak() == 2);
    }

    SECTION("TryAcquire refuses when full") {
        ConcurrencyLimiter limiter(1);
        REQUIRE(limiter.TryAcquire());
        REQUIRE_FALSE(limiter.TryAcquire());
        REQUIRE(limiter.in_use() == 1);
        limiter.Release();
        REQUIRE(limiter.TryAcquire());
        limiter.Release();
        REQUIRE(limiter.in_use() == 0);
    }

    SECTION("In-flight work never exceeds capacity") {
        ConcurrencyLimiter limiter(3);
        std::vector<std::thread> threads;
        for (int i = 0; i < 12; ++i) {
            threads.emplace_back([&limiter]() {
                ConcurrencyLimiter::Slot slot(limiter);
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(limiter.peak() <= 3);
        REQUIRE(limiter.in_use() == 0);
    }
}

TEST_CASE("RunBounded", "[concurrency]") {
    SECTION("Every index runs exactly once") {
        std::vector<std::atomic<int>> hits(100);
        RunBounded(hits.size(), 8, [&hits](size_t i) { hits[i]++; });
        for (auto& h : hits) {
            REQUIRE(h.load() == 1);
        }
    }

    SECTION("Parallelism is bounded by limit") {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        RunBounded(40, 4, [&](size_t) {
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --running;
        });
        REQUIRE(peak.load() <= 4);
    }

    SECTION("A throwing task does not stop the others") {
        std::atomic<int> done{0};
        RunBounded(10, 3, [&done](size_t i) {
            if (i == 4) {
                throw std::runtime_error("probe failed");
            }
            ++done;
        });
        REQUIRE(done.load() == 9);
    }

    SECTION("Zero tasks is a no-op") {
        bool called = false;
        RunBounded(0, 4, [&called](size_t) { called = true; });
        REQUIRE_FALSE(called);
    }
}
