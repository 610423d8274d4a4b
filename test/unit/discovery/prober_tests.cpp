// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/prober.hpp"
#include "infra/fake_platform.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

using namespace netdash::discovery;
using netdash::test::FakePlatform;

namespace {

// Resolver that blocks every lookup until Open() is called.
struct StalledResolver {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;
    std::atomic<int> calls{0};

    void Open() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }
};

bool WaitForIdle(const SystemProber& prober) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (prober.lookups_in_flight() != 0) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

}  // namespace

TEST_CASE("SystemProber: reverse DNS", "[prober]") {
    FakePlatform platform;

    SECTION("Returns the resolved name") {
        SystemProber prober(platform, 2, [](const std::string& ip) -> std::optional<std::string> {
            if (ip == "192.168.1.50") {
                return std::string("printer.lan");
            }
            return std::nullopt;
        });
        auto name = prober.ReverseDns("192.168.1.50");
        REQUIRE(name.has_value());
        REQUIRE(*name == "printer.lan");
        REQUIRE_FALSE(prober.ReverseDns("192.168.1.51").has_value());
        REQUIRE(WaitForIdle(prober));
    }

    SECTION("Malformed address never reaches the resolver") {
        std::atomic<int> calls{0};
        SystemProber prober(platform, 2, [&calls](const std::string&) -> std::optional<std::string> {
            ++calls;
            return std::string("x");
        });
        REQUIRE_FALSE(prober.ReverseDns("192.168.1").has_value());
        REQUIRE_FALSE(prober.ReverseDns("printer.lan").has_value());
        REQUIRE(calls == 0);
    }

    SECTION("Hung lookups keep their threads bounded") {
        auto resolver = std::make_shared<StalledResolver>();
        SystemProber prober(platform, 2, [resolver](const std::string& ip) -> std::optional<std::string> {
            ++resolver->calls;
            std::unique_lock<std::mutex> lock(resolver->mutex);
            resolver->cv.wait(lock, [&]() { return resolver->open; });
            return "host-" + ip;
        });

        REQUIRE_FALSE(prober.ReverseDns("192.168.1.10").has_value());
        REQUIRE_FALSE(prober.ReverseDns("192.168.1.11").has_value());
        REQUIRE(prober.lookups_in_flight() == 2);

        // Both threads are still blocked, so this one is refused outright
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(prober.ReverseDns("192.168.1.12").has_value());
        REQUIRE(std::chrono::steady_clock::now() - start < SystemProber::DNS_BUDGET);
        REQUIRE(resolver->calls == 2);
        REQUIRE(prober.lookups_in_flight() == 2);

        resolver->Open();
        REQUIRE(WaitForIdle(prober));

        auto name = prober.ReverseDns("192.168.1.13");
        REQUIRE(name.has_value());
        REQUIRE(*name == "host-192.168.1.13");
        REQUIRE(resolver->calls == 3);
        REQUIRE(WaitForIdle(prober));
    }
}

TEST_CASE("PingCommand", "[prober]") {
    SECTION("Unix waits in whole seconds") {
        auto argv = PingCommand(OsFamily::Linux, "192.168.1.1", 200);
        REQUIRE(argv == std::vector<std::string>{"ping", "-c", "1", "-W", "1", "192.168.1.1"});
        REQUIRE(PingProcessTimeout(OsFamily::Linux, 200) == 2);
    }

    SECTION("Windows waits in milliseconds") {
        auto argv = PingCommand(OsFamily::Windows, "192.168.1.1", 3000);
        REQUIRE(argv == std::vector<std::string>{"ping", "-n", "1", "-w", "3000", "192.168.1.1"});
        REQUIRE(PingProcessTimeout(OsFamily::Windows, 3000) == 5);
    }
}
