// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/discovery_cache.hpp"

using namespace netdash::discovery;

namespace {

DiscoveryResult Result(const std::string& mode) {
    DiscoveryResult r;
    r.mode = mode;
    r.networks = {"192.168.1.0/24"};
    r.neighbors_count = 3;
    return r;
}

NeighborSnapshot Snapshot(const std::string& fingerprint) {
    NeighborSnapshot s;
    s.entries.push_back(NeighborEntry{"192.168.1.1", "11:22:33:44:55:66", NeighborState::REACHABLE, "eth0"});
    s.taken_at = 1000;
    s.fingerprint = fingerprint;
    return s;
}

}  // namespace

TEST_CASE("DiscoveryCache - empty", "[discovery_cache]") {
    DiscoveryCache cache;
    REQUIRE_FALSE(cache.Get().has_value());
    REQUIRE_FALSE(cache.GetNeighborSnapshot().has_value());
    REQUIRE_FALSE(cache.IsFresh("fp", 1000));
    REQUIRE_FALSE(cache.IsRateLimited(1000, 30));
    REQUIRE_FALSE(cache.InvalidateIfChanged("fp"));
    REQUIRE(cache.fingerprint().empty());
    REQUIRE(cache.last_completed() == 0);
}

TEST_CASE("DiscoveryCache - freshness", "[discovery_cache]") {
    DiscoveryCache cache;
    cache.Put(Result("bounded_sweep"), "fp-a", 1000);

    REQUIRE(cache.Get()->mode == "bounded_sweep");
    REQUIRE(cache.last_completed() == 1000);

    SECTION("Younger than the TTL on the same network") {
        REQUIRE(cache.IsFresh("fp-a", 1000));
        REQUIRE(cache.IsFresh("fp-a", 1059));
    }

    SECTION("Expires at the TTL") {
        REQUIRE_FALSE(cache.IsFresh("fp-a", 1060));
        REQUIRE_FALSE(cache.IsFresh("fp-a", 2000));
        REQUIRE(cache.IsFresh("fp-a", 1010, 11));
        REQUIRE_FALSE(cache.IsFresh("fp-a", 1010, 10));
    }

    SECTION("Another network is never fresh") {
        REQUIRE_FALSE(cache.IsFresh("fp-b", 1001));
    }

    SECTION("Put replaces the slot") {
        cache.Put(Result("neighbors_only"), "fp-b", 1100);
        REQUIRE(cache.Get()->mode == "neighbors_only");
        REQUIRE(cache.fingerprint() == "fp-b");
        REQUIRE(cache.IsFresh("fp-b", 1100));
        REQUIRE_FALSE(cache.IsFresh("fp-a", 1100));
    }
}

TEST_CASE("DiscoveryCache - invalidation", "[discovery_cache]") {
    DiscoveryCache cache;
    cache.Put(Result("bounded_sweep"), "fp-a", 1000);
    cache.PutNeighborSnapshot(Snapshot("fp-a"));

    SECTION("Same fingerprint keeps everything") {
        REQUIRE_FALSE(cache.InvalidateIfChanged("fp-a"));
        REQUIRE(cache.Get().has_value());
        REQUIRE(cache.GetNeighborSnapshot().has_value());
    }

    SECTION("Changed fingerprint clears result and snapshot") {
        REQUIRE(cache.InvalidateIfChanged("fp-b"));
        REQUIRE_FALSE(cache.Get().has_value());
        REQUIRE_FALSE(cache.GetNeighborSnapshot().has_value());
        REQUIRE(cache.last_completed() == 0);
        REQUIRE_FALSE(cache.IsRateLimited(1001, 30));
    }

    SECTION("Invalidate keeps the fingerprint") {
        cache.Invalidate();
        REQUIRE_FALSE(cache.Get().has_value());
        REQUIRE(cache.fingerprint() == "fp-a");
        REQUIRE(cache.InvalidateIfChanged("fp-b"));
    }
}

TEST_CASE("DiscoveryCache - rate limiting", "[discovery_cache]") {
    DiscoveryCache cache;
    cache.Put(Result("bounded_sweep"), "fp-a", 1000);
    REQUIRE(cache.IsRateLimited(1000, 30));
    REQUIRE(cache.IsRateLimited(1029, 30));
    REQUIRE_FALSE(cache.IsRateLimited(1030, 30));
    REQUIRE_FALSE(cache.IsRateLimited(1000, 0));
}

TEST_CASE("DiscoveryCache - neighbor snapshot", "[discovery_cache]") {
    DiscoveryCache cache;
    cache.PutNeighborSnapshot(Snapshot("fp-a"));
    auto snapshot = cache.GetNeighborSnapshot();
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->entries.size() == 1);
    REQUIRE(snapshot->entries[0].mac == "11:22:33:44:55:66");
    REQUIRE(snapshot->fingerprint == "fp-a");

    // Copies out: mutating the returned value does not touch the cache
    snapshot->entries.clear();
    REQUIRE(cache.GetNeighborSnapshot()->entries.size() == 1);
}
