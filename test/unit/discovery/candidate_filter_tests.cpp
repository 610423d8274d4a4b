// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/candidate_filter.hpp"
#include "infra/fake_platform.hpp"
#include "infra/fake_prober.hpp"

#include <algorithm>

using namespace netdash;
using namespace netdash::discovery;
using netdash::test::FakePlatform;
using netdash::test::FakeProber;
using netdash::test::Neighbor;

namespace {

const std::optional<std::string> kGateway = std::string("192.168.1.1");

std::optional<util::Ipv4Network> Lan() {
    return util::Ipv4Network::Parse("192.168.1.0/24");
}

std::vector<std::string> Range(int from, int to) {
    std::vector<std::string> out;
    for (int i = from; i <= to; ++i) {
        out.push_back("192.168.1." + std::to_string(i));
    }
    return out;
}

}  // namespace

TEST_CASE("FilterProxyArp", "[candidate_filter]") {
    SECTION("Fifteen IPs behind one MAC are all dropped") {
        std::vector<NeighborEntry> neighbors;
        for (const auto& ip : Range(100, 114)) {
            neighbors.push_back(Neighbor(ip, "00:11:22:33:44:55"));
        }
        neighbors.push_back(Neighbor("192.168.1.20", "aa:bb:cc:dd:ee:20"));

        auto result = FilterProxyArp(neighbors, kGateway, 10);
        REQUIRE(result.proxy_macs == std::set<std::string>{"00:11:22:33:44:55"});
        REQUIRE(result.kept.size() == 1);
        REQUIRE(result.kept[0].ip == "192.168.1.20");

        auto candidates = SeedCandidates(result.kept, kGateway, std::nullopt, Lan(), OsFamily::Linux);
        for (const auto& ip : Range(100, 114)) {
            REQUIRE_FALSE(candidates.Contains(ip));
        }
    }

    SECTION("The gateway entry survives even when its MAC is the proxy") {
        std::vector<NeighborEntry> neighbors;
        for (const auto& ip : Range(1, 12)) {
            neighbors.push_back(Neighbor(ip, "11:22:33:44:55:66"));
        }
        auto result = FilterProxyArp(neighbors, kGateway, 10);
        REQUIRE(result.kept.size() == 1);
        REQUIRE(result.kept[0].ip == "192.168.1.1");
    }

    SECTION("Nine IPs per MAC is below the threshold") {
        std::vector<NeighborEntry> neighbors;
        for (const auto& ip : Range(100, 108)) {
            neighbors.push_back(Neighbor(ip, "00:11:22:33:44:55"));
        }
        auto result = FilterProxyArp(neighbors, kGateway, 10);
        REQUIRE(result.proxy_macs.empty());
        REQUIRE(result.kept.size() == 9);
    }
}

TEST_CASE("AdmitNeighbors / SeedCandidates", "[candidate_filter]") {
    const std::vector<NeighborEntry> neighbors = {
        Neighbor("192.168.1.20", "aa:bb:cc:dd:ee:20", "eth0"),
        Neighbor("10.9.9.9", "aa:bb:cc:dd:ee:99", "eth0"),
        Neighbor("192.168.1.21", "", "eth0"),
        Neighbor("192.168.1.22", "aa:bb:cc:dd:ee:22", "utun3"),
        Neighbor("224.0.0.251", "01:00:5e:00:00:fb", "eth0"),
        Neighbor("192.168.1.23", "aa:bb:cc:dd:ee:23", "eth0", NeighborState::FAILED),
        Neighbor("192.168.1.24", "aa:bb:cc:dd:ee:24", "wlan0", NeighborState::STALE),
    };

    SECTION("Filtering rules") {
        auto candidates = SeedCandidates(neighbors, kGateway, std::string("11:22:33:44:55:66"), Lan(),
                                         OsFamily::Linux);
        REQUIRE(candidates.ips == std::set<std::string>{"192.168.1.1", "192.168.1.20", "192.168.1.24"});
        REQUIRE(candidates.MacFor("192.168.1.1") == "11:22:33:44:55:66");
        REQUIRE(candidates.IfaceFor("192.168.1.24") == "wlan0");
        // Absent hosts still teach us their MAC
        REQUIRE(candidates.MacFor("192.168.1.23") == "aa:bb:cc:dd:ee:23");
    }

    SECTION("Windows admits MAC-less rows") {
        auto candidates = SeedCandidates(neighbors, kGateway, std::nullopt, Lan(), OsFamily::Windows);
        REQUIRE(candidates.Contains("192.168.1.21"));
    }

    SECTION("The gateway is admitted outside the sweep network") {
        auto candidates = SeedCandidates({}, std::string("10.0.0.1"), std::nullopt, Lan(), OsFamily::Linux);
        REQUIRE(candidates.Contains("10.0.0.1"));
    }

    SECTION("Excluded MACs are skipped") {
        CandidateSet candidates;
        AdmitNeighbors(candidates, neighbors, kGateway, Lan(), OsFamily::Linux, {"aa:bb:cc:dd:ee:20"});
        REQUIRE_FALSE(candidates.Contains("192.168.1.20"));
        REQUIRE(candidates.Contains("192.168.1.24"));
    }
}

TEST_CASE("BuildSweepList", "[candidate_filter]") {
    CandidateSet candidates;
    candidates.ips = {"192.168.1.1", "192.168.1.3"};

    SECTION("Bounded and excluding existing candidates") {
        auto sweep = BuildSweepList(Lan(), candidates, 4);
        REQUIRE(sweep == std::vector<std::string>{"192.168.1.2", "192.168.1.4", "192.168.1.5", "192.168.1.6"});
    }

    SECTION("Never more than max_hosts, never a candidate") {
        for (size_t max_hosts : {0u, 1u, 10u, 253u, 1000u}) {
            auto sweep = BuildSweepList(Lan(), candidates, max_hosts);
            REQUIRE(sweep.size() <= max_hosts);
            for (const auto& ip : sweep) {
                REQUIRE_FALSE(candidates.Contains(ip));
            }
        }
        REQUIRE(BuildSweepList(Lan(), candidates, 1000).size() == 252);
    }

    SECTION("No network") {
        REQUIRE(BuildSweepList(std::nullopt, candidates, 256).empty());
    }
}

TEST_CASE("PingSweep", "[candidate_filter]") {
    FakeProber prober;
    prober.ping_ok = {"192.168.1.5", "192.168.1.7"};
    CandidateSet candidates;

    auto outcome = PingSweep(prober, Range(2, 10), 900, 4, candidates);
    REQUIRE(outcome.ping_hits == 2);
    REQUIRE(outcome.ping_results.size() == 9);
    REQUIRE(outcome.ping_results.at("192.168.1.5"));
    REQUIRE_FALSE(outcome.ping_results.at("192.168.1.6"));
    REQUIRE(candidates.ips == std::set<std::string>{"192.168.1.5", "192.168.1.7"});
}

TEST_CASE("ProbeNonResponders", "[candidate_filter]") {
    FakeProber prober;
    util::ConcurrencyLimiter conn_limiter(16);
    HeuristicThresholds thresholds;
    const std::vector<uint16_t> ports = {22, 80, 443, 3389};

    SECTION("Small lists are probed in full") {
        prober.open_ports["192.168.1.30"] = {80};
        CandidateSet candidates;
        auto outcome = ProbeNonResponders(prober, Range(20, 40), ports, candidates, thresholds, 8, conn_limiter);
        REQUIRE(outcome.port_only_hits == 1);
        REQUIRE(outcome.probed.size() == 21);
        REQUIRE(candidates.Contains("192.168.1.30"));
        REQUIRE_FALSE(candidates.MacFor("192.168.1.30").has_value());
        REQUIRE_FALSE(outcome.transparent_proxy_detected);
    }

    SECTION("18 of 20 sample hits flags a proxy and stops") {
        const auto non_responders = Range(2, 201);
        const size_t step = non_responders.size() / thresholds.sample_size;
        for (size_t i = 0; i < 18; ++i) {
            prober.open_ports[non_responders[i * step]] = {443};
        }
        CandidateSet candidates;
        auto outcome =
            ProbeNonResponders(prober, non_responders, ports, candidates, thresholds, 8, conn_limiter);
        REQUIRE(outcome.transparent_proxy_detected);
        REQUIRE(outcome.port_only_hits == 18);
        REQUIRE(outcome.probed.size() == 20);
        REQUIRE(prober.connected_hosts().size() == 20);
    }

    SECTION("A quiet sample continues with the rest") {
        const auto non_responders = Range(2, 201);
        prober.open_ports["192.168.1.150"] = {22};
        CandidateSet candidates;
        auto outcome =
            ProbeNonResponders(prober, non_responders, ports, candidates, thresholds, 8, conn_limiter);
        REQUIRE_FALSE(outcome.transparent_proxy_detected);
        REQUIRE(outcome.probed.size() == non_responders.size());
        REQUIRE(outcome.port_only_hits == 1);
    }

    SECTION("No ports, no probing") {
        CandidateSet candidates;
        auto outcome = ProbeNonResponders(prober, Range(2, 10), {}, candidates, thresholds, 8, conn_limiter);
        REQUIRE(outcome.probed.empty());
        REQUIRE(prober.connects().empty());
    }
}

TEST_CASE("ConfirmTransparentProxy", "[candidate_filter]") {
    HeuristicThresholds thresholds;
    CandidateSet candidates;
    candidates.ips.insert("192.168.1.1");
    candidates.mac_by_ip["192.168.1.1"] = "11:22:33:44:55:66";
    candidates.ips.insert("192.168.1.20");
    candidates.mac_by_ip["192.168.1.20"] = "aa:bb:cc:dd:ee:20";
    std::map<std::string, bool> ping_results = {{"192.168.1.40", true}};
    candidates.ips.insert("192.168.1.40");
    for (const auto& ip : Range(100, 129)) {
        candidates.ips.insert(ip);
        candidates.mac_by_ip[ip] = std::nullopt;
    }

    SECTION("Port-only hits dominating the sweep are purged") {
        PortProbeOutcome outcome;
        outcome.port_only_hits = 30;
        const size_t removed =
            ConfirmTransparentProxy(candidates, outcome, 50, ping_results, kGateway, thresholds);
        REQUIRE(removed == 30);
        REQUIRE(outcome.transparent_proxy_detected);
        REQUIRE(outcome.port_only_hits == 0);
        REQUIRE(candidates.ips == std::set<std::string>{"192.168.1.1", "192.168.1.20", "192.168.1.40"});
    }

    SECTION("Twenty hits is not more than twenty") {
        PortProbeOutcome outcome;
        outcome.port_only_hits = 20;
        REQUIRE(ConfirmTransparentProxy(candidates, outcome, 30, ping_results, kGateway, thresholds) == 0);
        REQUIRE_FALSE(outcome.transparent_proxy_detected);
    }

    SECTION("Half the sweep or less is not a proxy") {
        PortProbeOutcome outcome;
        outcome.port_only_hits = 30;
        REQUIRE(ConfirmTransparentProxy(candidates, outcome, 60, ping_results, kGateway, thresholds) == 0);
        REQUIRE(candidates.ips.size() == 33);
    }
}

TEST_CASE("ApplyFallback", "[candidate_filter]") {
    SECTION("Empty candidate set takes the head of the sweep") {
        CandidateSet candidates;
        auto sweep = Range(1, 200);
        REQUIRE(ApplyFallback(candidates, sweep, 64) == 64);
        REQUIRE(candidates.ips.size() == 64);
        REQUIRE(candidates.Contains("192.168.1.64"));
        REQUIRE_FALSE(candidates.Contains("192.168.1.65"));
    }

    SECTION("Non-empty candidate set is left alone") {
        CandidateSet candidates;
        candidates.ips.insert("192.168.1.1");
        REQUIRE(ApplyFallback(candidates, Range(2, 10), 64) == 0);
        REQUIRE(candidates.ips.size() == 1);
    }
}

TEST_CASE("AggregateCandidates", "[candidate_filter]") {
    FakePlatform platform;
    FakeProber prober;
    ConcurrencySettings concurrency;

    AggregationInput input;
    input.gateway_ip = kGateway;
    input.gateway_mac = "11:22:33:44:55:66";
    input.sweep_network = Lan();
    input.have_networks = true;
    input.max_hosts = 30;
    input.default_ports = {22, 80};

    SECTION("Neighbors, sweep hits and post-sweep neighbors") {
        input.neighbors = {Neighbor("192.168.1.20", "aa:bb:cc:dd:ee:20")};
        prober.ping_ok = {"192.168.1.5"};
        platform.neighbor_reads = {{Neighbor("192.168.1.20", "aa:bb:cc:dd:ee:20"),
                                    Neighbor("192.168.1.9", "aa:bb:cc:dd:ee:09")}};

        auto result = AggregateCandidates(platform, prober, input, concurrency);
        REQUIRE(result.sweep_ips.size() == 30);
        REQUIRE(std::find(result.sweep_ips.begin(), result.sweep_ips.end(), "192.168.1.20") ==
                result.sweep_ips.end());
        REQUIRE(result.ping_hits == 1);
        REQUIRE(result.candidates.ips ==
                std::set<std::string>{"192.168.1.1", "192.168.1.20", "192.168.1.5", "192.168.1.9"});
        REQUIRE(result.candidates.MacFor("192.168.1.9") == "aa:bb:cc:dd:ee:09");
        // .5 answered ping and .9 showed up in the table, the rest got port probes
        const auto probed = prober.connected_hosts();
        REQUIRE(probed.count("192.168.1.5") == 0);
        REQUIRE(probed.count("192.168.1.9") == 0);
        REQUIRE(probed.size() == 28);
    }

    SECTION("Proxy MACs stay out after the sweep too") {
        for (const auto& ip : Range(100, 114)) {
            input.neighbors.push_back(Neighbor(ip, "00:11:22:33:44:55"));
        }
        platform.neighbor_reads = {input.neighbors};
        auto result = AggregateCandidates(platform, prober, input, concurrency);
        REQUIRE(result.proxy_macs.count("00:11:22:33:44:55") == 1);
        for (const auto& ip : Range(100, 114)) {
            REQUIRE_FALSE(result.candidates.Contains(ip));
        }
    }

    SECTION("neighbors_only mode does not sweep") {
        input.bounded_sweep = false;
        auto result = AggregateCandidates(platform, prober, input, concurrency);
        REQUIRE(result.sweep_ips.empty());
        REQUIRE(prober.pinged().empty());
        REQUIRE(result.candidates.ips == std::set<std::string>{"192.168.1.1"});
    }

    SECTION("Fast mode skips port probing") {
        input.fast = true;
        auto result = AggregateCandidates(platform, prober, input, concurrency);
        REQUIRE(prober.connects().empty());
        REQUIRE(result.port_only_hits == 0);
    }

    SECTION("Nothing found falls back to the sweep head") {
        input.gateway_ip = std::nullopt;
        input.gateway_mac = std::nullopt;
        input.default_ports.clear();
        auto result = AggregateCandidates(platform, prober, input, concurrency);
        REQUIRE(result.candidates.ips.size() == 30);
    }
}
