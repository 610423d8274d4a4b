// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/enricher.hpp"
#include "infra/fake_prober.hpp"

#include <algorithm>

using namespace netdash::discovery;
using netdash::test::FakeProber;

namespace {

KnownDevice Known(const std::string& name, std::optional<std::string> ip, std::optional<std::string> mac,
                  std::vector<uint16_t> ports = {}) {
    KnownDevice kd;
    kd.name = name;
    kd.match_ip = std::move(ip);
    kd.match_mac = std::move(mac);
    kd.ports = std::move(ports);
    return kd;
}

const DiscoveredDevice& Find(const std::vector<DiscoveredDevice>& devices, const std::string& ip) {
    auto it = std::find_if(devices.begin(), devices.end(), [&](const auto& d) { return d.ip == ip; });
    REQUIRE(it != devices.end());
    return *it;
}

}  // namespace

TEST_CASE("MatchKnown", "[enricher]") {
    const std::vector<KnownDevice> known = {
        Known("NAS", std::string("192.168.1.10"), std::nullopt),
        Known("Printer", std::nullopt, std::string("AA:BB:CC:DD:EE:FF")),
        Known("Duplicate NAS", std::string("192.168.1.10"), std::nullopt),
    };

    SECTION("IP match") {
        const auto* kd = MatchKnown(known, "192.168.1.10", std::nullopt);
        REQUIRE(kd != nullptr);
        REQUIRE(kd->name == "NAS");
    }

    SECTION("MAC match ignores case and separators") {
        const auto* kd = MatchKnown(known, "192.168.1.50", std::string("aa-bb-cc-dd-ee-ff"));
        REQUIRE(kd != nullptr);
        REQUIRE(kd->name == "Printer");
    }

    SECTION("Declaration order decides between IP and MAC matches") {
        // NAS is declared first and matches on IP
        const auto* kd = MatchKnown(known, "192.168.1.10", std::string("aa:bb:cc:dd:ee:ff"));
        REQUIRE(kd->name == "NAS");
    }

    SECTION("No match") {
        REQUIRE(MatchKnown(known, "192.168.1.11", std::string("00:00:00:00:00:01")) == nullptr);
        REQUIRE(MatchKnown(known, "192.168.1.11", std::nullopt) == nullptr);
        REQUIRE(MatchKnown({}, "192.168.1.10", std::nullopt) == nullptr);
    }
}

TEST_CASE("ClassifyConnection", "[enricher]") {
    REQUIRE(ClassifyConnection(std::string("wlan0"), OsFamily::Linux) == ConnectionType::Wireless);
    REQUIRE(ClassifyConnection(std::string("wlp3s0"), OsFamily::Linux) == ConnectionType::Wireless);
    REQUIRE(ClassifyConnection(std::string("AirPort"), OsFamily::MacOS) == ConnectionType::Wireless);
    REQUIRE(ClassifyConnection(std::string("Wireless LAN adapter"), OsFamily::Windows) == ConnectionType::Wireless);
    REQUIRE(ClassifyConnection(std::string("en0"), OsFamily::MacOS) == ConnectionType::Wireless);
    REQUIRE(ClassifyConnection(std::string("en0"), OsFamily::Linux) == ConnectionType::Wired);
    REQUIRE(ClassifyConnection(std::string("eth0"), OsFamily::Linux) == ConnectionType::Wired);
    REQUIRE(ClassifyConnection(std::string(""), OsFamily::Linux) == ConnectionType::Wired);
    REQUIRE(ClassifyConnection(std::nullopt, OsFamily::MacOS) == ConnectionType::Wired);
}

TEST_CASE("EnrichCandidates", "[enricher]") {
    FakeProber prober;
    ConcurrencySettings concurrency;
    HostIdentity host;
    host.ips = {"192.168.1.5", "127.0.0.1"};

    CandidateSet candidates;
    candidates.ips = {"192.168.1.1", "192.168.1.5", "192.168.1.20", "192.168.1.50"};
    candidates.mac_by_ip["192.168.1.1"] = "11:22:33:44:55:66";
    candidates.mac_by_ip["192.168.1.20"] = "";
    candidates.mac_by_ip["192.168.1.50"] = "aa:bb:cc:dd:ee:ff";
    candidates.iface_by_ip["192.168.1.50"] = "wlan0";

    const std::vector<KnownDevice> known = {Known("Printer", std::nullopt, std::string("AA:BB:CC:DD:EE:FF"), {9100})};
    const std::map<std::string, bool> ping_results = {{"192.168.1.20", false}};

    EnrichOptions options;
    options.default_ports = {22, 80};
    options.gateway_ip = "192.168.1.1";

    prober.dns_names["192.168.1.20"] = "laptop.lan";
    prober.ping_ok = {"192.168.1.1", "192.168.1.5", "192.168.1.20"};
    prober.open_ports["192.168.1.50"] = {9100};
    prober.open_ports["192.168.1.20"] = {22};

    SECTION("Full enrichment") {
        auto devices = EnrichCandidates(prober, candidates, ping_results, known, host, options, concurrency);
        REQUIRE(devices.size() == 4);
        REQUIRE(std::is_sorted(devices.begin(), devices.end(),
                               [](const auto& a, const auto& b) { return a.ip < b.ip; }));

        const auto& gw = Find(devices, "192.168.1.1");
        REQUIRE(gw.name == "Gateway (192.168.1.1)");
        REQUIRE(gw.ping);
        REQUIRE(gw.up);
        REQUIRE(gw.ports == PortStatus{{22, false}, {80, false}});

        const auto& self = Find(devices, "192.168.1.5");
        REQUIRE(self.is_host);
        REQUIRE(self.name == "192.168.1.5");
        REQUIRE_FALSE(self.mac.has_value());

        // Swept IPs reuse the sweep answer instead of pinging again
        const auto& laptop = Find(devices, "192.168.1.20");
        REQUIRE(laptop.name == "laptop.lan");
        REQUIRE_FALSE(laptop.mac.has_value());
        REQUIRE_FALSE(laptop.ping);
        REQUIRE(laptop.up);
        REQUIRE(laptop.ports.at(22));
        REQUIRE(prober.ping_count("192.168.1.20") == 0);

        const auto& printer = Find(devices, "192.168.1.50");
        REQUIRE(printer.known);
        REQUIRE(printer.name == "Printer");
        REQUIRE(printer.ports == PortStatus{{9100, true}});
        REQUIRE(printer.conn_type == ConnectionType::Wireless);
        REQUIRE(printer.up);
        REQUIRE_FALSE(printer.ping);
    }

    SECTION("Fast mode skips DNS, ports and fresh pings") {
        options.fast = true;
        const std::map<std::string, bool> swept = {{"192.168.1.20", true}, {"192.168.1.50", false}};
        auto devices = EnrichCandidates(prober, candidates, swept, known, host, options, concurrency);

        REQUIRE(prober.dns_lookup_count() == 0);
        REQUIRE(prober.connects().empty());
        REQUIRE(prober.pinged().empty());

        REQUIRE(Find(devices, "192.168.1.20").ping);
        REQUIRE(Find(devices, "192.168.1.20").up);
        REQUIRE(Find(devices, "192.168.1.20").name == "192.168.1.20");
        REQUIRE_FALSE(Find(devices, "192.168.1.1").ping);
        REQUIRE_FALSE(Find(devices, "192.168.1.1").up);
        REQUIRE(Find(devices, "192.168.1.1").name == "Gateway (192.168.1.1)");
        REQUIRE(Find(devices, "192.168.1.50").ports.empty());
        REQUIRE(Find(devices, "192.168.1.50").name == "Printer");
    }

    SECTION("No candidates") {
        auto devices = EnrichCandidates(prober, CandidateSet{}, {}, known, host, options, concurrency);
        REQUIRE(devices.empty());
    }
}
