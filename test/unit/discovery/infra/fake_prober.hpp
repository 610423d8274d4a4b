// Copyright (c) 2025 The Unicity Foundation
// FakeProber - scripted liveness probes for discovery tests
//
// Answers come from sets filled in by the test; every probe is recorded so
// tests can assert on what was (and was not) probed. Thread-safe, since the
// code under test probes from worker threads.

#ifndef NETDASH_TEST_FAKE_PROBER_HPP
#define NETDASH_TEST_FAKE_PROBER_HPP

#include "discovery/prober.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace netdash {
namespace test {

class FakeProber : public discovery::Prober {
public:
    bool Ping(const std::string& host, int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pinged_.push_back(host);
        return ping_all || ping_ok.count(host) > 0;
    }

    bool TcpConnect(const std::string& host, uint16_t port, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connects_.emplace_back(host, port);
        if (tcp_all_open) {
            return true;
        }
        auto it = open_ports.find(host);
        return it != open_ports.end() && it->second.count(port) > 0;
    }

    std::optional<std::string> ReverseDns(const std::string& ip) override {
        std::lock_guard<std::mutex> lock(mutex_);
        dns_lookups_.push_back(ip);
        auto it = dns_names.find(ip);
        if (it == dns_names.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> pinged() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pinged_;
    }

    size_t ping_count(const std::string& host) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(pinged_.begin(), pinged_.end(), host));
    }

    std::vector<std::pair<std::string, uint16_t>> connects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connects_;
    }

    std::set<std::string> connected_hosts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> hosts;
        for (const auto& [host, port] : connects_) {
            hosts.insert(host);
        }
        return hosts;
    }

    size_t dns_lookup_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dns_lookups_.size();
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        pinged_.clear();
        connects_.clear();
        dns_lookups_.clear();
    }

    std::set<std::string> ping_ok;
    bool ping_all{false};
    std::map<std::string, std::set<uint16_t>> open_ports;
    bool tcp_all_open{false};
    std::map<std::string, std::string> dns_names;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> pinged_;
    std::vector<std::pair<std::string, uint16_t>> connects_;
    std::vector<std::string> dns_lookups_;
};

}  // namespace test
}  // namespace netdash

#endif  // NETDASH_TEST_FAKE_PROBER_HPP
