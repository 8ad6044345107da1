// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the canonical host registry

#include <catch2/catch_test_macros.hpp>
#include "hosts/registry.hpp"
#include "util/time.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace lanwake;
using namespace lanwake::hosts;

namespace {

HostRecord MakeHost(std::string key, std::vector<std::string> addresses = {}, std::vector<const char*> macs = {}) {
    HostRecord record;
    record.canonical_key = key;
    record.aliases.insert(key);
    for (auto& address : addresses) {
        record.addresses.insert(address);
    }
    for (const char* mac : macs) {
        record.macs.insert(*util::MacAddress::Parse(mac));
    }
    return record;
}

ProbeResult Reachable(bool up) {
    ProbeResult result;
    result.reachable = up;
    result.address = "192.168.1.10";
    result.detail = up ? "connected to port 22" : "timeout";
    return result;
}

}  // namespace

TEST_CASE("Registry: Lookup", "[hosts][registry]") {
    HostRecord nas = MakeHost("nas", {"192.168.1.10", "fe80::10"}, {"00:11:22:33:44:55"});
    nas.aliases.insert("nas.lan");
    HostRecord ignored = MakeHost("printer", {"192.168.1.20"});
    ignored.ignored = true;

    Registry registry({nas, ignored, MakeHost("desktop")});

    REQUIRE(registry.size() == 3);
    REQUIRE(registry.keys() == std::vector<std::string>{"desktop", "nas", "printer"});
    REQUIRE(registry.probe_keys() == std::vector<std::string>{"desktop", "nas"});
    REQUIRE(registry.contains("nas"));
    REQUIRE_FALSE(registry.contains("nas.lan"));

    SECTION("resolve accepts any identifier of a host") {
        REQUIRE(registry.resolve("nas") == std::string("nas"));
        REQUIRE(registry.resolve("nas.lan") == std::string("nas"));
        REQUIRE(registry.resolve("NAS.LAN") == std::string("nas"));
        REQUIRE(registry.resolve("192.168.1.10") == std::string("nas"));
        REQUIRE(registry.resolve("FE80:0:0:0:0:0:0:10") == std::string("nas"));
        REQUIRE(registry.resolve("00-11-22-33-44-55") == std::string("nas"));
        REQUIRE(registry.resolve("192.168.1.20") == std::string("printer"));
        REQUIRE_FALSE(registry.resolve("192.168.1.99"));
        REQUIRE_FALSE(registry.resolve(""));
    }

    SECTION("record and get") {
        const HostRecord* record = registry.record("nas");
        REQUIRE(record);
        REQUIRE(*record == nas);
        REQUIRE_FALSE(registry.record("missing"));

        auto entry = registry.get("nas");
        REQUIRE(entry);
        REQUIRE(entry->record == nas);
        REQUIRE(entry->state == NetworkState{});
        REQUIRE_FALSE(registry.get("missing"));
    }

    SECTION("snapshot is ordered by key") {
        auto snapshot = registry.snapshot();
        REQUIRE(snapshot.size() == 3);
        REQUIRE(snapshot[0].record.canonical_key == "desktop");
        REQUIRE(snapshot[1].record.canonical_key == "nas");
        REQUIRE(snapshot[2].record.canonical_key == "printer");
    }
}

TEST_CASE("Registry: Duplicate keys keep the first record", "[hosts][registry]") {
    HostRecord first = MakeHost("nas", {"192.168.1.10"});
    HostRecord second = MakeHost("nas", {"192.168.1.11"});
    Registry registry({first, second});
    REQUIRE(registry.size() == 1);
    REQUIRE(*registry.record("nas") == first);
    REQUIRE_FALSE(registry.resolve("192.168.1.11"));
}

TEST_CASE("Registry: update_state", "[hosts][registry]") {
    util::MockTimeScope mock_time(1700000000);
    HostRecord printer = MakeHost("printer");
    printer.ignored = true;
    Registry registry({MakeHost("nas"), printer});
    DebouncePolicy policy;

    SECTION("Applies debouncing and stamps the probe time") {
        auto transition = registry.update_state("nas", Reachable(true), policy);
        REQUIRE(transition);
        REQUIRE(transition->to == HostStatus::Online);

        auto entry = registry.get("nas");
        REQUIRE(entry->state.status == HostStatus::Online);
        REQUIRE(entry->state.last_probe_at == int64_t{1700000000});
        REQUIRE(entry->state.last_online_at == int64_t{1700000000});
        REQUIRE(entry->state.last_probe_detail == "connected to port 22");
    }

    SECTION("Unknown key is a no-op") {
        REQUIRE_FALSE(registry.update_state("missing", Reachable(true), policy));
    }

    SECTION("Ignored host state never changes") {
        REQUIRE_FALSE(registry.update_state("printer", Reachable(true), policy));
        REQUIRE_FALSE(registry.update_state("printer", Reachable(false), policy));
        auto entry = registry.get("printer");
        REQUIRE(entry->state == NetworkState{});
    }
}

TEST_CASE("Registry: record_wake_attempt", "[hosts][registry]") {
    util::MockTimeScope mock_time(1700000100);
    Registry registry({MakeHost("nas", {}, {"00:11:22:33:44:55"})});

    MacSendResult sent;
    sent.mac = *util::MacAddress::Parse("00:11:22:33:44:55");
    sent.sent = true;
    sent.target = "255.255.255.255:9";

    REQUIRE(registry.record_wake_attempt("nas", {sent}));
    REQUIRE_FALSE(registry.record_wake_attempt("missing", {sent}));

    auto entry = registry.get("nas");
    REQUIRE(entry->state.last_wake_attempt_at == int64_t{1700000100});
    REQUIRE(entry->state.last_wake_results == std::vector<MacSendResult>{sent});
    REQUIRE(entry->state.status == HostStatus::Unknown);
}

TEST_CASE("Registry: Views", "[hosts][registry]") {
    util::MockTimeScope mock_time(1700000000);
    HostRecord nas = MakeHost("nas", {"192.168.1.10"}, {"AA:BB:CC:DD:EE:01"});
    nas.preferred_name = "Storage";
    Registry registry({nas, MakeHost("router")});
    registry.update_state("nas", Reachable(false), DebouncePolicy{});

    auto views = registry.views();
    REQUIRE(views.size() == 2);

    const HostView& view = views[0];
    REQUIRE(view.key == "nas");
    REQUIRE(view.display_name == "Storage");
    REQUIRE(view.aliases == std::vector<std::string>{"nas"});
    REQUIRE(view.addresses == std::vector<std::string>{"192.168.1.10"});
    REQUIRE(view.macs == std::vector<std::string>{"aa:bb:cc:dd:ee:01"});
    REQUIRE(view.status == HostStatus::Offline);
    REQUIRE(view.can_wake);
    REQUIRE_FALSE(view.ignored);
    REQUIRE(view.last_probe_at == int64_t{1700000000});
    REQUIRE_FALSE(view.last_online_at);

    REQUIRE(views[1].key == "router");
    REQUIRE_FALSE(views[1].can_wake);
    REQUIRE(views[1].status == HostStatus::Unknown);

    REQUIRE(registry.view("router"));
    REQUIRE_FALSE(registry.view("missing"));
}

TEST_CASE("Registry: Concurrent readers and writers", "[hosts][registry][threading]") {
    std::vector<HostRecord> records;
    for (int i = 0; i < 16; ++i) {
        records.push_back(MakeHost("host" + std::to_string(i)));
    }
    Registry registry(std::move(records));
    const auto keys = registry.keys();

    std::atomic<bool> torn{false};
    std::atomic<bool> done{false};

    // Writers alternate each host between Online and Offline with threshold 1
    std::vector<std::thread> threads;
    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([&, w]() {
            DebouncePolicy policy{1, 1};
            for (int i = 0; i < 500; ++i) {
                const auto& key = keys[(i + w) % keys.size()];
                registry.update_state(key, Reachable(i % 2 == 0), policy);
            }
        });
    }

    // Readers check that status always agrees with the counters written alongside it
    for (int r = 0; r < 4; ++r) {
        threads.emplace_back([&]() {
            while (!done.load()) {
                for (const auto& entry : registry.snapshot()) {
                    const auto& s = entry.state;
                    if (s.status == HostStatus::Online && s.consecutive_successes == 0) {
                        torn = true;
                    }
                    if (s.status == HostStatus::Offline && s.consecutive_failures == 0) {
                        torn = true;
                    }
                }
            }
        });
    }

    for (int w = 0; w < 4; ++w) {
        threads[w].join();
    }
    done = true;
    for (size_t i = 4; i < threads.size(); ++i) {
        threads[i].join();
    }

    REQUIRE_FALSE(torn.load());
    REQUIRE(registry.size() == 16);
}
