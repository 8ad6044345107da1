// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for merging host sources into canonical records

#include <catch2/catch_test_macros.hpp>
#include "hosts/config_merger.hpp"
#include "hosts/registry.hpp"
#include <algorithm>

using namespace lanwake;
using namespace lanwake::hosts;

namespace {

util::MacAddress Mac(const char* text) {
    return *util::MacAddress::Parse(text);
}

SourceRecord Names(std::vector<std::string> names) {
    SourceRecord r;
    r.names = std::move(names);
    return r;
}

SourceRecord HostsLine(std::string address, std::vector<std::string> names) {
    SourceRecord r;
    r.addresses.push_back(std::move(address));
    r.names = std::move(names);
    return r;
}

SourceRecord EthersLine(const char* mac, std::string target) {
    SourceRecord r;
    r.macs.push_back(Mac(mac));
    r.names.push_back(std::move(target));
    return r;
}

SourceRecordBatch Batch(SourceKind kind, uint32_t order, std::string origin, std::vector<SourceRecord> records) {
    SourceRecordBatch batch(kind, order, std::move(origin));
    batch.records = std::move(records);
    return batch;
}

const HostRecord* Find(const MergeOutcome& outcome, const std::string& key) {
    for (const auto& host : outcome.hosts) {
        if (host.canonical_key == key) {
            return &host;
        }
    }
    return nullptr;
}

bool HasWarningContaining(const MergeOutcome& outcome, const std::string& needle) {
    return std::any_of(outcome.warnings.begin(), outcome.warnings.end(),
                       [&](const std::string& w) { return w.find(needle) != std::string::npos; });
}

}  // namespace

TEST_CASE("ConfigMerger: Config overlay enriches a hosts entry", "[hosts][merger]") {
    SourceRecord overlay = Names({"a.example"});
    overlay.macs.push_back(Mac("aa:bb:cc:dd:ee:ff"));
    overlay.preferred_name = "A";

    std::vector<SourceRecordBatch> batches;
    batches.push_back(Batch(SourceKind::HostsFile, 0, "/etc/hosts", {Names({"a.example"})}));
    batches.push_back(Batch(SourceKind::ConfigFile, 1, "config.toml", {overlay}));

    auto outcome = ConfigMerger::merge(std::move(batches));

    REQUIRE(outcome.hosts.size() == 1);
    const HostRecord& host = outcome.hosts[0];
    REQUIRE(host.canonical_key == "a.example");
    REQUIRE(host.aliases == std::set<std::string>{"a.example"});
    REQUIRE(host.macs == std::set<util::MacAddress>{Mac("aa:bb:cc:dd:ee:ff")});
    REQUIRE(host.preferred_name == std::string("A"));
    REQUIRE(host.display_name() == "A");
    REQUIRE(outcome.warnings.empty());
}

TEST_CASE("ConfigMerger: hosts and ethers files join on name and address", "[hosts][merger]") {
    std::vector<SourceRecordBatch> batches;
    batches.push_back(Batch(SourceKind::HostsFile, 0, "/etc/hosts",
                            {HostsLine("192.168.1.10", {"nas", "nas.lan"}), HostsLine("192.168.1.20", {"printer"})}));

    SourceRecord by_address;
    by_address.macs.push_back(Mac("00:11:22:33:44:55"));
    by_address.addresses.push_back("192.168.1.20");
    batches.push_back(Batch(SourceKind::EthersFile, 1, "/etc/ethers",
                            {EthersLine("aa:bb:cc:00:00:01", "NAS.lan"), by_address}));

    auto outcome = ConfigMerger::merge(std::move(batches));

    REQUIRE(outcome.hosts.size() == 2);
    const HostRecord* nas = Find(outcome, "nas");
    REQUIRE(nas);
    REQUIRE(nas->aliases == std::set<std::string>{"nas", "nas.lan"});
    REQUIRE(nas->addresses == std::set<std::string>{"192.168.1.10"});
    REQUIRE(nas->macs.size() == 1);

    const HostRecord* printer = Find(outcome, "printer");
    REQUIRE(printer);
    REQUIRE(printer->macs == std::set<util::MacAddress>{Mac("00:11:22:33:44:55")});
}

TEST_CASE("ConfigMerger: Canonical key selection", "[hosts][merger]") {
    SECTION("First name in source order") {
        auto outcome = ConfigMerger::merge(
            {Batch(SourceKind::HostsFile, 0, "h", {HostsLine("10.0.0.5", {"zeta", "alpha"})})});
        REQUIRE(outcome.hosts.size() == 1);
        REQUIRE(outcome.hosts[0].canonical_key == "zeta");
    }

    SECTION("Names are case folded") {
        auto outcome = ConfigMerger::merge({Batch(SourceKind::ConfigFile, 0, "c", {Names({"Desktop.LAN"})})});
        REQUIRE(outcome.hosts[0].canonical_key == "desktop.lan");
    }

    SECTION("Address when there is no name") {
        SourceRecord r;
        r.addresses.push_back("10.0.0.9");
        r.macs.push_back(Mac("00:11:22:33:44:55"));
        auto outcome = ConfigMerger::merge({Batch(SourceKind::EthersFile, 0, "e", {r})});
        REQUIRE(outcome.hosts.size() == 1);
        REQUIRE(outcome.hosts[0].canonical_key == "10.0.0.9");
    }

    SECTION("A name that is an IP address is treated as an address") {
        auto outcome = ConfigMerger::merge({Batch(SourceKind::ConfigFile, 0, "c", {Names({"::FFFF:10.0.0.7"})})});
        REQUIRE(outcome.hosts.size() == 1);
        REQUIRE(outcome.hosts[0].canonical_key == "10.0.0.7");
        REQUIRE(outcome.hosts[0].aliases.empty());
        REQUIRE(outcome.hosts[0].addresses == std::set<std::string>{"10.0.0.7"});
    }

    SECTION("Key is never renamed by later aliases") {
        auto outcome = ConfigMerger::merge({
            Batch(SourceKind::HostsFile, 0, "h", {HostsLine("10.0.0.5", {"box"})}),
            Batch(SourceKind::ConfigFile, 1, "c", {HostsLine("10.0.0.5", {"aaa"})}),
        });
        REQUIRE(outcome.hosts.size() == 1);
        REQUIRE(outcome.hosts[0].canonical_key == "box");
        REQUIRE(outcome.hosts[0].aliases == std::set<std::string>{"aaa", "box"});
    }
}

TEST_CASE("ConfigMerger: Records bridging several hosts coalesce", "[hosts][merger]") {
    std::vector<SourceRecordBatch> batches;
    batches.push_back(Batch(SourceKind::HostsFile, 0, "h",
                            {HostsLine("10.0.0.1", {"first"}), HostsLine("10.0.0.2", {"second"}),
                             HostsLine("10.0.0.3", {"third"})}));

    SourceRecord second_overlay = Names({"second"});
    second_overlay.preferred_name = "Older";
    second_overlay.broadcast = "10.0.0.255";
    SourceRecord third_overlay = Names({"third"});
    third_overlay.preferred_name = "Newer";
    third_overlay.ignored = true;
    batches.push_back(Batch(SourceKind::ConfigFile, 1, "c", {second_overlay, third_overlay}));

    // One record naming both "second" and "third" plus "first"'s address
    SourceRecord bridge;
    bridge.names = {"third", "second"};
    bridge.addresses = {"10.0.0.1"};
    batches.push_back(Batch(SourceKind::ConfigFile, 2, "c2", {bridge}));

    auto outcome = ConfigMerger::merge(std::move(batches));

    REQUIRE(outcome.hosts.size() == 1);
    const HostRecord& host = outcome.hosts[0];
    SECTION("The host created first survives") {
        REQUIRE(host.canonical_key == "first");
    }
    SECTION("Identifiers are unioned") {
        REQUIRE(host.aliases == std::set<std::string>{"first", "second", "third"});
        REQUIRE(host.addresses == std::set<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"});
    }
    SECTION("Most recently written preferred_name wins, other fields carry over") {
        REQUIRE(host.preferred_name == std::string("Newer"));
        REQUIRE(host.broadcast == std::string("10.0.0.255"));
        REQUIRE(host.ignored);
    }
}

TEST_CASE("ConfigMerger: Precedence", "[hosts][merger]") {
    SourceRecord low = Names({"nas"});
    low.preferred_name = "From hosts";
    SourceRecord mid = Names({"nas"});
    mid.preferred_name = "First config";
    SourceRecord high = Names({"nas"});
    high.preferred_name = "Last config";

    SECTION("Later config files win over earlier ones") {
        auto outcome = ConfigMerger::merge({
            Batch(SourceKind::ConfigFile, 5, "b.toml", {high}),
            Batch(SourceKind::ConfigFile, 2, "a.toml", {mid}),
        });
        REQUIRE(outcome.hosts[0].preferred_name == std::string("Last config"));
    }

    SECTION("Config beats hosts regardless of list position") {
        auto outcome = ConfigMerger::merge({
            Batch(SourceKind::ConfigFile, 0, "a.toml", {mid}),
            Batch(SourceKind::HostsFile, 9, "/etc/hosts", {low}),
        });
        REQUIRE(outcome.hosts[0].preferred_name == std::string("First config"));
    }

    SECTION("Explicit precedence overrides the kind default") {
        auto forced = Batch(SourceKind::HostsFile, 0, "forced", {low});
        forced.precedence = 100;
        auto outcome = ConfigMerger::merge({forced, Batch(SourceKind::ConfigFile, 0, "a.toml", {mid})});
        REQUIRE(outcome.hosts[0].preferred_name == std::string("From hosts"));
    }

    SECTION("Unset fields do not erase earlier values") {
        auto outcome = ConfigMerger::merge({
            Batch(SourceKind::ConfigFile, 0, "a.toml", {mid}),
            Batch(SourceKind::ConfigFile, 1, "b.toml", {Names({"nas"})}),
        });
        REQUIRE(outcome.hosts[0].preferred_name == std::string("First config"));
    }

    SECTION("Ignore is sticky") {
        SourceRecord ignore = Names({"nas"});
        ignore.ignored = true;
        auto outcome = ConfigMerger::merge({
            Batch(SourceKind::HostsFile, 0, "h", {ignore}),
            Batch(SourceKind::ConfigFile, 0, "c", {Names({"nas"})}),
        });
        REQUIRE(outcome.hosts[0].ignored);
    }
}

TEST_CASE("ConfigMerger: Output does not depend on batch list order", "[hosts][merger]") {
    SourceRecord overlay = Names({"nas"});
    overlay.macs.push_back(Mac("00:11:22:33:44:55"));
    overlay.preferred_name = "Storage";

    std::vector<SourceRecordBatch> batches = {
        Batch(SourceKind::HostsFile, 0, "/etc/hosts", {HostsLine("192.168.1.10", {"nas"}), Names({"router"})}),
        Batch(SourceKind::EthersFile, 1, "/etc/ethers", {EthersLine("aa:bb:cc:00:00:01", "router")}),
        Batch(SourceKind::ConfigFile, 2, "a.toml", {overlay}),
        Batch(SourceKind::ConfigFile, 3, "b.toml", {Names({"desktop"})}),
        Batch(SourceKind::CommandLine, 0, "--ignore-host", {[] {
                  SourceRecord r;
                  r.names.push_back("desktop");
                  r.ignored = true;
                  return r;
              }()}),
    };

    const auto reference = ConfigMerger::merge(batches).hosts;
    REQUIRE(reference.size() == 3);

    std::vector<size_t> perm = {0, 1, 2, 3, 4};
    while (std::next_permutation(perm.begin(), perm.end())) {
        std::vector<SourceRecordBatch> shuffled;
        for (size_t i : perm) {
            shuffled.push_back(batches[i]);
        }
        REQUIRE(ConfigMerger::merge(std::move(shuffled)).hosts == reference);
    }

    SECTION("Hosts are ordered by canonical key") {
        REQUIRE(reference[0].canonical_key == "desktop");
        REQUIRE(reference[1].canonical_key == "nas");
        REQUIRE(reference[2].canonical_key == "router");
    }
}

TEST_CASE("ConfigMerger: Malformed records are skipped with warnings", "[hosts][merger]") {
    SECTION("Orphan MAC") {
        SourceRecord orphan;
        orphan.macs.push_back(Mac("00:11:22:33:44:55"));
        auto outcome = ConfigMerger::merge({Batch(SourceKind::EthersFile, 0, "/etc/ethers", {orphan})});
        REQUIRE(outcome.hosts.empty());
        REQUIRE(HasWarningContaining(outcome, "/etc/ethers: record 1"));
        REQUIRE(HasWarningContaining(outcome, "does not belong to any known host"));
    }

    SECTION("MAC-only record joins an existing host") {
        SourceRecord with_name = EthersLine("00:11:22:33:44:55", "nas");
        SourceRecord second_mac;
        second_mac.macs = {Mac("00:11:22:33:44:55"), Mac("00:11:22:33:44:66")};
        auto outcome = ConfigMerger::merge({Batch(SourceKind::EthersFile, 0, "e", {with_name, second_mac})});
        REQUIRE(outcome.hosts.size() == 1);
        REQUIRE(outcome.hosts[0].macs.size() == 2);
    }

    SECTION("Empty record") {
        auto outcome = ConfigMerger::merge({Batch(SourceKind::ConfigFile, 0, "c", {SourceRecord{}})});
        REQUIRE(outcome.hosts.empty());
        REQUIRE(HasWarningContaining(outcome, "no host name, address or MAC"));
    }

    SECTION("Invalid address is dropped but the rest of the record survives") {
        SourceRecord r = Names({"nas"});
        r.addresses.push_back("999.1.1.1");
        auto outcome = ConfigMerger::merge({Batch(SourceKind::ConfigFile, 0, "c", {r})});
        REQUIRE(outcome.hosts.size() == 1);
        REQUIRE(outcome.hosts[0].addresses.empty());
        REQUIRE(HasWarningContaining(outcome, "invalid IP address '999.1.1.1'"));
    }

    SECTION("Parser warnings are passed through") {
        auto batch = Batch(SourceKind::HostsFile, 0, "/etc/hosts", {});
        batch.warnings.push_back("/etc/hosts:3: invalid IP address 'x'");
        auto outcome = ConfigMerger::merge({batch});
        REQUIRE(outcome.warnings == std::vector<std::string>{"/etc/hosts:3: invalid IP address 'x'"});
    }

    SECTION("Empty input is not an error") {
        auto outcome = ConfigMerger::merge({});
        REQUIRE(outcome.hosts.empty());
        REQUIRE(outcome.warnings.empty());
    }
}

TEST_CASE("ConfigMerger: build_registry", "[hosts][merger]") {
    auto registry = ConfigMerger::build_registry({
        Batch(SourceKind::HostsFile, 0, "h", {HostsLine("192.168.1.10", {"nas"})}),
        Batch(SourceKind::EthersFile, 0, "e", {EthersLine("00:11:22:33:44:55", "nas")}),
    });
    REQUIRE(registry);
    REQUIRE(registry->size() == 1);
    REQUIRE(registry->resolve("00-11-22-33-44-55") == std::string("nas"));
    REQUIRE(registry->resolve("192.168.1.10") == std::string("nas"));
}
