// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "hosts/config_merger.hpp"

#include "hosts/registry.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

namespace lanwake {
namespace hosts {

namespace {

struct WorkingHost {
  std::string key;
  std::set<std::string> aliases;
  std::set<std::string> addresses;
  std::set<util::MacAddress> macs;
  std::optional<std::string> preferred_name;
  uint64_t preferred_name_seq{0};
  std::optional<std::string> broadcast;
  uint64_t broadcast_seq{0};
  bool ignored{false};
  bool merged_away{false};
};

// Incoming record after case folding and address normalization
struct NormalizedRecord {
  std::vector<std::string> names;
  std::vector<std::string> addresses;
  std::vector<util::MacAddress> macs;
};

class MergeState {
public:
  void apply(const SourceRecord& record, const std::string& where, std::vector<std::string>& warnings);
  std::vector<HostRecord> finish() const;

private:
  NormalizedRecord normalize(const SourceRecord& record, const std::string& where,
                             std::vector<std::string>& warnings) const;
  std::set<size_t> find_matches(const NormalizedRecord& record) const;
  void absorb(size_t target, size_t victim);
  void add_identifiers(size_t id, const NormalizedRecord& record);

  // Hosts in creation order; index == creation rank
  std::vector<WorkingHost> hosts_;
  std::map<std::string, size_t> by_alias_;
  std::map<std::string, size_t> by_address_;
  std::map<util::MacAddress, size_t> by_mac_;
  uint64_t seq_{0};
};

NormalizedRecord MergeState::normalize(const SourceRecord& record, const std::string& where,
                                       std::vector<std::string>& warnings) const {
  NormalizedRecord out;

  auto push_unique = [](std::vector<std::string>& list, std::string value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
      list.push_back(std::move(value));
    }
  };

  for (const auto& raw_name : record.names) {
    std::string name = util::ToLower(util::TrimWhitespace(raw_name));
    if (name.empty()) {
      warnings.push_back(where + ": empty host name");
      continue;
    }
    if (auto ip = util::ValidateAndNormalizeIP(name)) {
      push_unique(out.addresses, *ip);
    } else {
      push_unique(out.names, std::move(name));
    }
  }

  for (const auto& raw_address : record.addresses) {
    auto ip = util::ValidateAndNormalizeIP(raw_address);
    if (!ip) {
      warnings.push_back(where + ": invalid IP address '" + raw_address + "'");
      continue;
    }
    push_unique(out.addresses, *ip);
  }

  for (const auto& mac : record.macs) {
    if (std::find(out.macs.begin(), out.macs.end(), mac) == out.macs.end()) {
      out.macs.push_back(mac);
    }
  }

  return out;
}

std::set<size_t> MergeState::find_matches(const NormalizedRecord& record) const {
  std::set<size_t> matches;
  for (const auto& name : record.names) {
    if (auto it = by_alias_.find(name); it != by_alias_.end()) {
      matches.insert(it->second);
    }
  }
  for (const auto& address : record.addresses) {
    if (auto it = by_address_.find(address); it != by_address_.end()) {
      matches.insert(it->second);
    }
  }
  for (const auto& mac : record.macs) {
    if (auto it = by_mac_.find(mac); it != by_mac_.end()) {
      matches.insert(it->second);
    }
  }
  return matches;
}

void MergeState::add_identifiers(size_t id, const NormalizedRecord& record) {
  WorkingHost& host = hosts_[id];
  for (const auto& name : record.names) {
    host.aliases.insert(name);
    by_alias_[name] = id;
  }
  for (const auto& address : record.addresses) {
    host.addresses.insert(address);
    by_address_[address] = id;
  }
  for (const auto& mac : record.macs) {
    host.macs.insert(mac);
    by_mac_[mac] = id;
  }
}

// Fold hosts_[victim] into hosts_[target]. target was created earlier.
void MergeState::absorb(size_t target, size_t victim) {
  WorkingHost& into = hosts_[target];
  WorkingHost& from = hosts_[victim];

  for (const auto& alias : from.aliases) {
    into.aliases.insert(alias);
    by_alias_[alias] = target;
  }
  for (const auto& address : from.addresses) {
    into.addresses.insert(address);
    by_address_[address] = target;
  }
  for (const auto& mac : from.macs) {
    into.macs.insert(mac);
    by_mac_[mac] = target;
  }

  into.ignored = into.ignored || from.ignored;
  if (from.preferred_name && from.preferred_name_seq > into.preferred_name_seq) {
    into.preferred_name = from.preferred_name;
    into.preferred_name_seq = from.preferred_name_seq;
  }
  if (from.broadcast && from.broadcast_seq > into.broadcast_seq) {
    into.broadcast = from.broadcast;
    into.broadcast_seq = from.broadcast_seq;
  }

  from.merged_away = true;
  from.aliases.clear();
  from.addresses.clear();
  from.macs.clear();
}

void MergeState::apply(const SourceRecord& record, const std::string& where, std::vector<std::string>& warnings) {
  NormalizedRecord normalized = normalize(record, where, warnings);
  if (normalized.names.empty() && normalized.addresses.empty() && normalized.macs.empty()) {
    warnings.push_back(where + ": record has no host name, address or MAC address, skipped");
    return;
  }

  std::set<size_t> matches = find_matches(normalized);
  const uint64_t seq = ++seq_;

  size_t target;
  if (matches.empty()) {
    std::string key;
    if (!normalized.names.empty()) {
      key = normalized.names.front();
    } else if (!normalized.addresses.empty()) {
      key = normalized.addresses.front();
    } else {
      warnings.push_back(where + ": MAC address " + normalized.macs.front().ToString() +
                         " does not belong to any known host, skipped");
      return;
    }
    target = hosts_.size();
    WorkingHost host;
    host.key = std::move(key);
    hosts_.push_back(std::move(host));
  } else {
    // std::set iterates in ascending order: the first match is the oldest host
    target = *matches.begin();
    for (auto it = std::next(matches.begin()); it != matches.end(); ++it) {
      absorb(target, *it);
    }
  }

  add_identifiers(target, normalized);

  WorkingHost& host = hosts_[target];
  host.ignored = host.ignored || record.ignored;
  if (record.preferred_name) {
    host.preferred_name = record.preferred_name;
    host.preferred_name_seq = seq;
  }
  if (record.broadcast) {
    host.broadcast = record.broadcast;
    host.broadcast_seq = seq;
  }
}

std::vector<HostRecord> MergeState::finish() const {
  std::map<std::string, HostRecord> by_key;
  for (const auto& host : hosts_) {
    if (host.merged_away) {
      continue;
    }
    HostRecord record;
    record.canonical_key = host.key;
    record.aliases = host.aliases;
    record.addresses = host.addresses;
    record.macs = host.macs;
    record.preferred_name = host.preferred_name;
    record.broadcast = host.broadcast;
    record.ignored = host.ignored;
    by_key.emplace(host.key, std::move(record));
  }

  std::vector<HostRecord> out;
  out.reserve(by_key.size());
  for (auto& [key, record] : by_key) {
    out.push_back(std::move(record));
  }
  return out;
}

}  // namespace

MergeOutcome ConfigMerger::merge(std::vector<SourceRecordBatch> batches) {
  std::stable_sort(batches.begin(), batches.end(), [](const SourceRecordBatch& a, const SourceRecordBatch& b) {
    return std::tie(a.precedence, a.order, a.origin) < std::tie(b.precedence, b.order, b.origin);
  });

  MergeOutcome outcome;
  MergeState state;

  for (const auto& batch : batches) {
    for (const auto& warning : batch.warnings) {
      outcome.warnings.push_back(warning);
    }
    for (size_t i = 0; i < batch.records.size(); ++i) {
      const std::string where = batch.origin + ": record " + std::to_string(i + 1);
      state.apply(batch.records[i], where, outcome.warnings);
    }
  }

  outcome.hosts = state.finish();
  return outcome;
}

std::unique_ptr<Registry> ConfigMerger::build_registry(std::vector<SourceRecordBatch> batches) {
  const size_t source_count = batches.size();
  MergeOutcome outcome = merge(std::move(batches));

  for (const auto& warning : outcome.warnings) {
    LOG_HOSTS_WARN("{}", warning);
  }

  size_t ignored = 0;
  for (const auto& host : outcome.hosts) {
    if (host.ignored) {
      ignored++;
    }
    LOG_HOSTS_DEBUG("host {}: {} aliases, {} addresses, {} MACs{}", host.canonical_key, host.aliases.size(),
                    host.addresses.size(), host.macs.size(), host.ignored ? " (ignored)" : "");
  }
  LOG_HOSTS_INFO("Merged {} sources into {} hosts ({} ignored, {} warnings)", source_count, outcome.hosts.size(),
                 ignored, outcome.warnings.size());

  return std::make_unique<Registry>(std::move(outcome.hosts));
}

}  // namespace hosts
}  // namespace lanwake
