// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "hosts/registry.hpp"

#include "util/logging.hpp"
#include "util/mac_address.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <mutex>

namespace lanwake {
namespace hosts {

HostView MakeHostView(const HostRecord& record, const NetworkState& state) {
  HostView view;
  view.key = record.canonical_key;
  view.display_name = record.display_name();
  view.aliases.assign(record.aliases.begin(), record.aliases.end());
  view.addresses.assign(record.addresses.begin(), record.addresses.end());
  view.macs.reserve(record.macs.size());
  for (const auto& mac : record.macs) {
    view.macs.push_back(mac.ToString());
  }
  view.status = state.status;
  view.can_wake = record.can_wake();
  view.ignored = record.ignored;
  view.last_probe_at = state.last_probe_at;
  view.last_online_at = state.last_online_at;
  view.last_wake_attempt_at = state.last_wake_attempt_at;
  view.last_probe_address = state.last_probe_address;
  view.last_probe_detail = state.last_probe_detail;
  view.last_wake_results = state.last_wake_results;
  return view;
}

Registry::Registry(std::vector<HostRecord> records) {
  for (auto& record : records) {
    const std::string key = record.canonical_key;
    if (entries_.count(key)) {
      LOG_HOSTS_ERROR("Registry: duplicate canonical key '{}', keeping the first record", key);
      continue;
    }

    index_.emplace(key, key);
    for (const auto& alias : record.aliases) {
      index_.emplace(alias, key);
    }
    for (const auto& address : record.addresses) {
      index_.emplace(address, key);
    }
    for (const auto& mac : record.macs) {
      index_.emplace(mac.ToString(), key);
    }

    entries_.emplace(key, std::make_unique<Entry>(std::move(record)));
  }
}

std::vector<std::string> Registry::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    out.push_back(key);
  }
  return out;
}

std::vector<std::string> Registry::probe_keys() const {
  std::vector<std::string> out;
  for (const auto& [key, entry] : entries_) {
    if (!entry->record.ignored) {
      out.push_back(key);
    }
  }
  return out;
}

std::optional<std::string> Registry::resolve(const std::string& identifier) const {
  if (auto it = index_.find(identifier); it != index_.end()) {
    return it->second;
  }

  // Try the normalized spellings before giving up
  if (auto ip = util::ValidateAndNormalizeIP(identifier)) {
    if (auto it = index_.find(*ip); it != index_.end()) {
      return it->second;
    }
  }
  if (auto mac = util::MacAddress::Parse(identifier)) {
    if (auto it = index_.find(mac->ToString()); it != index_.end()) {
      return it->second;
    }
  }
  if (auto it = index_.find(util::ToLower(identifier)); it != index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<HostEntry> Registry::snapshot() const {
  std::vector<HostEntry> out;
  out.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    out.push_back(HostEntry{entry->record, entry->state});
  }
  return out;
}

std::optional<HostEntry> Registry::get(const std::string& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  std::shared_lock<std::shared_mutex> lock(it->second->mutex);
  return HostEntry{it->second->record, it->second->state};
}

const HostRecord* Registry::record(const std::string& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second->record;
}

std::optional<StatusTransition> Registry::update_state(const std::string& key, const ProbeResult& result,
                                                       const DebouncePolicy& policy) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    LOG_HOSTS_DEBUG("update_state: unknown host '{}'", key);
    return std::nullopt;
  }
  Entry& entry = *it->second;
  if (entry.record.ignored) {
    return std::nullopt;
  }

  const int64_t now = util::GetTime();
  std::unique_lock<std::shared_mutex> lock(entry.mutex);
  return ApplyProbeResult(entry.state, result, now, policy);
}

bool Registry::record_wake_attempt(const std::string& key, std::vector<MacSendResult> results) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  Entry& entry = *it->second;

  const int64_t now = util::GetTime();
  std::unique_lock<std::shared_mutex> lock(entry.mutex);
  entry.state.last_wake_attempt_at = now;
  entry.state.last_wake_results = std::move(results);
  return true;
}

std::vector<HostView> Registry::views() const {
  std::vector<HostView> out;
  out.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    NetworkState state;
    {
      std::shared_lock<std::shared_mutex> lock(entry->mutex);
      state = entry->state;
    }
    out.push_back(MakeHostView(entry->record, state));
  }
  return out;
}

std::optional<HostView> Registry::view(const std::string& key) const {
  auto entry = get(key);
  if (!entry) {
    return std::nullopt;
  }
  return MakeHostView(entry->record, entry->state);
}

}  // namespace hosts
}  // namespace lanwake
