// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Registry: canonical host store shared by the prober, the wake dispatcher
 and the HTTP layer

 Ownership:
 - Built once by ConfigMerger; the key set never changes afterwards
 - HostRecord identity is immutable after construction
 - NetworkState is the only mutable part, one std::shared_mutex per host

 Locking:
 - Readers (snapshot/get/views) take shared locks one entry at a time, so a
   slow reader never blocks the prober from updating other hosts
 - Writers (update_state/record_wake_attempt) take the exclusive lock of a
   single entry; a reader sees either the old or the new state, never a mix
 - No call holds more than one entry lock at once

 Lookup:
 - Entries are addressed by canonical key
 - resolve() maps any alias, address or MAC of a host back to its key
*/

#include "hosts/host_record.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lanwake {
namespace hosts {

struct HostEntry {
  HostRecord record;
  NetworkState state;
};

// HostView - HTTP-facing projection of one host
struct HostView {
  std::string key;
  std::string display_name;
  std::vector<std::string> aliases;
  std::vector<std::string> addresses;
  std::vector<std::string> macs;
  HostStatus status{HostStatus::Unknown};
  bool can_wake{false};
  bool ignored{false};
  std::optional<int64_t> last_probe_at;
  std::optional<int64_t> last_online_at;
  std::optional<int64_t> last_wake_attempt_at;
  std::string last_probe_address;
  std::string last_probe_detail;
  std::vector<MacSendResult> last_wake_results;
};

HostView MakeHostView(const HostRecord& record, const NetworkState& state);

class Registry {
public:
  // Records must have unique canonical keys; a duplicate key keeps the
  // first record and is logged.
  explicit Registry(std::vector<HostRecord> records);

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  bool contains(const std::string& key) const { return entries_.count(key) > 0; }

  // Canonical keys in order
  std::vector<std::string> keys() const;

  // Keys of hosts the prober should visit (everything not ignored)
  std::vector<std::string> probe_keys() const;

  // Map an alias, address, MAC text or canonical key to a canonical key
  std::optional<std::string> resolve(const std::string& identifier) const;

  // Consistent copy of every (record, state) pair, ordered by key
  std::vector<HostEntry> snapshot() const;

  std::optional<HostEntry> get(const std::string& key) const;

  // Immutable identity of a host (no lock needed)
  const HostRecord* record(const std::string& key) const;

  /**
   * Apply a probe result to the host's NetworkState
   *
   * Returns the status transition if one happened. Unknown keys and ignored
   * hosts are left untouched and return nullopt.
   */
  std::optional<StatusTransition> update_state(const std::string& key, const ProbeResult& result,
                                               const DebouncePolicy& policy);

  // Record a wake attempt (timestamp + per-MAC outcome).
  // Returns false for unknown keys.
  bool record_wake_attempt(const std::string& key, std::vector<MacSendResult> results);

  std::vector<HostView> views() const;
  std::optional<HostView> view(const std::string& key) const;

private:
  struct Entry {
    explicit Entry(HostRecord r) : record(std::move(r)) {}

    const HostRecord record;
    mutable std::shared_mutex mutex;
    NetworkState state;
  };

  std::map<std::string, std::unique_ptr<Entry>> entries_;
  std::map<std::string, std::string> index_;  // identifier -> canonical key
};

}  // namespace hosts
}  // namespace lanwake
