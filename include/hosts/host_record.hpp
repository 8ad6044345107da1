// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/mac_address.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lanwake {
namespace hosts {

// HostRecord - canonical identity of one physical host after merging
struct HostRecord {
  std::string canonical_key;  // never changes once assigned
  std::set<std::string> aliases;
  std::set<std::string> addresses;
  std::set<util::MacAddress> macs;
  std::optional<std::string> preferred_name;
  std::optional<std::string> broadcast;
  bool ignored{false};

  // preferred_name if set, otherwise the canonical key
  const std::string& display_name() const { return preferred_name ? *preferred_name : canonical_key; }

  bool can_wake() const { return !macs.empty(); }

  bool operator==(const HostRecord&) const = default;
};

enum class HostStatus : uint8_t {
  Unknown,
  Online,
  Offline,
};

const char* HostStatusName(HostStatus status);

// Outcome of one reachability probe against a host
struct ProbeResult {
  bool reachable{false};
  std::string address;  // address that answered, or the last one tried
  std::string detail;   // "connected", "refused", "timeout", resolver error, ...
  uint32_t rtt_ms{0};
};

// Outcome of sending one magic packet
struct MacSendResult {
  util::MacAddress mac;
  bool sent{false};
  std::string target;  // "192.168.1.255:9"
  std::string error;   // empty when sent

  bool operator==(const MacSendResult&) const = default;
};

/**
 * Debounce thresholds for status transitions
 *
 * Marking a host Online is fast (success_threshold defaults to 1), marking an
 * Online host Offline needs failure_threshold consecutive failures so a single
 * dropped probe never flips the view. From Unknown one failure is enough.
 */
struct DebouncePolicy {
  uint32_t success_threshold{1};
  uint32_t failure_threshold{2};
};

// NetworkState - liveness tracking for one host
struct NetworkState {
  HostStatus status{HostStatus::Unknown};
  uint32_t consecutive_failures{0};
  uint32_t consecutive_successes{0};
  std::optional<int64_t> last_probe_at;
  std::optional<int64_t> last_online_at;
  std::optional<int64_t> last_wake_attempt_at;
  std::string last_probe_address;
  std::string last_probe_detail;
  std::vector<MacSendResult> last_wake_results;

  bool operator==(const NetworkState&) const = default;
};

struct StatusTransition {
  HostStatus from;
  HostStatus to;
};

// Apply one probe outcome to state at time `now`. Returns the transition if
// the status changed. This is the only place status is ever modified.
std::optional<StatusTransition> ApplyProbeResult(NetworkState& state, const ProbeResult& result, int64_t now,
                                                 const DebouncePolicy& policy);

}  // namespace hosts
}  // namespace lanwake
