// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "hosts/host_record.hpp"

#include <algorithm>

namespace lanwake {
namespace hosts {

const char* HostStatusName(HostStatus status) {
  switch (status) {
  case HostStatus::Unknown:
    return "unknown";
  case HostStatus::Online:
    return "online";
  case HostStatus::Offline:
    return "offline";
  }
  return "unknown";
}

std::optional<StatusTransition> ApplyProbeResult(NetworkState& state, const ProbeResult& result, int64_t now,
                                                 const DebouncePolicy& policy) {
  const HostStatus before = state.status;
  // A threshold of 0 would mean "transition without evidence"; treat it as 1
  const uint32_t success_threshold = std::max<uint32_t>(policy.success_threshold, 1);
  const uint32_t failure_threshold = std::max<uint32_t>(policy.failure_threshold, 1);

  state.last_probe_at = now;
  state.last_probe_address = result.address;
  state.last_probe_detail = result.detail;

  if (result.reachable) {
    state.consecutive_successes++;
    state.consecutive_failures = 0;
    if (state.status != HostStatus::Online && state.consecutive_successes >= success_threshold) {
      state.status = HostStatus::Online;
    }
    if (state.status == HostStatus::Online) {
      state.last_online_at = now;
    }
  } else {
    state.consecutive_failures++;
    state.consecutive_successes = 0;
    if (state.status == HostStatus::Unknown) {
      state.status = HostStatus::Offline;
    } else if (state.status == HostStatus::Online && state.consecutive_failures >= failure_threshold) {
      state.status = HostStatus::Offline;
    }
  }

  if (state.status != before) {
    return StatusTransition{before, state.status};
  }
  return std::nullopt;
}

}  // namespace hosts
}  // namespace lanwake
