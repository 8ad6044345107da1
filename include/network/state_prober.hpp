// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 StateProber: background liveness polling for every non-ignored host

 One long-lived thread runs a cycle, then sleeps for `interval` (or until
 stop() wakes it). A cycle fans out over at most `max_in_flight` worker
 threads that pull host keys from a shared index; each probe is bounded by
 `timeout`, so a cycle takes roughly ceil(hosts / max_in_flight) * timeout in
 the worst case. Resolving the aliases of a host without addresses shares
 that same bound.

 Probe failures are ordinary events. A probe that throws is logged
 (rate-limited) and recorded as a failed probe for that host only.

 Tests call run_cycle() directly; no timers are involved.
*/

#include "hosts/host_record.hpp"
#include "network/host_probe.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lanwake {
namespace hosts {
class Registry;
}  // namespace hosts

namespace network {

struct ProberConfig {
  std::chrono::milliseconds interval{5000};
  std::chrono::milliseconds timeout{1000};
  hosts::DebouncePolicy debounce;
  size_t max_in_flight{16};
  // Alias resolution for hosts without addresses; empty means getaddrinfo
  HostNameCache::NameResolver resolver;
};

struct CycleStats {
  size_t probed{0};
  size_t reachable{0};
  size_t transitions{0};
  size_t errors{0};  // probes that threw
};

class StateProber {
public:
  StateProber(hosts::Registry& registry, HostProbe& probe, ProberConfig config = {});
  ~StateProber();

  StateProber(const StateProber&) = delete;
  StateProber& operator=(const StateProber&) = delete;

  // Probe every non-ignored host once and apply the results
  CycleStats run_cycle();

  // Start/stop the background thread. start() returns false if already running.
  bool start();
  void stop();

  bool is_running() const { return running_.load(); }
  uint64_t cycles_completed() const { return cycles_.load(); }
  const ProberConfig& config() const { return config_; }

private:
  void prober_loop();
  hosts::ProbeResult probe_host(const std::string& key);

  hosts::Registry& registry_;
  HostProbe& probe_;
  ProberConfig config_;
  HostNameCache name_cache_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint64_t> cycles_{0};

  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::unique_ptr<std::thread> prober_thread_;
};

}  // namespace network
}  // namespace lanwake
