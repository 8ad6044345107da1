// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/state_prober.hpp"

#include "hosts/registry.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <vector>

namespace lanwake {
namespace network {

StateProber::StateProber(hosts::Registry& registry, HostProbe& probe, ProberConfig config)
    : registry_(registry), probe_(probe), config_(std::move(config)), name_cache_(15, config_.resolver) {
  if (config_.max_in_flight == 0) {
    config_.max_in_flight = 1;
  }
}

StateProber::~StateProber() {
  stop();
}

hosts::ProbeResult StateProber::probe_host(const std::string& key) {
  const hosts::HostRecord* record = registry_.record(key);
  if (!record) {
    hosts::ProbeResult result;
    result.detail = "unknown host";
    return result;
  }

  const auto start = std::chrono::steady_clock::now();
  auto targets = ResolveProbeTargets(*record, name_cache_, config_.timeout);
  if (targets.empty()) {
    hosts::ProbeResult result;
    result.detail = record->addresses.empty() ? "no address (name did not resolve)" : "no probeable address";
    return result;
  }
  // Time spent resolving comes out of the probe's budget
  auto remaining = config_.timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - start);
  return probe_.probe(targets, std::max(remaining, std::chrono::milliseconds(1)));
}

CycleStats StateProber::run_cycle() {
  const std::vector<std::string> keys = registry_.probe_keys();

  std::atomic<size_t> next_index{0};
  std::mutex stats_mutex;
  CycleStats stats;

  auto worker = [&]() {
    while (!stop_requested_.load()) {
      const size_t index = next_index.fetch_add(1);
      if (index >= keys.size()) {
        return;
      }
      const std::string& key = keys[index];

      hosts::ProbeResult result;
      bool threw = false;
      try {
        result = probe_host(key);
      } catch (const std::exception& e) {
        LOG_PROBE_WARN_RL("Probe of {} failed with exception: {}", key, e.what());
        result = hosts::ProbeResult{};
        result.detail = std::string("probe error: ") + e.what();
        threw = true;
      }

      auto transition = registry_.update_state(key, result, config_.debounce);
      if (transition) {
        LOG_PROBE_INFO("{} is now {} (was {}): {}", key, hosts::HostStatusName(transition->to),
                       hosts::HostStatusName(transition->from), result.detail);
      } else {
        LOG_PROBE_TRACE("{}: {} via {} ({})", key, result.reachable ? "reachable" : "unreachable", result.address,
                        result.detail);
      }

      std::lock_guard<std::mutex> lock(stats_mutex);
      stats.probed++;
      if (result.reachable) {
        stats.reachable++;
      }
      if (transition) {
        stats.transitions++;
      }
      if (threw) {
        stats.errors++;
      }
    }
  };

  const size_t worker_count = std::min(config_.max_in_flight, keys.size());
  if (worker_count <= 1) {
    worker();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
    for (auto& t : workers) {
      t.join();
    }
  }

  LOG_PROBE_DEBUG("Probe cycle: {} probed, {} reachable, {} transitions", stats.probed, stats.reachable,
                  stats.transitions);
  return stats;
}

bool StateProber::start() {
  if (running_.exchange(true)) {
    return false;
  }
  stop_requested_ = false;

  LOG_PROBE_INFO("Starting {} prober for {} hosts (interval {} ms, timeout {} ms, {} workers)", probe_.name(),
                 registry_.probe_keys().size(), config_.interval.count(), config_.timeout.count(),
                 config_.max_in_flight);
  prober_thread_ = std::make_unique<std::thread>(&StateProber::prober_loop, this);
  return true;
}

void StateProber::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();

  if (prober_thread_ && prober_thread_->joinable()) {
    LOG_PROBE_DEBUG("Stopping prober thread");
    prober_thread_->join();
    prober_thread_.reset();
  }
  running_ = false;
}

void StateProber::prober_loop() {
  while (!stop_requested_.load()) {
    run_cycle();
    cycles_++;

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, config_.interval, [this] { return stop_requested_.load(); });
  }
}

}  // namespace network
}  // namespace lanwake
