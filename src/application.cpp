// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "hosts/config_merger.hpp"
#include "hosts/registry.hpp"
#include "hosts/source_loader.hpp"
#include "network/host_probe.hpp"
#include "network/packet_sender.hpp"
#include "network/status_server.hpp"
#include "network/wol_dispatcher.hpp"
#include "util/interfaces.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace lanwake {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  LOG_INFO("Initializing {}...", GetFullVersionString());

  if (!load_registry()) {
    return false;
  }

  if (!init_network()) {
    LOG_ERROR("Failed to initialize network components");
    return false;
  }

  // Print startup banner (use std::cout for immediate visibility)
  std::cout << GetStartupBanner(bind_address_) << std::flush;

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::load_registry() {
  std::vector<hosts::SourceRecordBatch> batches;
  uint32_t order = 0;

  for (const auto& path : config_.hosts_files) {
    batches.push_back(hosts::LoadHostsFile(path, order++));
  }
  for (const auto& path : config_.ethers_files) {
    batches.push_back(hosts::LoadEthersFile(path, order++));
  }

  // Later config files win over earlier ones, and so does their `bind`
  std::optional<std::string> config_bind;
  for (const auto& path : config_.config_files) {
    auto config = hosts::LoadConfigFile(path, order++);
    if (config.bind) {
      config_bind = config.bind;
    }
    batches.push_back(std::move(config.batch));
  }

  if (!config_.ignore_hosts.empty()) {
    batches.push_back(hosts::MakeIgnoreBatch(config_.ignore_hosts));
  }

  registry_ = hosts::ConfigMerger::build_registry(std::move(batches));

  if (registry_->empty()) {
    if (config_.require_hosts) {
      LOG_ERROR("No hosts configured (checked {} hosts, {} ethers and {} config files)", config_.hosts_files.size(),
                config_.ethers_files.size(), config_.config_files.size());
      return false;
    }
    LOG_WARN("No hosts configured; the registry is empty");
  }

  if (config_.bind) {
    bind_address_ = *config_.bind;
  } else if (config_bind) {
    bind_address_ = *config_bind;
  } else {
    bind_address_ = DEFAULT_BIND;
  }
  return true;
}

bool Application::init_network() {
  std::string bind_host;
  uint16_t bind_port = 0;
  if (!util::ParseHostPort(bind_address_, bind_host, bind_port)) {
    LOG_ERROR("Invalid bind address '{}', expected host:port", bind_address_);
    return false;
  }

  switch (config_.probe_kind) {
  case ProbeKind::Tcp:
    probe_ = std::make_unique<network::TcpConnectProbe>(config_.probe_ports);
    break;
  case ProbeKind::Icmp:
    probe_ = std::make_unique<network::IcmpEchoProbe>();
    break;
  }

  network::WolConfig wol;
  wol.port = config_.wol_port;
  wol.default_broadcast = config_.wol_broadcast;
  wol.interfaces = util::ListInterfaces();
  for (const auto& iface : wol.interfaces) {
    LOG_WOL_DEBUG("Interface {}: {}/{} broadcast {}", iface.name, iface.address, iface.netmask,
                  iface.broadcast.empty() ? "-" : iface.broadcast);
  }

  sender_ = std::make_unique<network::UdpBroadcastSender>();
  dispatcher_ = std::make_unique<network::WolDispatcher>(*registry_, *sender_, std::move(wol));
  prober_ = std::make_unique<network::StateProber>(*registry_, *probe_, config_.prober);
  server_ = std::make_unique<network::StatusServer>(bind_host, bind_port, *registry_, *dispatcher_);
  return true;
}

bool Application::start() {
  if (running_) {
    return true;
  }
  if (!server_ || !prober_) {
    LOG_ERROR("Application::start() called before initialize()");
    return false;
  }

  // Failing to bind is fatal: without the HTTP server nothing can be woken
  if (!server_->Start()) {
    LOG_ERROR("Failed to start HTTP server on {}", bind_address_);
    return false;
  }

  prober_->start();

  running_ = true;
  LOG_INFO("{} started", CLIENT_NAME);
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down...");
  running_ = false;

  // Stop the HTTP server first (stop accepting new requests)
  if (server_) {
    LOG_INFO("Stopping HTTP server...");
    server_->Stop();
  }

  if (prober_) {
    LOG_INFO("Stopping prober...");
    prober_->stop();
  }

  LOG_INFO("Shutdown complete");
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    stop();
  }
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace lanwake
