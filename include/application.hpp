// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/state_prober.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanwake {

namespace hosts {
class Registry;
}  // namespace hosts

namespace network {
class HostProbe;
class PacketSender;
class StatusServer;
class WolDispatcher;
}  // namespace network

namespace app {

constexpr const char* DEFAULT_BIND = "127.0.0.1:3000";
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/lanwake/config.toml";
constexpr const char* DEFAULT_HOSTS_PATH = "/etc/hosts";
constexpr const char* DEFAULT_ETHERS_PATH = "/etc/ethers";

enum class ProbeKind {
  Tcp,
  Icmp,
};

struct AppConfig {
  // Host sources; an explicit option replaces the default list
  std::vector<std::filesystem::path> config_files{DEFAULT_CONFIG_PATH};
  std::vector<std::filesystem::path> hosts_files{DEFAULT_HOSTS_PATH};
  std::vector<std::filesystem::path> ethers_files{DEFAULT_ETHERS_PATH};
  std::vector<std::string> ignore_hosts;

  // --bind beats the `bind` key of the config files, which beats DEFAULT_BIND
  std::optional<std::string> bind;

  // Wake-on-LAN
  uint16_t wol_port{9};
  std::string wol_broadcast{"255.255.255.255"};

  // Probing
  ProbeKind probe_kind{ProbeKind::Tcp};
  std::vector<uint16_t> probe_ports;  // empty = TcpConnectProbe defaults
  network::ProberConfig prober;
  bool require_hosts{false};

  // Logging
  std::string log_level{"info"};
  std::vector<std::string> debug_components;
  std::optional<std::string> log_file;
};

struct CommandLine {
  enum class Action {
    Run,
    Help,
    Version,
    Error,
  };

  Action action{Action::Run};
  AppConfig config;
  std::string error;
};

// Parse lanwaked arguments (without argv[0])
CommandLine ParseCommandLine(const std::vector<std::string>& args);

std::string GetUsage(const std::string& program_name);

/**
 * Application - wires the daemon together
 *
 * initialize(): load sources -> merge -> Registry, create probe, sender,
 *               dispatcher, prober and HTTP server
 * start():      bind the HTTP server (fatal on failure), start the prober
 * stop():       reverse order: server, then prober
 */
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  bool initialize();
  bool start();
  void stop();

  // Block until a signal (or request_shutdown) arrives, then stop
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  hosts::Registry* registry() { return registry_.get(); }
  network::WolDispatcher* dispatcher() { return dispatcher_.get(); }
  const std::string& bind_address() const { return bind_address_; }

  static Application* instance();
  static void signal_handler(int signal);

private:
  bool load_registry();
  bool init_network();

  AppConfig config_;
  std::string bind_address_;

  std::unique_ptr<hosts::Registry> registry_;
  std::unique_ptr<network::HostProbe> probe_;
  std::unique_ptr<network::PacketSender> sender_;
  std::unique_ptr<network::WolDispatcher> dispatcher_;
  std::unique_ptr<network::StateProber> prober_;
  std::unique_ptr<network::StatusServer> server_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace lanwake
