// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <sstream>

namespace lanwake {
namespace app {

namespace {

// "--name=value" -> value, when arg has that prefix
bool TakeValue(const std::string& arg, const std::string& name, std::string& value) {
  const std::string prefix = "--" + name + "=";
  if (!arg.starts_with(prefix)) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

bool ParseMilliseconds(const std::string& text, int64_t min_ms, std::chrono::milliseconds& out) {
  auto value = util::SafeParseInt64(text);
  if (!value || *value < min_ms) {
    return false;
  }
  out = std::chrono::milliseconds(*value);
  return true;
}

CommandLine Fail(std::string message) {
  CommandLine result;
  result.action = CommandLine::Action::Error;
  result.error = std::move(message);
  return result;
}

}  // namespace

CommandLine ParseCommandLine(const std::vector<std::string>& args) {
  CommandLine result;
  AppConfig& config = result.config;

  // Repeatable options replace their default on first use
  bool config_given = false;
  bool hosts_given = false;
  bool ethers_given = false;

  for (const auto& arg : args) {
    std::string value;

    if (arg == "--help" || arg == "-h") {
      result.action = CommandLine::Action::Help;
      return result;
    } else if (arg == "--version" || arg == "-v") {
      result.action = CommandLine::Action::Version;
      return result;
    } else if (TakeValue(arg, "config", value)) {
      if (value.empty()) {
        return Fail("--config requires a non-empty path");
      }
      if (!config_given) {
        config.config_files.clear();
        config_given = true;
      }
      config.config_files.emplace_back(value);
    } else if (TakeValue(arg, "hosts", value)) {
      if (value.empty()) {
        return Fail("--hosts requires a non-empty path");
      }
      if (!hosts_given) {
        config.hosts_files.clear();
        hosts_given = true;
      }
      config.hosts_files.emplace_back(value);
    } else if (TakeValue(arg, "ethers", value)) {
      if (value.empty()) {
        return Fail("--ethers requires a non-empty path");
      }
      if (!ethers_given) {
        config.ethers_files.clear();
        ethers_given = true;
      }
      config.ethers_files.emplace_back(value);
    } else if (arg == "--no-config") {
      config.config_files.clear();
      config_given = true;
    } else if (arg == "--no-hosts") {
      config.hosts_files.clear();
      hosts_given = true;
    } else if (arg == "--no-ethers") {
      config.ethers_files.clear();
      ethers_given = true;
    } else if (TakeValue(arg, "ignore-host", value)) {
      if (value.empty()) {
        return Fail("--ignore-host requires a host name");
      }
      config.ignore_hosts.push_back(value);
    } else if (TakeValue(arg, "bind", value)) {
      std::string host;
      uint16_t port = 0;
      if (!util::ParseHostPort(value, host, port)) {
        return Fail("Invalid --bind address '" + value + "', expected host:port");
      }
      config.bind = value;
    } else if (TakeValue(arg, "wol-port", value)) {
      auto port = util::SafeParsePort(value);
      if (!port) {
        return Fail("Invalid --wol-port '" + value + "' (must be 1-65535)");
      }
      config.wol_port = *port;
    } else if (TakeValue(arg, "wol-broadcast", value)) {
      auto address = util::ValidateAndNormalizeIP(value);
      if (!address || !util::IsIPv4(*address)) {
        return Fail("Invalid --wol-broadcast '" + value + "' (must be an IPv4 address)");
      }
      config.wol_broadcast = *address;
    } else if (TakeValue(arg, "probe", value)) {
      if (value == "tcp") {
        config.probe_kind = ProbeKind::Tcp;
      } else if (value == "icmp") {
        config.probe_kind = ProbeKind::Icmp;
      } else {
        return Fail("Invalid --probe '" + value + "' (expected tcp or icmp)");
      }
    } else if (TakeValue(arg, "probe-port", value)) {
      auto port = util::SafeParsePort(value);
      if (!port) {
        return Fail("Invalid --probe-port '" + value + "' (must be 1-65535)");
      }
      config.probe_ports.push_back(*port);
    } else if (TakeValue(arg, "probe-interval", value)) {
      if (!ParseMilliseconds(value, 100, config.prober.interval)) {
        return Fail("Invalid --probe-interval '" + value + "' (milliseconds, at least 100)");
      }
    } else if (TakeValue(arg, "probe-timeout", value)) {
      if (!ParseMilliseconds(value, 1, config.prober.timeout)) {
        return Fail("Invalid --probe-timeout '" + value + "' (milliseconds, at least 1)");
      }
    } else if (TakeValue(arg, "success-threshold", value)) {
      auto n = util::SafeParseUInt32(value);
      if (!n || *n == 0) {
        return Fail("Invalid --success-threshold '" + value + "' (must be at least 1)");
      }
      config.prober.debounce.success_threshold = *n;
    } else if (TakeValue(arg, "failure-threshold", value)) {
      auto n = util::SafeParseUInt32(value);
      if (!n || *n == 0) {
        return Fail("Invalid --failure-threshold '" + value + "' (must be at least 1)");
      }
      config.prober.debounce.failure_threshold = *n;
    } else if (TakeValue(arg, "max-probes", value)) {
      auto n = util::SafeParseUInt32(value);
      if (!n || *n == 0 || *n > 256) {
        return Fail("Invalid --max-probes '" + value + "' (must be 1-256)");
      }
      config.prober.max_in_flight = *n;
    } else if (arg == "--require-hosts") {
      config.require_hosts = true;
    } else if (TakeValue(arg, "loglevel", value)) {
      if (value != "trace" && value != "debug" && value != "info" && value != "warn" && value != "error" &&
          value != "critical" && value != "off") {
        return Fail("Invalid --loglevel '" + value + "'");
      }
      config.log_level = value;
    } else if (TakeValue(arg, "debug", value)) {
      if (value.empty()) {
        return Fail("--debug requires a component (hosts, probe, wol, http, all)");
      }
      config.debug_components.push_back(value);
    } else if (TakeValue(arg, "logfile", value)) {
      if (value.empty()) {
        return Fail("--logfile requires a non-empty path");
      }
      config.log_file = value;
    } else {
      return Fail("Unknown option: " + arg);
    }
  }

  return result;
}

std::string GetUsage(const std::string& program_name) {
  std::ostringstream oss;
  oss << "lanwaked - host registry and Wake-on-LAN service\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Host sources (repeatable; giving one replaces the default):\n"
      << "  --config=<path>            TOML overlay (default: " << DEFAULT_CONFIG_PATH << ")\n"
      << "  --hosts=<path>             hosts(5) file (default: " << DEFAULT_HOSTS_PATH << ")\n"
      << "  --ethers=<path>            ethers(5) file (default: " << DEFAULT_ETHERS_PATH << ")\n"
      << "  --no-config, --no-hosts, --no-ethers\n"
      << "                             Do not read the default file\n"
      << "  --ignore-host=<name>       Never probe this host (repeatable)\n"
      << "  --require-hosts            Exit with an error if no host is configured\n"
      << "\n"
      << "Server:\n"
      << "  --bind=<host:port>         HTTP listen address (default: " << DEFAULT_BIND << ")\n"
      << "\n"
      << "Wake-on-LAN:\n"
      << "  --wol-port=<port>          UDP port for magic packets (default: 9)\n"
      << "  --wol-broadcast=<ipv4>     Fallback broadcast address (default: 255.255.255.255)\n"
      << "\n"
      << "Probing:\n"
      << "  --probe=<tcp|icmp>         Reachability probe (default: tcp)\n"
      << "  --probe-port=<port>        TCP probe port (repeatable; default: 22,80,443,445,3389)\n"
      << "  --probe-interval=<ms>      Time between probe cycles (default: 5000)\n"
      << "  --probe-timeout=<ms>       Per-host probe timeout (default: 1000)\n"
      << "  --success-threshold=<n>    Successes before a host is Online (default: 1)\n"
      << "  --failure-threshold=<n>    Failures before an Online host is Offline (default: 2)\n"
      << "  --max-probes=<n>           Concurrent probes per cycle (default: 16)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>         trace, debug, info, warn, error, critical, off (default: info)\n"
      << "  --debug=<component>        Debug logging for hosts, probe, wol, http or all\n"
      << "  --logfile=<path>           Also write logs to this file\n"
      << "\n"
      << "  --version                  Show version information\n"
      << "  --help                     Show this help message\n";
  return oss.str();
}

}  // namespace app
}  // namespace lanwake
