// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Reachability probes

 HostProbe is the seam between the StateProber loop and the network. Each
 call receives the candidate addresses of one host and a deadline for the
 whole probe, and reports whether any address answered.

 TcpConnectProbe  - connect() to a few common service ports on every address
                    at once; an accepted or refused connection both prove the
                    host is up. Needs no privileges.
 IcmpEchoProbe    - classic ping over a raw ICMP/ICMPv6 socket. Needs
                    CAP_NET_RAW; without it every probe reports the socket
                    error and the host stays Offline.

 Probes never throw; failures are described in ProbeResult::detail.
*/

#include "hosts/host_record.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lanwake {
namespace network {

class HostProbe {
public:
  virtual ~HostProbe() = default;

  virtual hosts::ProbeResult probe(const std::vector<std::string>& addresses, std::chrono::milliseconds timeout) = 0;

  virtual const char* name() const = 0;
};

// ssh, http, https, smb, rdp
std::vector<uint16_t> DefaultProbePorts();

class TcpConnectProbe : public HostProbe {
public:
  explicit TcpConnectProbe(std::vector<uint16_t> ports = DefaultProbePorts());

  hosts::ProbeResult probe(const std::vector<std::string>& addresses, std::chrono::milliseconds timeout) override;
  const char* name() const override { return "tcp"; }

  const std::vector<uint16_t>& ports() const { return ports_; }

private:
  std::vector<uint16_t> ports_;
};

class IcmpEchoProbe : public HostProbe {
public:
  IcmpEchoProbe();

  hosts::ProbeResult probe(const std::vector<std::string>& addresses, std::chrono::milliseconds timeout) override;
  const char* name() const override { return "icmp"; }

private:
  bool ping_one(const std::string& address, std::chrono::milliseconds timeout, hosts::ProbeResult& result);

  uint16_t identifier_;
  std::atomic<uint16_t> next_sequence_{1};
};

// ICMP echo wire helpers (exposed for tests)
constexpr size_t ICMP_ECHO_HEADER_SIZE = 8;

// Echo request with a 16-byte payload. The ICMPv4 checksum is filled in;
// for ICMPv6 the kernel computes it over the pseudo header.
std::vector<uint8_t> BuildIcmpEchoRequest(bool ipv6, uint16_t identifier, uint16_t sequence);

// Internet checksum (RFC 1071)
uint16_t InternetChecksum(const uint8_t* data, size_t len);

// Whether a received datagram is the echo reply for (identifier, sequence).
// IPv4 raw sockets deliver the IP header in front of the ICMP message.
bool MatchIcmpEchoReply(bool ipv6, const uint8_t* data, size_t len, uint16_t identifier, uint16_t sequence);

/**
 * HostNameCache - short-lived cache of alias -> addresses lookups
 *
 * Hosts known only by name are resolved through the system resolver. Entries
 * (including failed lookups) are kept for ttl_seconds so a probe cycle every
 * few seconds does not hit the resolver every time.
 *
 * getaddrinfo cannot be cancelled, so each resolution runs on its own
 * detached thread and lookup() waits for it at most `timeout`. A lookup that
 * runs late still lands in the cache when it finishes; until then the name
 * resolves to nothing. Concurrent lookups of one name share a resolution.
 */
class HostNameCache {
public:
  // Blocking name -> addresses resolution; may take arbitrarily long
  using NameResolver = std::function<std::vector<std::string>(const std::string& name)>;

  explicit HostNameCache(int64_t ttl_seconds = 15, NameResolver resolver = {});

  // Normalized addresses for name, resolving on a miss or expired entry.
  // Returns an empty list if the resolution does not finish within timeout.
  std::vector<std::string> lookup(const std::string& name,
                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

  size_t size() const;
  void clear();

private:
  struct Entry {
    std::vector<std::string> addresses;
    int64_t resolved_at{0};
  };

  // Shared with resolver threads, which may outlive the cache
  struct State {
    std::mutex mutex;
    std::map<std::string, Entry> entries;
    std::map<std::string, std::shared_future<std::vector<std::string>>> pending;
  };

  int64_t ttl_seconds_;
  NameResolver resolver_;
  std::shared_ptr<State> state_;
};

// Resolve name with getaddrinfo and return the normalized, deduplicated addresses
std::vector<std::string> SystemResolve(const std::string& name);

/**
 * Addresses to probe for a host: its configured addresses, or, when it has
 * none, whatever its aliases resolve to within timeout. Addresses that can
 * never answer (unspecified, multicast, limited broadcast) are dropped.
 */
std::vector<std::string> ResolveProbeTargets(const hosts::HostRecord& record, HostNameCache& cache,
                                             std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

}  // namespace network
}  // namespace lanwake
