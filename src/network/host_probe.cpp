// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/host_probe.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <set>
#include <thread>

#include <unistd.h>

#include <asio.hpp>

namespace lanwake {
namespace network {

namespace {

constexpr uint8_t ICMPV4_ECHO_REQUEST = 8;
constexpr uint8_t ICMPV4_ECHO_REPLY = 0;
constexpr uint8_t ICMPV6_ECHO_REQUEST = 128;
constexpr uint8_t ICMPV6_ECHO_REPLY = 129;

constexpr size_t ICMP_ECHO_PAYLOAD_SIZE = 16;

uint32_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  auto elapsed = std::chrono::steady_clock::now() - start;
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

uint16_t ReadBE16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

void WriteBE16(uint8_t* p, uint16_t value) {
  p[0] = static_cast<uint8_t>(value >> 8);
  p[1] = static_cast<uint8_t>(value & 0xFF);
}

}  // namespace

std::vector<uint16_t> DefaultProbePorts() {
  return {22, 80, 443, 445, 3389};
}

// ============================================================================
// TcpConnectProbe
// ============================================================================

TcpConnectProbe::TcpConnectProbe(std::vector<uint16_t> ports) : ports_(std::move(ports)) {
  if (ports_.empty()) {
    ports_ = DefaultProbePorts();
  }
}

hosts::ProbeResult TcpConnectProbe::probe(const std::vector<std::string>& addresses,
                                          std::chrono::milliseconds timeout) {
  hosts::ProbeResult result;
  if (addresses.empty()) {
    result.detail = "no address to probe";
    return result;
  }
  result.address = addresses.front();

  try {
    asio::io_context io;
    asio::steady_timer deadline(io, timeout);
    std::vector<std::unique_ptr<asio::ip::tcp::socket>> sockets;
    const auto start = std::chrono::steady_clock::now();

    bool done = false;
    size_t pending = 0;
    std::string last_error;

    auto finish = [&]() {
      done = true;
      deadline.cancel();
      for (auto& socket : sockets) {
        asio::error_code ignored;
        socket->close(ignored);
      }
    };

    // Every (address, port) pair is attempted concurrently; the first answer wins
    for (const auto& address : addresses) {
      asio::error_code ec;
      auto ip = asio::ip::make_address(address, ec);
      if (ec) {
        last_error = "invalid address '" + address + "'";
        continue;
      }

      for (uint16_t port : ports_) {
        auto socket = std::make_unique<asio::ip::tcp::socket>(io);
        asio::ip::tcp::socket& sock = *socket;
        sockets.push_back(std::move(socket));
        pending++;

        sock.async_connect(asio::ip::tcp::endpoint(ip, port), [&, address, port](const asio::error_code& connect_ec) {
          pending--;
          if (done) {
            return;
          }
          if (!connect_ec || connect_ec == asio::error::connection_refused) {
            result.reachable = true;
            result.address = address;
            result.detail = (!connect_ec ? "connected to port " : "refused on port ") + std::to_string(port);
            result.rtt_ms = ElapsedMs(start);
            finish();
            return;
          }
          if (connect_ec != asio::error::operation_aborted) {
            last_error = connect_ec.message();
          }
          if (pending == 0) {
            finish();
          }
        });
      }
    }

    if (pending == 0) {
      result.detail = last_error.empty() ? "no address to probe" : last_error;
      return result;
    }

    deadline.async_wait([&](const asio::error_code& ec) {
      if (ec || done) {
        return;
      }
      result.detail = "timeout";
      finish();
    });

    io.run();

    if (!result.reachable && result.detail.empty()) {
      result.detail = last_error.empty() ? "timeout" : last_error;
    }
  } catch (const std::exception& e) {
    result.reachable = false;
    result.detail = e.what();
  }

  return result;
}

// ============================================================================
// IcmpEchoProbe
// ============================================================================

uint16_t InternetChecksum(const uint8_t* data, size_t len) {
  uint32_t sum = 0;
  size_t i = 0;
  for (; i + 1 < len; i += 2) {
    sum += ReadBE16(data + i);
  }
  if (i < len) {
    sum += static_cast<uint32_t>(data[i]) << 8;
  }
  while (sum >> 16) {
    sum = (sum & 0xFFFF) + (sum >> 16);
  }
  return static_cast<uint16_t>(~sum & 0xFFFF);
}

std::vector<uint8_t> BuildIcmpEchoRequest(bool ipv6, uint16_t identifier, uint16_t sequence) {
  std::vector<uint8_t> packet(ICMP_ECHO_HEADER_SIZE + ICMP_ECHO_PAYLOAD_SIZE, 0);
  packet[0] = ipv6 ? ICMPV6_ECHO_REQUEST : ICMPV4_ECHO_REQUEST;
  packet[1] = 0;  // code
  WriteBE16(&packet[4], identifier);
  WriteBE16(&packet[6], sequence);

  static constexpr char kPayload[] = "lanwake-probe...";
  std::copy(kPayload, kPayload + ICMP_ECHO_PAYLOAD_SIZE, packet.begin() + ICMP_ECHO_HEADER_SIZE);

  if (!ipv6) {
    WriteBE16(&packet[2], InternetChecksum(packet.data(), packet.size()));
  }
  return packet;
}

bool MatchIcmpEchoReply(bool ipv6, const uint8_t* data, size_t len, uint16_t identifier, uint16_t sequence) {
  size_t offset = 0;
  if (!ipv6) {
    if (len < 20 || (data[0] >> 4) != 4) {
      return false;
    }
    offset = static_cast<size_t>(data[0] & 0x0F) * 4;
  }
  if (len < offset + ICMP_ECHO_HEADER_SIZE) {
    return false;
  }

  const uint8_t* icmp = data + offset;
  const uint8_t expected_type = ipv6 ? ICMPV6_ECHO_REPLY : ICMPV4_ECHO_REPLY;
  return icmp[0] == expected_type && icmp[1] == 0 && ReadBE16(icmp + 4) == identifier &&
         ReadBE16(icmp + 6) == sequence;
}

IcmpEchoProbe::IcmpEchoProbe() : identifier_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {}

hosts::ProbeResult IcmpEchoProbe::probe(const std::vector<std::string>& addresses,
                                        std::chrono::milliseconds timeout) {
  hosts::ProbeResult result;
  if (addresses.empty()) {
    result.detail = "no address to probe";
    return result;
  }

  // Addresses are tried in order and share one deadline
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (const auto& address : addresses) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      if (result.detail.empty()) {
        result.detail = "timeout";
      }
      break;
    }
    result.address = address;
    if (ping_one(address, remaining, result)) {
      return result;
    }
  }
  return result;
}

bool IcmpEchoProbe::ping_one(const std::string& address, std::chrono::milliseconds timeout,
                             hosts::ProbeResult& result) {
  try {
    asio::io_context io;

    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      result.detail = "invalid address '" + address + "'";
      return false;
    }
    const bool ipv6 = ip.is_v6();

    asio::ip::icmp::socket socket(io);
    socket.open(ipv6 ? asio::ip::icmp::v6() : asio::ip::icmp::v4(), ec);
    if (ec) {
      result.detail = "raw socket: " + ec.message();
      return false;
    }

    const uint16_t sequence = next_sequence_.fetch_add(1);
    auto request = BuildIcmpEchoRequest(ipv6, identifier_, sequence);
    const auto start = std::chrono::steady_clock::now();

    socket.send_to(asio::buffer(request), asio::ip::icmp::endpoint(ip, 0), 0, ec);
    if (ec) {
      result.detail = "sendto: " + ec.message();
      return false;
    }

    std::array<uint8_t, 1500> buffer{};
    asio::ip::icmp::endpoint sender;
    bool matched = false;

    asio::steady_timer timer(io, timeout);
    timer.async_wait([&](const asio::error_code& timer_ec) {
      if (!timer_ec) {
        asio::error_code ignored;
        socket.cancel(ignored);
      }
    });

    // Raw sockets see every echo reply on the host; keep reading until ours
    // arrives or the timer cancels the read
    std::function<void()> receive = [&]() {
      socket.async_receive_from(asio::buffer(buffer), sender, [&](const asio::error_code& recv_ec, size_t len) {
        if (recv_ec) {
          return;
        }
        if (sender.address() == ip && MatchIcmpEchoReply(ipv6, buffer.data(), len, identifier_, sequence)) {
          matched = true;
          timer.cancel();
          return;
        }
        receive();
      });
    };
    receive();

    io.run();

    if (matched) {
      result.reachable = true;
      result.address = address;
      result.detail = "echo reply";
      result.rtt_ms = ElapsedMs(start);
      return true;
    }
    result.detail = "timeout";
    return false;
  } catch (const std::exception& e) {
    result.detail = e.what();
    return false;
  }
}

// ============================================================================
// Target selection
// ============================================================================

std::vector<std::string> SystemResolve(const std::string& name) {
  std::set<std::string> found;
  try {
    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    asio::error_code ec;
    auto results = resolver.resolve(name, "0", ec);
    if (ec) {
      LOG_PROBE_DEBUG("Failed to resolve {}: {}", name, ec.message());
    } else {
      for (const auto& entry : results) {
        if (auto normalized = util::ValidateAndNormalizeIP(entry.endpoint().address().to_string())) {
          found.insert(*normalized);
        }
      }
    }
  } catch (const std::exception& e) {
    LOG_PROBE_DEBUG("Exception resolving {}: {}", name, e.what());
  }
  return std::vector<std::string>(found.begin(), found.end());
}

HostNameCache::HostNameCache(int64_t ttl_seconds, NameResolver resolver)
    : ttl_seconds_(ttl_seconds), resolver_(std::move(resolver)), state_(std::make_shared<State>()) {
  if (!resolver_) {
    resolver_ = SystemResolve;
  }
}

std::vector<std::string> HostNameCache::lookup(const std::string& name, std::chrono::milliseconds timeout) {
  std::shared_future<std::vector<std::string>> result;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->entries.find(name);
    if (it != state_->entries.end() && util::GetTime() - it->second.resolved_at < ttl_seconds_) {
      return it->second.addresses;
    }

    auto pending = state_->pending.find(name);
    if (pending != state_->pending.end()) {
      result = pending->second;
    } else {
      auto promise = std::make_shared<std::promise<std::vector<std::string>>>();
      result = promise->get_future().share();

      // The thread blocks on the mutex until pending is recorded below
      std::thread([state = state_, resolver = resolver_, name, promise]() {
        std::vector<std::string> addresses;
        try {
          addresses = resolver(name);
        } catch (const std::exception& e) {
          LOG_PROBE_DEBUG("Exception resolving {}: {}", name, e.what());
        }
        {
          std::lock_guard<std::mutex> state_lock(state->mutex);
          state->entries[name] = Entry{addresses, util::GetTime()};
          state->pending.erase(name);
        }
        promise->set_value(std::move(addresses));
      }).detach();

      state_->pending.emplace(name, result);
    }
  }

  if (result.wait_for(timeout) != std::future_status::ready) {
    LOG_PROBE_DEBUG("Resolving {} did not finish within {} ms", name, timeout.count());
    return {};
  }
  return result.get();
}

size_t HostNameCache::size() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->entries.size();
}

void HostNameCache::clear() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->entries.clear();
}

std::vector<std::string> ResolveProbeTargets(const hosts::HostRecord& record, HostNameCache& cache,
                                             std::chrono::milliseconds timeout) {
  std::vector<std::string> targets;
  std::set<std::string> seen;

  auto add = [&](const std::string& address) {
    if (util::IsProbeableAddress(address) && seen.insert(address).second) {
      targets.push_back(address);
    }
  };

  if (!record.addresses.empty()) {
    for (const auto& address : record.addresses) {
      add(address);
    }
    return targets;
  }

  // One deadline covers every alias
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (const auto& alias : record.aliases) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    for (const auto& address : cache.lookup(alias, std::max(remaining, std::chrono::milliseconds(0)))) {
      add(address);
    }
  }
  return targets;
}

}  // namespace network
}  // namespace lanwake
