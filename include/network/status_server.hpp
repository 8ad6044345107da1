// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "hosts/registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <nlohmann/json.hpp>

namespace lanwake {
namespace network {

class WolDispatcher;
struct WakeResult;

// Limits for a single HTTP request
constexpr size_t MAX_HTTP_HEADER_SIZE = 16 * 1024;
constexpr size_t MAX_HTTP_BODY_SIZE = 8 * 1024;

struct HttpRequest {
  std::string method;
  std::string target;  // "/network/wake?host=nas"
  std::string path;    // "/network/wake" (percent-decoded)
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers;  // lowercase names
  std::string body;
};

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

const char* HttpReasonPhrase(int status);

// Percent-decoding ('+' becomes a space). nullopt on a malformed escape.
std::optional<std::string> UrlDecode(std::string_view text);

// "a=1&b=2" -> {a: 1, b: 2}. Malformed pairs are dropped.
std::map<std::string, std::string> ParseQueryString(std::string_view query);

// Parse request line + headers + body of a complete request. nullopt when the
// request is malformed.
std::optional<HttpRequest> ParseHttpRequest(const std::string& raw);

std::string SerializeHttpResponse(const HttpResponse& response);

// How long the accept loop pauses after accept() failed with `error` for the
// `consecutive_failures`-th time in a row. Zero for transient errors; doubles
// from 10 ms up to 250 ms for the rest (EMFILE and friends).
std::chrono::milliseconds AcceptRetryDelay(int error, int consecutive_failures);

nlohmann::json HostViewToJson(const hosts::HostView& view);
nlohmann::json WakeResultToJson(const WakeResult& result);

/**
 * Route one request
 *
 *   GET  /network              -> 200, array of host views
 *   GET  /network/<host>       -> 200 view | 404
 *   POST /network/wake         -> host from JSON {"host": ...}, form body or
 *                                 ?host= query; 200 | 400 | 404 | 409
 *
 * <host> may be the canonical key or any alias, address or MAC of the host.
 */
HttpResponse HandleRequest(const HttpRequest& request, hosts::Registry& registry, WolDispatcher& dispatcher);

/**
 * StatusServer - minimal HTTP/1.1 JSON server over a POSIX TCP socket
 *
 * One accept thread; each connection is served by its own short-lived
 * thread (read request -> route -> write response -> close). Concurrency is
 * capped at MAX_CONCURRENT_REQUESTS; further connections get 503.
 */
class StatusServer {
public:
  StatusServer(std::string bind_host, uint16_t bind_port, hosts::Registry& registry, WolDispatcher& dispatcher);
  ~StatusServer();

  StatusServer(const StatusServer&) = delete;
  StatusServer& operator=(const StatusServer&) = delete;

  // Bind and listen. false if the address cannot be bound.
  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Port actually bound (differs from the requested one when it was 0)
  uint16_t port() const { return bound_port_; }

private:
  void ServerThread();
  void HandleClient(int client_fd);
  bool ReadRequest(int client_fd, std::string& raw, HttpResponse& error);
  bool SendResponse(int client_fd, const std::string& response);

  std::string bind_host_;
  uint16_t bind_port_;
  uint16_t bound_port_{0};
  hosts::Registry& registry_;
  WolDispatcher& dispatcher_;

  int server_fd_{-1};
  std::atomic<bool> running_{false};
  std::atomic<bool> shutting_down_{false};
  std::thread server_thread_;

  // DoS protection: limit concurrent requests to prevent thread exhaustion
  std::atomic<int> active_requests_{0};
  std::mutex requests_mutex_;
  std::condition_variable requests_cv_;
  static constexpr int MAX_CONCURRENT_REQUESTS = 10;
  static constexpr int RECV_TIMEOUT_SECONDS = 30;
};

}  // namespace network
}  // namespace lanwake
