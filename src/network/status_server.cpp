// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

/**
 * Status Server Implementation - HTTP over TCP
 *
 * Serves the registry as JSON and accepts wake requests. The protocol
 * surface is deliberately small: one request per connection, no keep-alive,
 * no chunked bodies, bodies limited to MAX_HTTP_BODY_SIZE.
 *
 * The default bind address is loopback. Exposing the server to the LAN is
 * an explicit operator decision (--bind=0.0.0.0:3000), since anyone who can
 * reach it can wake any configured host.
 */

#include "network/status_server.hpp"

#include "network/wol_dispatcher.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanwake {
namespace network {

namespace {

HttpResponse JsonResponse(int status, const nlohmann::json& body) {
  HttpResponse response;
  response.status = status;
  response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
  return response;
}

HttpResponse JsonErrorResponse(int status, const std::string& message) {
  nlohmann::json body;
  body["error"] = message;
  return JsonResponse(status, body);
}

nlohmann::json OptionalTime(const std::optional<int64_t>& timestamp) {
  if (!timestamp) {
    return nullptr;
  }
  return util::FormatTime(*timestamp);
}

nlohmann::json MacSendResultToJson(const hosts::MacSendResult& result) {
  nlohmann::json j;
  j["mac"] = result.mac.ToString();
  j["sent"] = result.sent;
  j["target"] = result.target;
  j["error"] = result.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.error);
  return j;
}

size_t FindHeaderEnd(const std::string& raw, size_t& terminator_len) {
  size_t pos = raw.find("\r\n\r\n");
  if (pos != std::string::npos) {
    terminator_len = 4;
    return pos;
  }
  pos = raw.find("\n\n");
  terminator_len = 2;
  return pos;
}

HttpResponse HandleWake(const HttpRequest& request, WolDispatcher& dispatcher) {
  std::optional<std::string> host;
  std::string body_error;

  if (!util::TrimWhitespace(request.body).empty()) {
    auto ct = request.headers.find("content-type");
    const bool is_form =
        ct != request.headers.end() && util::ToLower(ct->second).starts_with("application/x-www-form-urlencoded");

    if (is_form) {
      auto form = ParseQueryString(request.body);
      if (auto it = form.find("host"); it != form.end()) {
        host = it->second;
      }
    } else {
      try {
        nlohmann::json j = nlohmann::json::parse(request.body);
        if (!j.is_object()) {
          body_error = "Expected a JSON object";
        } else if (!j.contains("host") || !j["host"].is_string()) {
          body_error = "Missing or invalid host field";
        } else {
          host = j["host"].get<std::string>();
        }
      } catch (const nlohmann::json::exception& e) {
        LOG_HTTP_WARN_RL("Wake request with invalid JSON: {}", e.what());
        body_error = "Invalid JSON";
      }
    }
  }

  if (!host) {
    if (auto it = request.query.find("host"); it != request.query.end()) {
      host = it->second;
    }
  }
  if (!host) {
    return JsonErrorResponse(400, body_error.empty() ? "Missing host" : body_error);
  }
  if (host->empty()) {
    return JsonErrorResponse(400, "Missing host");
  }

  WakeResult result = dispatcher.wake(*host);
  if (result.error) {
    nlohmann::json body;
    body["error"] = WakeErrorName(*result.error);
    body["host"] = result.key;
    return JsonResponse(*result.error == WakeError::UnknownHost ? 404 : 409, body);
  }
  return JsonResponse(200, WakeResultToJson(result));
}

}  // namespace

const char* HttpReasonPhrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  }
  return "Unknown";
}

std::chrono::milliseconds AcceptRetryDelay(int error, int consecutive_failures) {
  if (error == EINTR || error == ECONNABORTED || error == EAGAIN || error == EWOULDBLOCK) {
    return std::chrono::milliseconds(0);
  }
  const int shift = std::clamp(consecutive_failures - 1, 0, 5);
  return std::min(std::chrono::milliseconds(10 << shift), std::chrono::milliseconds(250));
}

std::optional<std::string> UrlDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= text.size()) {
        return std::nullopt;
      }
      int hi = util::HexValue(text[i + 1]);
      int lo = util::HexValue(text[i + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> ParseQueryString(std::string_view query) {
  std::map<std::string, std::string> out;
  while (!query.empty()) {
    size_t amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }

    size_t eq = pair.find('=');
    auto key = UrlDecode(pair.substr(0, eq));
    auto value = UrlDecode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
    if (!key || !value || key->empty()) {
      continue;
    }
    out.emplace(std::move(*key), std::move(*value));
  }
  return out;
}

std::optional<HttpRequest> ParseHttpRequest(const std::string& raw) {
  size_t terminator_len = 0;
  size_t header_end = FindHeaderEnd(raw, terminator_len);
  if (header_end == std::string::npos) {
    return std::nullopt;
  }

  std::string_view head(raw.data(), header_end);
  HttpRequest request;

  // Request line
  size_t line_end = head.find('\n');
  std::string_view request_line = util::TrimWhitespace(head.substr(0, line_end));
  auto parts = util::SplitWhitespace(request_line);
  if (parts.size() != 3 || !parts[2].starts_with("HTTP/")) {
    return std::nullopt;
  }
  request.method = std::string(parts[0]);
  request.target = std::string(parts[1]);
  if (request.target.empty() || request.target[0] != '/') {
    return std::nullopt;
  }

  // Headers
  std::string_view rest = (line_end == std::string_view::npos) ? std::string_view{} : head.substr(line_end + 1);
  while (!rest.empty()) {
    size_t eol = rest.find('\n');
    std::string_view line = util::TrimWhitespace(rest.substr(0, eol));
    rest = (eol == std::string_view::npos) ? std::string_view{} : rest.substr(eol + 1);
    if (line.empty()) {
      continue;
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return std::nullopt;
    }
    request.headers[util::ToLower(util::TrimWhitespace(line.substr(0, colon)))] =
        std::string(util::TrimWhitespace(line.substr(colon + 1)));
  }

  // Body
  request.body = raw.substr(header_end + terminator_len);
  if (auto it = request.headers.find("content-length"); it != request.headers.end()) {
    auto length = util::SafeParseUInt32(it->second);
    if (!length || request.body.size() < *length) {
      return std::nullopt;
    }
    request.body.resize(*length);
  }

  // Target
  size_t qmark = request.target.find('?');
  auto path = UrlDecode(std::string_view(request.target).substr(0, qmark));
  if (!path) {
    return std::nullopt;
  }
  request.path = std::move(*path);
  if (qmark != std::string::npos) {
    request.query = ParseQueryString(std::string_view(request.target).substr(qmark + 1));
  }

  return request;
}

std::string SerializeHttpResponse(const HttpResponse& response) {
  std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " + HttpReasonPhrase(response.status) + "\r\n";
  out += "Content-Type: " + response.content_type + "\r\n";
  out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  out += "Cache-Control: no-store\r\n";
  out += "Connection: close\r\n\r\n";
  out += response.body;
  return out;
}

nlohmann::json HostViewToJson(const hosts::HostView& view) {
  nlohmann::json j;
  j["key"] = view.key;
  j["name"] = view.display_name;
  j["aliases"] = view.aliases;
  j["addresses"] = view.addresses;
  j["macs"] = view.macs;
  j["status"] = hosts::HostStatusName(view.status);
  j["can_wake"] = view.can_wake;
  j["ignored"] = view.ignored;
  j["last_probe_at"] = OptionalTime(view.last_probe_at);
  j["last_online_at"] = OptionalTime(view.last_online_at);
  j["last_wake_attempt_at"] = OptionalTime(view.last_wake_attempt_at);

  if (view.last_online_at) {
    j["last_seen"] = util::FormatAge(util::GetTime() - *view.last_online_at);
  } else {
    j["last_seen"] = nullptr;
  }

  if (view.last_probe_at) {
    j["last_probe"] = {{"address", view.last_probe_address}, {"detail", view.last_probe_detail}};
  } else {
    j["last_probe"] = nullptr;
  }

  nlohmann::json wake = nlohmann::json::array();
  for (const auto& r : view.last_wake_results) {
    wake.push_back(MacSendResultToJson(r));
  }
  j["last_wake"] = wake;
  return j;
}

nlohmann::json WakeResultToJson(const WakeResult& result) {
  nlohmann::json j;
  j["host"] = result.key;
  if (result.error) {
    j["error"] = WakeErrorName(*result.error);
  }
  j["sent"] = result.sent_count();
  nlohmann::json results = nlohmann::json::array();
  for (const auto& r : result.results) {
    results.push_back(MacSendResultToJson(r));
  }
  j["results"] = results;
  return j;
}

HttpResponse HandleRequest(const HttpRequest& request, hosts::Registry& registry, WolDispatcher& dispatcher) {
  static constexpr std::string_view kPrefix = "/network";

  if (request.path == kPrefix || request.path == "/network/") {
    if (request.method != "GET") {
      return JsonErrorResponse(405, "Method not allowed");
    }
    nlohmann::json hosts = nlohmann::json::array();
    for (const auto& view : registry.views()) {
      hosts.push_back(HostViewToJson(view));
    }
    return JsonResponse(200, hosts);
  }

  if (request.path == "/network/wake") {
    if (request.method != "POST") {
      return JsonErrorResponse(405, "Method not allowed");
    }
    return HandleWake(request, dispatcher);
  }

  if (request.path.starts_with("/network/")) {
    if (request.method != "GET") {
      return JsonErrorResponse(405, "Method not allowed");
    }
    const std::string identifier = request.path.substr(kPrefix.size() + 1);
    std::optional<hosts::HostView> view;
    if (auto key = registry.resolve(identifier)) {
      view = registry.view(*key);
    }
    if (!view) {
      return JsonErrorResponse(404, "Unknown host");
    }
    return JsonResponse(200, HostViewToJson(*view));
  }

  return JsonErrorResponse(404, "Not found");
}

// ============================================================================
// StatusServer
// ============================================================================

StatusServer::StatusServer(std::string bind_host, uint16_t bind_port, hosts::Registry& registry,
                           WolDispatcher& dispatcher)
    : bind_host_(std::move(bind_host)), bind_port_(bind_port), registry_(registry), dispatcher_(dispatcher) {}

StatusServer::~StatusServer() {
  Stop();
}

bool StatusServer::Start() {
  if (running_) {
    return true;
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  struct addrinfo* results = nullptr;
  const std::string port_str = std::to_string(bind_port_);
  const char* host = bind_host_.empty() ? nullptr : bind_host_.c_str();
  int rc = getaddrinfo(host, port_str.c_str(), &hints, &results);
  if (rc != 0) {
    LOG_HTTP_ERROR("Cannot resolve bind address {}: {}", bind_host_, gai_strerror(rc));
    return false;
  }

  std::string last_error = "no usable address";
  for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = strerror(errno);
      continue;
    }

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      LOG_HTTP_WARN("Failed to set SO_REUSEADDR: {}", strerror(errno));
    }

    if (bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && listen(fd, 16) == 0) {
      server_fd_ = fd;
      break;
    }
    last_error = strerror(errno);
    close(fd);
  }
  freeaddrinfo(results);

  if (server_fd_ < 0) {
    LOG_HTTP_ERROR("Failed to bind HTTP server to {}:{}: {}", bind_host_, bind_port_, last_error);
    return false;
  }

  struct sockaddr_storage local;
  socklen_t local_len = sizeof(local);
  bound_port_ = bind_port_;
  if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&local), &local_len) == 0) {
    if (local.ss_family == AF_INET) {
      bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&local)->sin_port);
    } else if (local.ss_family == AF_INET6) {
      bound_port_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&local)->sin6_port);
    }
  }

  shutting_down_ = false;
  running_ = true;
  server_thread_ = std::thread(&StatusServer::ServerThread, this);

  const bool bracket = bind_host_.find(':') != std::string::npos;
  LOG_HTTP_INFO("Listening on http://{}{}{}:{}", bracket ? "[" : "", bind_host_, bracket ? "]" : "", bound_port_);
  return true;
}

void StatusServer::Stop() {
  if (!running_) {
    return;
  }

  shutting_down_.store(true, std::memory_order_release);
  running_ = false;

  // shutdown() reliably unblocks accept(); close() alone may not
  if (server_fd_ >= 0) {
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // Request threads hold a reference to this object; wait for them. Each is
  // bounded by the receive timeout.
  std::unique_lock<std::mutex> lock(requests_mutex_);
  requests_cv_.wait(lock, [this] { return active_requests_.load() == 0; });

  LOG_HTTP_INFO("HTTP server stopped");
}

void StatusServer::ServerThread() {
  int accept_failures = 0;
  while (running_) {
    struct sockaddr_storage client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
      const int error = errno;
      if (!running_) {
        break;
      }
      LOG_HTTP_WARN_RL("Failed to accept HTTP connection: {}", strerror(error));
      // Out of descriptors stays out until something closes; do not spin
      auto delay = AcceptRetryDelay(error, ++accept_failures);
      if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
      continue;
    }
    accept_failures = 0;

    if (active_requests_.load() >= MAX_CONCURRENT_REQUESTS) {
      LOG_HTTP_WARN_RL("HTTP request rejected: {} concurrent requests (max {})", active_requests_.load(),
                       MAX_CONCURRENT_REQUESTS);
      SendResponse(client_fd, SerializeHttpResponse(JsonErrorResponse(503, "Server busy")));
      close(client_fd);
      continue;
    }

    // Thread per request: accept -> recv -> route -> send -> close
    active_requests_++;
    std::thread([this, client_fd]() {
      try {
        HandleClient(client_fd);
      } catch (const std::exception& e) {
        LOG_HTTP_ERROR("HandleClient exception: {}", e.what());
      }
      close(client_fd);

      std::lock_guard<std::mutex> lock(requests_mutex_);
      active_requests_--;
      requests_cv_.notify_all();
    }).detach();
  }
}

bool StatusServer::SendResponse(int client_fd, const std::string& response) {
  size_t total_sent = 0;
  while (total_sent < response.size()) {
    ssize_t sent = send(client_fd, response.c_str() + total_sent, response.size() - total_sent, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (sent < 0 && errno != EPIPE) {
        LOG_HTTP_DEBUG("HTTP send failed: {}", strerror(errno));
      }
      return false;
    }
    total_sent += static_cast<size_t>(sent);
  }
  return true;
}

bool StatusServer::ReadRequest(int client_fd, std::string& raw, HttpResponse& error) {
  std::vector<char> buffer(4096);
  size_t header_end = std::string::npos;
  size_t terminator_len = 0;
  size_t expected_total = 0;

  while (true) {
    ssize_t received = recv(client_fd, buffer.data(), buffer.size(), 0);
    if (received <= 0) {
      if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        error = JsonErrorResponse(408, "Request timeout");
      } else {
        error.status = 0;  // client went away; nothing to send
      }
      return false;
    }
    raw.append(buffer.data(), static_cast<size_t>(received));

    if (header_end == std::string::npos) {
      header_end = FindHeaderEnd(raw, terminator_len);
      if (header_end == std::string::npos) {
        if (raw.size() > MAX_HTTP_HEADER_SIZE) {
          error = JsonErrorResponse(431, "Request headers too large");
          return false;
        }
        continue;
      }

      // Content-Length decides how much body to wait for
      size_t content_length = 0;
      const std::string head = util::ToLower(std::string_view(raw).substr(0, header_end));
      size_t pos = head.find("\ncontent-length:");
      if (pos != std::string::npos) {
        size_t value_start = pos + std::strlen("\ncontent-length:");
        size_t value_end = head.find('\n', value_start);
        auto length = util::SafeParseUInt32(
            util::TrimWhitespace(std::string_view(head).substr(value_start, value_end - value_start)));
        if (!length) {
          error = JsonErrorResponse(400, "Invalid Content-Length");
          return false;
        }
        content_length = *length;
      }
      if (content_length > MAX_HTTP_BODY_SIZE) {
        LOG_HTTP_WARN_RL("HTTP request body too large: {} bytes", content_length);
        error = JsonErrorResponse(413, "Request too large");
        return false;
      }
      expected_total = header_end + terminator_len + content_length;
    }

    if (raw.size() >= expected_total) {
      return true;
    }
  }
}

void StatusServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    SendResponse(client_fd, SerializeHttpResponse(JsonErrorResponse(503, "Server shutting down")));
    return;
  }

  // Hung clients must not pin a request slot forever
  struct timeval timeout;
  timeout.tv_sec = RECV_TIMEOUT_SECONDS;
  timeout.tv_usec = 0;
  if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
    LOG_HTTP_WARN("Failed to set HTTP socket recv timeout");
  }

  std::string raw;
  HttpResponse error;
  if (!ReadRequest(client_fd, raw, error)) {
    if (error.status != 0) {
      SendResponse(client_fd, SerializeHttpResponse(error));
    }
    return;
  }

  auto request = ParseHttpRequest(raw);
  if (!request) {
    SendResponse(client_fd, SerializeHttpResponse(JsonErrorResponse(400, "Malformed HTTP request")));
    return;
  }

  HttpResponse response;
  try {
    response = HandleRequest(*request, registry_, dispatcher_);
  } catch (const std::exception& e) {
    LOG_HTTP_ERROR("{} {} failed: {}", request->method, request->target, e.what());
    response = JsonErrorResponse(500, "Internal error");
  }

  LOG_HTTP_DEBUG("{} {} -> {}", request->method, request->target, response.status);
  SendResponse(client_fd, SerializeHttpResponse(response));
}

}  // namespace network
}  // namespace lanwake
