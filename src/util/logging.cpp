// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lanwake {
namespace util {

namespace {

constexpr std::array<const char*, 5> kComponents = {"default", "hosts", "probe", "wol", "http"};

std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_initialized = false;
// Set by Initialize(), cleared by Shutdown(); the fallback in GetLogger() leaves it alone
bool g_configured = false;

// Must be called with g_mutex held
void CreateLoggersLocked(spdlog::level::level_enum level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  std::string file_error;

  auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  sinks.push_back(console);

  if (log_to_file && !log_file_path.empty()) {
    try {
      auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false);
      file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
      sinks.push_back(file);
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  g_loggers.clear();
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = logger;
  }
  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers["default"]->warn("Cannot open log file {}: {}", log_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_configured) {
    return;
  }
  CreateLoggersLocked(spdlog::level::from_str(log_level), log_to_file, log_file_path);
  g_configured = true;
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
  g_configured = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    // Logging before Initialize() (tests, early startup) or after Shutdown()
    CreateLoggersLocked(spdlog::level::info, false, "");
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

}  // namespace util
}  // namespace lanwake
