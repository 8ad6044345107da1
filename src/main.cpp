// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  using lanwake::app::CommandLine;

  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLine cli = lanwake::app::ParseCommandLine(args);

    switch (cli.action) {
    case CommandLine::Action::Help:
      std::cout << lanwake::app::GetUsage(argv[0]);
      return 0;
    case CommandLine::Action::Version:
      std::cout << lanwake::GetFullVersionString() << std::endl;
      std::cout << lanwake::GetCopyrightString() << std::endl;
      return 0;
    case CommandLine::Action::Error:
      std::cerr << "Error: " << cli.error << "\n\n" << lanwake::app::GetUsage(argv[0]);
      return 1;
    case CommandLine::Action::Run:
      break;
    }

    const auto& config = cli.config;
    lanwake::util::LogManager::Initialize(config.log_level, config.log_file.has_value(),
                                          config.log_file.value_or("lanwake.log"));
    for (const auto& component : config.debug_components) {
      if (component == "all") {
        lanwake::util::LogManager::SetLogLevel("debug");
      } else {
        lanwake::util::LogManager::SetComponentLevel(component, "debug");
      }
    }

    lanwake::app::Application app(config);

    std::signal(SIGINT, lanwake::app::Application::signal_handler);
    std::signal(SIGTERM, lanwake::app::Application::signal_handler);

    if (!app.initialize()) {
      LOG_ERROR("Initialization failed");
      lanwake::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Startup failed");
      lanwake::util::LogManager::Shutdown();
      return 1;
    }

    app.wait_for_shutdown();
    lanwake::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
