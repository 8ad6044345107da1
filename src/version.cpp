// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "version.hpp"

#include <sstream>

namespace lanwake {

std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." + std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

std::string GetFullVersionString() {
  return std::string(CLIENT_NAME) + " v" + GetVersionString();
}

std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation\n"
         "Distributed under the MIT software license";
}

std::string GetStartupBanner(const std::string& bind_address) {
  std::ostringstream oss;
  oss << "\n"
      << "  " << GetFullVersionString() << " - host registry & Wake-on-LAN\n"
      << "  status API: http://" << bind_address << "/network\n"
      << "\n";
  return oss.str();
}

}  // namespace lanwake
