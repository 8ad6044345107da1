// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace lanwake {

constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

constexpr const char* CLIENT_NAME = "lanwaked";

// "0.3.0"
std::string GetVersionString();

// "lanwaked v0.3.0"
std::string GetFullVersionString();

std::string GetCopyrightString();

// Multi-line banner printed at startup
std::string GetStartupBanner(const std::string& bind_address);

}  // namespace lanwake
