// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "hosts/source_record.hpp"

namespace lanwake {
namespace hosts {

const char* SourceKindName(SourceKind kind) {
  switch (kind) {
  case SourceKind::HostsFile:
    return "hosts";
  case SourceKind::EthersFile:
    return "ethers";
  case SourceKind::ConfigFile:
    return "config";
  case SourceKind::CommandLine:
    return "command-line";
  }
  return "unknown";
}

int DefaultPrecedence(SourceKind kind) {
  switch (kind) {
  case SourceKind::HostsFile:
    return 0;
  case SourceKind::EthersFile:
    return 1;
  case SourceKind::ConfigFile:
    return 2;
  case SourceKind::CommandLine:
    return 3;
  }
  return 0;
}

}  // namespace hosts
}  // namespace lanwake
