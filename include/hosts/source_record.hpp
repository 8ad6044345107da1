// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Source records: the one shape every host source is normalized into

 A hosts file line, an ethers line, a TOML [hosts."name"] table and an
 --ignore-host flag all become a SourceRecord. Records from one source travel
 together in a SourceRecordBatch that carries the source's precedence.

 Lists keep source order: the first name (or first address) of a record
 becomes the canonical key of a newly created host, so the order of entries
 in a file is meaningful while hash/set ordering never is.
*/

#include "util/mac_address.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwake {
namespace hosts {

enum class SourceKind : uint8_t {
  HostsFile,
  EthersFile,
  ConfigFile,
  CommandLine,
};

const char* SourceKindName(SourceKind kind);

// Default precedence by source kind; higher wins conflicts.
// --hosts < --ethers < --config < command line overrides
int DefaultPrecedence(SourceKind kind);

struct SourceRecord {
  std::vector<std::string> names;
  std::vector<std::string> addresses;  // normalized (util::ValidateAndNormalizeIP)
  std::vector<util::MacAddress> macs;
  std::optional<std::string> preferred_name;
  std::optional<std::string> broadcast;
  bool ignored{false};

  bool has_identifier() const { return !names.empty() || !addresses.empty() || !macs.empty(); }
};

struct SourceRecordBatch {
  SourceKind kind{SourceKind::HostsFile};
  int precedence{0};
  // Position among sources of equal precedence; later --config files get
  // larger values and therefore win over earlier ones.
  uint32_t order{0};
  std::string origin;  // file path or "--ignore-host"
  std::vector<SourceRecord> records;
  // Entries the parser had to skip, formatted for the log
  std::vector<std::string> warnings;

  SourceRecordBatch() = default;
  SourceRecordBatch(SourceKind k, uint32_t ord, std::string orig)
      : kind(k), precedence(DefaultPrecedence(k)), order(ord), origin(std::move(orig)) {}
};

}  // namespace hosts
}  // namespace lanwake
