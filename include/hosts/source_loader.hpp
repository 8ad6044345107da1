// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Source loaders: hosts(5), ethers(5) and TOML overlays -> SourceRecordBatch

 Parsers never fail as a whole. Each skipped entry adds a line to the
 batch's warnings, prefixed with the origin so the operator can find it:

   /etc/hosts:12: invalid IP address '10.0.0.300'
   /etc/lanwake/config.toml: .hosts."nas.lan".macs[1]: invalid MAC address 'zz'

 TOML overlay format:

   bind = "0.0.0.0:3000"
   hosts = ["a.example", "b.example"]      # or hosts = "a.example"

   [hosts."nas.lan"]
   macs = ["00:11:22:33:44:55"]            # string or array
   addresses = ["192.168.1.20"]            # string or array
   preferred_name = "NAS"
   broadcast = "192.168.1.255"
   ignore = false

 A plain list and a table cannot both be used for `hosts` in one file since
 TOML keys are unique.
*/

#include "hosts/source_record.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanwake {
namespace hosts {

struct ConfigFile {
  std::optional<std::string> bind;
  SourceRecordBatch batch;
};

// Parsers over in-memory text
SourceRecordBatch ParseHostsFile(std::string_view text, const std::string& origin, uint32_t order);
SourceRecordBatch ParseEthersFile(std::string_view text, const std::string& origin, uint32_t order);
ConfigFile ParseConfigFile(std::string_view text, const std::string& origin, uint32_t order);

// File loaders. A missing file yields an empty batch and is not a warning:
// the default /etc paths are optional. Unreadable files produce a warning.
SourceRecordBatch LoadHostsFile(const std::filesystem::path& path, uint32_t order);
SourceRecordBatch LoadEthersFile(const std::filesystem::path& path, uint32_t order);
ConfigFile LoadConfigFile(const std::filesystem::path& path, uint32_t order);

// One command-line batch marking each name as ignored
SourceRecordBatch MakeIgnoreBatch(const std::vector<std::string>& names);

}  // namespace hosts
}  // namespace lanwake
