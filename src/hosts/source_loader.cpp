// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "hosts/source_loader.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/mac_address.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <sstream>
#include <variant>

#include <toml++/toml.hpp>

namespace lanwake {
namespace hosts {

namespace {

// Iterate over the lines of text, 1-based line numbers
template <typename Fn>
void ForEachLine(std::string_view text, Fn&& fn) {
  size_t line_no = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    ++line_no;
    fn(line_no, text.substr(pos, end - pos));
    pos = end + 1;
  }
}

std::string LineWarning(const std::string& origin, size_t line_no, const std::string& message) {
  return origin + ":" + std::to_string(line_no) + ": " + message;
}

const char* TypeName(toml::node_type type) {
  switch (type) {
  case toml::node_type::none:
    return "none";
  case toml::node_type::table:
    return "table";
  case toml::node_type::array:
    return "array";
  case toml::node_type::string:
    return "string";
  case toml::node_type::integer:
    return "integer";
  case toml::node_type::floating_point:
    return "float";
  case toml::node_type::boolean:
    return "boolean";
  case toml::node_type::date:
    return "date";
  case toml::node_type::time:
    return "time";
  case toml::node_type::date_time:
    return "datetime";
  }
  return "unknown";
}

/**
 * Diagnostics - tracks the position inside a TOML document
 *
 * Errors are rendered as "<origin>: .hosts."a.example".macs[1]: <message>".
 * Keys containing a dot are quoted so the path stays unambiguous.
 */
class Diagnostics {
public:
  Diagnostics(const std::string& origin, std::vector<std::string>& out) : origin_(origin), out_(out) {}

  void key(std::string_view key) { path_.emplace_back(std::string(key)); }
  void index(size_t index) { path_.emplace_back(index); }
  void pop() { path_.pop_back(); }

  void error(const std::string& message) {
    std::ostringstream oss;
    oss << origin_ << ": ";
    bool has_path = false;
    for (const auto& step : path_) {
      has_path = true;
      if (const auto* key = std::get_if<std::string>(&step)) {
        oss << '.';
        if (key->find('.') != std::string::npos) {
          oss << '"' << *key << '"';
        } else {
          oss << *key;
        }
      } else {
        oss << '[' << std::get<size_t>(step) << ']';
      }
    }
    if (has_path) {
      oss << ": ";
    }
    oss << message;
    out_.push_back(oss.str());
  }

private:
  const std::string& origin_;
  std::vector<std::string>& out_;
  std::vector<std::variant<std::string, size_t>> path_;
};

// Value that must be a string, or an array of strings. fn is called with each
// string while the diagnostics path points at it.
template <typename Fn>
void TakeStrings(const toml::node& node, Diagnostics& diag, Fn&& fn) {
  if (const auto* str = node.as_string()) {
    fn(str->get());
    return;
  }
  const auto* array = node.as_array();
  if (!array) {
    diag.error(std::string("expected string or array, found ") + TypeName(node.type()));
    return;
  }
  for (size_t i = 0; i < array->size(); ++i) {
    const toml::node& item = (*array)[i];
    diag.index(i);
    if (const auto* str = item.as_string()) {
      fn(str->get());
    } else {
      diag.error(std::string("expected string, found ") + TypeName(item.type()));
    }
    diag.pop();
  }
}

std::optional<std::string> TakeString(const toml::node& node, Diagnostics& diag) {
  if (const auto* str = node.as_string()) {
    return str->get();
  }
  diag.error(std::string("expected string, found ") + TypeName(node.type()));
  return std::nullopt;
}

void AddMac(SourceRecord& record, const std::string& text, Diagnostics& diag) {
  auto mac = util::MacAddress::Parse(text);
  if (!mac) {
    diag.error("invalid MAC address '" + text + "'");
    return;
  }
  if (mac->IsGroup() || mac->IsZero()) {
    diag.error("'" + text + "' is not a unicast MAC address");
    return;
  }
  record.macs.push_back(*mac);
}

// [hosts."<name>"] table
SourceRecord ParseHostTable(const std::string& name, const toml::table& table, Diagnostics& diag) {
  SourceRecord record;
  record.names.push_back(name);

  for (auto&& [k, node] : table) {
    const std::string key(k.str());
    diag.key(key);

    if (key == "macs") {
      TakeStrings(node, diag, [&](const std::string& text) { AddMac(record, text, diag); });
    } else if (key == "addresses") {
      TakeStrings(node, diag, [&](const std::string& text) {
        if (auto ip = util::ValidateAndNormalizeIP(text)) {
          record.addresses.push_back(*ip);
        } else {
          diag.error("invalid IP address '" + text + "'");
        }
      });
    } else if (key == "preferred_name") {
      if (auto value = TakeString(node, diag)) {
        if (value->empty()) {
          diag.error("preferred name must not be empty");
        } else {
          record.preferred_name = *value;
        }
      }
    } else if (key == "broadcast") {
      if (auto value = TakeString(node, diag)) {
        auto ip = util::ValidateAndNormalizeIP(*value);
        if (!ip || !util::IsIPv4(*ip)) {
          diag.error("invalid IPv4 broadcast address '" + *value + "'");
        } else {
          record.broadcast = *ip;
        }
      }
    } else if (key == "ignore") {
      if (const auto* flag = node.as_boolean()) {
        record.ignored = flag->get();
      } else {
        diag.error(std::string("expected boolean, found ") + TypeName(node.type()));
      }
    } else {
      diag.error(std::string("unexpected key of type ") + TypeName(node.type()));
    }

    diag.pop();
  }

  return record;
}

void ParseHostsNode(const toml::node& node, Diagnostics& diag, std::vector<SourceRecord>& out) {
  auto add_name = [&](const std::string& name) {
    if (util::TrimWhitespace(name).empty()) {
      diag.error("empty host name");
      return;
    }
    SourceRecord record;
    record.names.push_back(name);
    out.push_back(std::move(record));
  };

  if (node.is_string() || node.is_array()) {
    TakeStrings(node, diag, add_name);
    return;
  }

  const auto* table = node.as_table();
  if (!table) {
    diag.error(std::string("expected table or array, found ") + TypeName(node.type()));
    return;
  }

  for (auto&& [k, value] : *table) {
    const std::string name(k.str());
    diag.key(name);
    if (name.empty()) {
      diag.error("empty host name");
    } else if (const auto* host_table = value.as_table()) {
      out.push_back(ParseHostTable(name, *host_table, diag));
    } else {
      diag.error(std::string("expected table, found ") + TypeName(value.type()));
    }
    diag.pop();
  }
}

void LogReadFailure(const std::filesystem::path& path, const util::ReadResult& result, SourceRecordBatch& batch) {
  if (result.status == util::ReadStatus::NotFound) {
    LOG_HOSTS_DEBUG("{} not found, skipping", path.string());
    return;
  }
  batch.warnings.push_back(path.string() + ": cannot read file: " + result.error);
}

}  // namespace

SourceRecordBatch ParseHostsFile(std::string_view text, const std::string& origin, uint32_t order) {
  SourceRecordBatch batch(SourceKind::HostsFile, order, origin);

  ForEachLine(text, [&](size_t line_no, std::string_view line) {
    auto tokens = util::SplitWhitespace(util::StripComment(line));
    if (tokens.empty()) {
      return;
    }

    const std::string address_text(tokens[0]);
    auto address = util::ValidateAndNormalizeIP(address_text);
    if (!address) {
      batch.warnings.push_back(LineWarning(origin, line_no, "invalid IP address '" + address_text + "'"));
      return;
    }
    if (tokens.size() < 2) {
      batch.warnings.push_back(LineWarning(origin, line_no, "no host names for " + *address));
      return;
    }
    // localhost, ip6-allnodes and friends are not hosts on the network
    if (util::IsLoopbackAddress(*address) || !util::IsProbeableAddress(*address)) {
      return;
    }

    SourceRecord record;
    record.addresses.push_back(*address);
    for (size_t i = 1; i < tokens.size(); ++i) {
      record.names.emplace_back(tokens[i]);
    }
    batch.records.push_back(std::move(record));
  });

  return batch;
}

SourceRecordBatch ParseEthersFile(std::string_view text, const std::string& origin, uint32_t order) {
  SourceRecordBatch batch(SourceKind::EthersFile, order, origin);

  ForEachLine(text, [&](size_t line_no, std::string_view line) {
    auto tokens = util::SplitWhitespace(util::StripComment(line));
    if (tokens.empty()) {
      return;
    }

    const std::string mac_text(tokens[0]);
    auto mac = util::MacAddress::Parse(mac_text);
    if (!mac) {
      batch.warnings.push_back(LineWarning(origin, line_no, "invalid MAC address '" + mac_text + "'"));
      return;
    }
    if (mac->IsGroup() || mac->IsZero()) {
      batch.warnings.push_back(LineWarning(origin, line_no, "'" + mac_text + "' is not a unicast MAC address"));
      return;
    }
    if (tokens.size() < 2) {
      batch.warnings.push_back(LineWarning(origin, line_no, "no host name or address for " + mac->ToString()));
      return;
    }
    if (tokens.size() > 2) {
      batch.warnings.push_back(
          LineWarning(origin, line_no, "ignoring trailing text after '" + std::string(tokens[1]) + "'"));
    }

    SourceRecord record;
    record.macs.push_back(*mac);
    const std::string target(tokens[1]);
    if (auto address = util::ValidateAndNormalizeIP(target)) {
      record.addresses.push_back(*address);
    } else {
      record.names.push_back(target);
    }
    batch.records.push_back(std::move(record));
  });

  return batch;
}

ConfigFile ParseConfigFile(std::string_view text, const std::string& origin, uint32_t order) {
  ConfigFile config;
  config.batch = SourceRecordBatch(SourceKind::ConfigFile, order, origin);

  toml::table root;
  try {
    root = toml::parse(text, std::string_view(origin));
  } catch (const toml::parse_error& e) {
    std::ostringstream oss;
    oss << origin << ":" << e.source().begin.line << ":" << e.source().begin.column
        << ": failed to parse config file: " << e.description();
    config.batch.warnings.push_back(oss.str());
    return config;
  }

  Diagnostics diag(origin, config.batch.warnings);

  for (auto&& [k, node] : root) {
    const std::string key(k.str());
    diag.key(key);

    if (key == "bind") {
      if (auto bind = TakeString(node, diag)) {
        std::string host;
        uint16_t port = 0;
        if (util::ParseHostPort(*bind, host, port)) {
          config.bind = *bind;
        } else {
          diag.error("invalid socket address '" + *bind + "'");
        }
      }
    } else if (key == "hosts") {
      ParseHostsNode(node, diag, config.batch.records);
    } else {
      diag.error(std::string("unexpected key of type ") + TypeName(node.type()));
    }

    diag.pop();
  }

  return config;
}

SourceRecordBatch LoadHostsFile(const std::filesystem::path& path, uint32_t order) {
  auto result = util::read_text_file(path);
  if (!result.ok()) {
    SourceRecordBatch batch(SourceKind::HostsFile, order, path.string());
    LogReadFailure(path, result, batch);
    return batch;
  }
  auto batch = ParseHostsFile(result.contents, path.string(), order);
  LOG_HOSTS_DEBUG("{}: {} entries", path.string(), batch.records.size());
  return batch;
}

SourceRecordBatch LoadEthersFile(const std::filesystem::path& path, uint32_t order) {
  auto result = util::read_text_file(path);
  if (!result.ok()) {
    SourceRecordBatch batch(SourceKind::EthersFile, order, path.string());
    LogReadFailure(path, result, batch);
    return batch;
  }
  auto batch = ParseEthersFile(result.contents, path.string(), order);
  LOG_HOSTS_DEBUG("{}: {} entries", path.string(), batch.records.size());
  return batch;
}

ConfigFile LoadConfigFile(const std::filesystem::path& path, uint32_t order) {
  auto result = util::read_text_file(path);
  if (!result.ok()) {
    ConfigFile config;
    config.batch = SourceRecordBatch(SourceKind::ConfigFile, order, path.string());
    LogReadFailure(path, result, config.batch);
    return config;
  }
  auto config = ParseConfigFile(result.contents, path.string(), order);
  LOG_HOSTS_DEBUG("{}: {} host entries", path.string(), config.batch.records.size());
  return config;
}

SourceRecordBatch MakeIgnoreBatch(const std::vector<std::string>& names) {
  SourceRecordBatch batch(SourceKind::CommandLine, 0, "--ignore-host");
  for (const auto& name : names) {
    SourceRecord record;
    record.names.push_back(name);
    record.ignored = true;
    batch.records.push_back(std::move(record));
  }
  return batch;
}

}  // namespace hosts
}  // namespace lanwake
