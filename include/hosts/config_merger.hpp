// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ConfigMerger: folds source batches into canonical HostRecords

 Batches are applied in increasing (precedence, order, origin). The caller's
 list order is irrelevant; only the rank carried by each batch matters.

 For each incoming record:
 1. Find every host sharing an alias, an address or a MAC with it
 2. None: create a host keyed by the record's first name, else its first
    address. A record with only MACs that matches nothing is skipped.
 3. One or more: union aliases/addresses/macs, OR the ignore flag, and
    overwrite preferred_name/broadcast only when the record carries one
 4. Several matches collapse into the host created first; the most recently
    written preferred_name/broadcast among them survives

 Hostnames are case-folded. A "name" that parses as an IP address is treated
 as an address, so canonical keys stay unique.

 Malformed records never abort the merge; they produce warnings.
*/

#include "hosts/host_record.hpp"
#include "hosts/source_record.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lanwake {
namespace hosts {

class Registry;

struct MergeOutcome {
  std::vector<HostRecord> hosts;  // ordered by canonical key
  std::vector<std::string> warnings;
};

class ConfigMerger {
public:
  // Pure function over the batches; does not log.
  static MergeOutcome merge(std::vector<SourceRecordBatch> batches);

  // merge() + log every warning + build the Registry
  static std::unique_ptr<Registry> build_registry(std::vector<SourceRecordBatch> batches);
};

}  // namespace hosts
}  // namespace lanwake
