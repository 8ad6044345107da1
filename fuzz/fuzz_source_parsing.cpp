// Fuzz target for host source parsing and merging
// Tests ParseHostsFile, ParseEthersFile, ParseConfigFile and ConfigMerger::merge
//
// Every host source is operator-edited text read at startup. Bugs in this
// code can:
// - Abort the daemon on a typo (exception leaks out of a parser)
// - Accept garbage into the registry (invalid addresses or MACs)
// - Produce a registry that depends on input order (non-deterministic merge)
//
// Target code:
// - src/hosts/source_loader.cpp
// - src/hosts/config_merger.cpp

#include "hosts/config_merger.hpp"
#include "hosts/source_loader.hpp"
#include "util/netaddress.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <cstring>

using namespace lanwake::hosts;
using namespace lanwake::util;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    // Read remaining data as string
    std::string read_remaining() {
        if (offset_ >= size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), size_ - offset_);
        offset_ = size_;
        return result;
    }

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

// Every record a parser keeps must carry validated data
static void CheckBatch(const SourceRecordBatch& batch) {
    for (const auto& record : batch.records) {
        if (!record.has_identifier()) {
            __builtin_trap();
        }
        for (const auto& address : record.addresses) {
            auto normalized = ValidateAndNormalizeIP(address);
            if (!normalized || *normalized != address) {
                __builtin_trap();
            }
        }
        for (const auto& mac : record.macs) {
            if (mac.IsGroup() || mac.IsZero()) {
                __builtin_trap();
            }
        }
    }
}

static void CheckMerge(const std::vector<SourceRecordBatch>& batches) {
    MergeOutcome outcome = ConfigMerger::merge(batches);

    // Keys are unique and sorted
    for (size_t i = 1; i < outcome.hosts.size(); ++i) {
        if (!(outcome.hosts[i - 1].canonical_key < outcome.hosts[i].canonical_key)) {
            __builtin_trap();
        }
    }

    // Input order of the batches must not matter
    std::vector<SourceRecordBatch> reversed(batches.rbegin(), batches.rend());
    MergeOutcome again = ConfigMerger::merge(reversed);
    if (again.hosts != outcome.hosts) {
        __builtin_trap();
    }
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();
    std::string text = input.read_remaining();

    try {
        // TEST 1-3: each parser on its own
        if ((mode & 0x03) == 0) {
            CheckBatch(ParseHostsFile(text, "fuzz-hosts", 0));
        } else if ((mode & 0x03) == 1) {
            CheckBatch(ParseEthersFile(text, "fuzz-ethers", 0));
        } else if ((mode & 0x03) == 2) {
            ConfigFile config = ParseConfigFile(text, "fuzz.toml", 0);
            CheckBatch(config.batch);
            if (config.bind) {
                std::string host;
                uint16_t port = 0;
                if (!ParseHostPort(*config.bind, host, port)) {
                    __builtin_trap();
                }
            }
        } else {
            // TEST 4: the same text through every parser, then merged
            std::vector<SourceRecordBatch> batches;
            batches.push_back(ParseHostsFile(text, "fuzz-hosts", 0));
            batches.push_back(ParseEthersFile(text, "fuzz-ethers", 1));
            batches.push_back(ParseConfigFile(text, "fuzz.toml", 2).batch);
            for (const auto& batch : batches) {
                CheckBatch(batch);
            }
            CheckMerge(batches);
        }
    } catch (...) {
        // Parsers report problems as warnings and never throw
        __builtin_trap();
    }

    return 0;
}
