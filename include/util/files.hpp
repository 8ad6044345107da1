// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace lanwake {
namespace util {

// Host sources are small text files; anything larger is a misconfiguration
constexpr size_t MAX_SOURCE_FILE_SIZE = 4 * 1024 * 1024;

enum class ReadStatus {
  Ok,
  NotFound,  // missing file: normal for the default /etc paths
  TooLarge,
  Error,
};

struct ReadResult {
  ReadStatus status{ReadStatus::Error};
  std::string contents;
  std::string error;

  bool ok() const { return status == ReadStatus::Ok; }
};

// Read a whole text file, refusing files above max_size bytes.
ReadResult read_text_file(const std::filesystem::path& path, size_t max_size = MAX_SOURCE_FILE_SIZE);

}  // namespace util
}  // namespace lanwake
