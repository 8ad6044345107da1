// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace lanwake {
namespace util {

ReadResult read_text_file(const std::filesystem::path& path, size_t max_size) {
  ReadResult result;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    result.status = ReadStatus::NotFound;
    result.error = ec ? ec.message() : "no such file";
    return result;
  }

  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    result.status = ReadStatus::Error;
    result.error = ec.message();
    return result;
  }
  if (size > max_size) {
    LOG_ERROR("read_text_file: {} is {} bytes, refusing files above {} bytes", path.string(), size, max_size);
    result.status = ReadStatus::TooLarge;
    result.error = "file too large";
    return result;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    result.status = ReadStatus::Error;
    result.error = std::strerror(errno);
    return result;
  }

  result.contents.resize(static_cast<size_t>(size));
  file.read(result.contents.data(), static_cast<std::streamsize>(size));
  if (!file && !file.eof()) {
    result.status = ReadStatus::Error;
    result.error = std::strerror(errno);
    result.contents.clear();
    return result;
  }
  result.contents.resize(static_cast<size_t>(file.gcount()));

  result.status = ReadStatus::Ok;
  return result;
}

}  // namespace util
}  // namespace lanwake
