#pragma once

#include <filesystem>   // std::filesystem::{path, exists}
#include <fstream>      // std::ifstream
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code

#include "Error.hpp"
#include "Types.hpp"

namespace ccstatus::utils::file {
  namespace types = ::ccstatus::utils::types;
  namespace error = ::ccstatus::utils::error;
  namespace fs    = std::filesystem;

  /**
   * @brief Reads the whole of a small text file.
   * @return NotFound if the file does not exist, IoError if it cannot be read.
   */
  inline auto ReadTextFile(const fs::path& path) -> types::Result<types::String> {
    std::error_code errc;

    if (!fs::exists(path, errc))
      ERR_FMT(error::StatusErrorCode::NotFound, "File not found: {}", path.string());

    std::ifstream file(path, std::ios::binary);

    if (!file)
      ERR_FMT(error::StatusErrorCode::IoError, "Could not open {}", path.string());

    types::String contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (file.bad())
      ERR_FMT(error::StatusErrorCode::IoError, "Failed to read {}", path.string());

    return contents;
  }
} // namespace ccstatus::utils::file
