#pragma once

#include <filesystem> // std::filesystem::path

#include <CCStatus/Core/Session.hpp>
#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::services::git {
  namespace fs    = std::filesystem;
  namespace types = ::ccstatus::utils::types;

  /**
   * @brief Walks from @p start towards the filesystem root looking for a
   *        `.git` directory.
   * @return Path of the `.git` directory, or NotFound.
   */
  auto FindGitDir(const fs::path& start) -> types::Result<fs::path>;

  /**
   * @brief Branch name from the contents of a HEAD file.
   *
   * `ref: refs/heads/<name>` yields `<name>`; anything else is treated as a
   * detached commit and shortened to seven characters.
   *
   * @return ParseError when the detached hash is shorter than seven characters.
   */
  auto ParseHead(types::StringView contents) -> types::Result<types::String>;

  auto ReadBranch(const fs::path& gitDir) -> types::Result<types::String>;

  /// Non-empty lines in `git status --porcelain` output.
  auto CountPorcelainLines(types::StringView output) -> types::i64;

  /// Uncommitted changes in the work tree at @p directory; 0 when git fails.
  auto CountChanges(const fs::path& directory) -> types::i64;

  /**
   * @brief Branch and change count for the repository containing @p directory.
   */
  auto GetGitInfo(const fs::path& directory) -> types::Result<core::session::GitSummary>;
} // namespace ccstatus::services::git
