#include <CCStatus/Services/Git.hpp>

#include <format>       // std::format
#include <system_error> // std::error_code

#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/File.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Process.hpp>
#include <CCStatus/Utils/Strings.hpp>

namespace ccstatus::services::git {
  namespace {
    using namespace ccstatus::utils::types;

    using ccstatus::core::session::GitSummary;
    using ccstatus::utils::file::ReadTextFile;
    using ccstatus::utils::process::RunCommand;
    using ccstatus::utils::process::ShellQuote;
    using ccstatus::utils::strings::Trim;

    using enum ccstatus::utils::error::StatusErrorCode;

    constexpr StringView HEAD_REF_PREFIX = "ref: refs/heads/";
    constexpr usize      SHORT_HASH_LEN  = 7;
  } // namespace

  auto FindGitDir(const fs::path& start) -> Result<fs::path> {
    fs::path dir = start;

    while (true) {
      std::error_code errc;
      fs::path        candidate = dir / ".git";

      if (fs::is_directory(candidate, errc))
        return candidate;

      const fs::path parent = dir.parent_path();

      // The root itself is never searched.
      if (parent == dir || parent == "/" || parent.empty())
        break;

      dir = parent;
    }

    ERR_FMT(NotFound, "No git repository above {}", start.string());
  }

  auto ParseHead(const StringView contents) -> Result<String> {
    const StringView head = Trim(contents);

    if (head.starts_with(HEAD_REF_PREFIX))
      return String(head.substr(HEAD_REF_PREFIX.size()));

    if (head.size() >= SHORT_HASH_LEN)
      return String(head.substr(0, SHORT_HASH_LEN));

    ERR_FMT(ParseError, "Unrecognised HEAD contents '{}'", head);
  }

  auto ReadBranch(const fs::path& gitDir) -> Result<String> {
    const String contents = TRY(ReadTextFile(gitDir / "HEAD"));
    return ParseHead(contents);
  }

  auto CountPorcelainLines(const StringView output) -> i64 {
    const StringView trimmed = Trim(output);

    if (trimmed.empty())
      return 0;

    i64 lines = 1;

    for (const CStr chr : trimmed)
      if (chr == '\n')
        ++lines;

    return lines;
  }

  auto CountChanges(const fs::path& directory) -> i64 {
    Result<String> output = RunCommand(std::format("cd {} && git status --porcelain", ShellQuote(directory.string())));

    if (!output) {
      debug_log("git status failed: {}", output.error().message);
      return 0;
    }

    return CountPorcelainLines(*output);
  }

  auto GetGitInfo(const fs::path& directory) -> Result<GitSummary> {
    const fs::path gitDir = TRY(FindGitDir(directory));
    String         branch = TRY(ReadBranch(gitDir));

    return GitSummary { .branch = std::move(branch), .changes = CountChanges(directory) };
  }
} // namespace ccstatus::services::git
