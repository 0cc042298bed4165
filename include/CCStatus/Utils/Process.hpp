#pragma once

#include <array>        // std::array
#include <cstdio>       // FILE, popen, pclose, fgets
#include <filesystem>   // std::filesystem::path, std::filesystem::is_regular_file
#include <sys/wait.h>   // WIFEXITED, WEXITSTATUS
#include <system_error> // std::error_code
#include <unistd.h>     // access, X_OK

#include "Env.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace ccstatus::utils::process {
  namespace types = ::ccstatus::utils::types;
  namespace error = ::ccstatus::utils::error;
  namespace fs    = std::filesystem;

  using enum error::StatusErrorCode;

  /**
   * @brief Quotes @p arg for safe interpolation into a `sh -c` command line.
   */
  inline auto ShellQuote(types::StringView arg) -> types::String {
    types::String quoted = "'";

    for (const char chr : arg)
      if (chr == '\'')
        quoted += "'\\''";
      else
        quoted += chr;

    quoted += '\'';
    return quoted;
  }

  /**
   * @brief Searches PATH for an executable named @p name.
   * @return Full path to the executable, or NotFound.
   */
  inline auto FindExecutable(types::StringView name) -> types::Result<fs::path> {
    if (name.empty())
      ERR(InvalidArgument, "Empty executable name");

    // Names with a slash are paths already.
    if (name.find('/') != types::StringView::npos) {
      fs::path candidate(name);
      if (access(candidate.c_str(), X_OK) == 0)
        return candidate;

      ERR_FMT(NotFound, "'{}' is not executable", name);
    }

    const types::String pathVar = env::GetEnvOr("PATH", "/usr/local/bin:/usr/bin:/bin");

    types::usize start = 0;
    while (start <= pathVar.size()) {
      types::usize end = pathVar.find(':', start);
      if (end == types::String::npos)
        end = pathVar.size();

      const types::StringView dir(pathVar.data() + start, end - start);

      if (!dir.empty()) {
        std::error_code errc;
        fs::path        candidate = fs::path(dir) / name;

        if (fs::is_regular_file(candidate, errc) && access(candidate.c_str(), X_OK) == 0)
          return candidate;
      }

      start = end + 1;
    }

    ERR_FMT(NotFound, "'{}' not found in PATH", name);
  }

  /**
   * @brief Runs @p command through `/bin/sh` and captures its standard output.
   *
   * Standard error of the child is discarded. A non-zero exit status is an
   * error even when some output was produced.
   *
   * @param command Shell command line.
   * @return Captured stdout on success.
   */
  inline auto RunCommand(const types::String& command) -> types::Result<types::String> {
    const types::String fullCommand = command + " 2>/dev/null";

    FILE* pipe = popen(fullCommand.c_str(), "r");
    if (!pipe)
      ERR_FMT(ApiUnavailable, "popen failed for '{}'", command);

    types::String           output;
    types::Array<char, 512> buffer {};

    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr)
      output += buffer.data();

    const types::i32 status = pclose(pipe);

    if (status == -1)
      ERR_FMT(IoError, "pclose failed for '{}'", command);

    if (!WIFEXITED(status))
      ERR_FMT(Other, "'{}' terminated abnormally", command);

    if (const types::i32 code = WEXITSTATUS(status); code != 0)
      ERR_FMT(Other, "'{}' exited with status {}", command, code);

    return output;
  }
} // namespace ccstatus::utils::process
