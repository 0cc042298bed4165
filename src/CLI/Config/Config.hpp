#pragma once

#include <filesystem> // std::filesystem::path
#include <pwd.h>      // getpwuid, passwd
#include <unistd.h>   // getuid

#include <CCStatus/Utils/Env.hpp>
#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::config {
  namespace fs    = std::filesystem;
  namespace types = ::ccstatus::utils::types;

  inline constexpr types::usize DEFAULT_MAX_PATH_LENGTH = 30;

  /**
   * @struct General
   * @brief Holds general configuration settings.
   */
  struct General {
    types::Option<types::String> theme; ///< Theme name; unknown names fall back to the default theme.

    /**
     * @brief Login name of the current user.
     *
     * Tries getpwuid first, then the USER and LOGNAME environment variables.
     */
    static auto getDefaultName() -> types::String {
      using ccstatus::utils::env::GetEnv;

      const passwd*                      pwd        = getpwuid(getuid());
      types::PCStr                       pwdName    = pwd ? pwd->pw_name : nullptr;
      const types::Result<types::String> envUser    = GetEnv("USER");
      const types::Result<types::String> envLogname = GetEnv("LOGNAME");

      return pwdName ? pwdName
        : envUser    ? *envUser
        : envLogname ? *envLogname
                     : "user";
    }
  };

  struct Display {
    types::usize maxPathLength = DEFAULT_MAX_PATH_LENGTH;
    bool         showLatency   = false;
  };

  /**
   * @struct Sources
   * @brief Where external usage data comes from.
   */
  struct Sources {
    types::String ccusageCommand = "ccusage";
    fs::path      trackingDir; ///< Directory holding latency.txt, session_start and current_session.
    fs::path      usageScript; ///< Defaults to calculate-usage.sh inside trackingDir.

    /// $HOME/.claude, or ./.claude when HOME is unset.
    static auto getDefaultTrackingDir() -> fs::path;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General general;
    Display display;
    Sources sources;

    Config();

    /**
     * @brief Loads the first configuration file found, or built-in defaults.
     *
     * A file that cannot be read or parsed is reported with a warning and
     * ignored; this never fails.
     */
    static auto getInstance() -> Config;

    /**
     * @brief Candidate configuration locations, most specific first.
     *
     * Only XDG and HOME locations; the working directory is never searched.
     */
    static auto getCandidatePaths() -> types::Vec<fs::path>;

    /**
     * @brief The first candidate that exists, if any. Nothing is created.
     */
    static auto getConfigPath() -> types::Option<fs::path>;
  };
} // namespace ccstatus::config
