#include "Config.hpp"

#include <algorithm>      // std::min
#include <glaze/toml.hpp> // glz::{read, opts, TOML, file_to_buffer, format_error, context}
#include <system_error>   // std::error_code

#include <CCStatus/Utils/Env.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Types.hpp>

using namespace ccstatus::utils::types;
using ccstatus::utils::env::GetEnv;

// glaze's TOML reader has no std::optional support; empty strings and zero
// values mean "not provided".
namespace {
  struct TomlGeneral {
    String theme;
  };

  struct TomlDisplay {
    i64  maxPathLength = 0;
    bool showLatency   = false;
  };

  struct TomlSources {
    String ccusageCommand;
    String usageScript;
    String trackingDir;
  };

  struct TomlConfig {
    TomlGeneral general;
    TomlDisplay display;
    TomlSources sources;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlGeneral> {
  using T                     = TomlGeneral;
  static constexpr auto value = object("theme", &T::theme);
};

template <>
struct glz::meta<TomlDisplay> {
  using T                     = TomlDisplay;
  static constexpr auto value = object("max_path_length", &T::maxPathLength, "show_latency", &T::showLatency);
};

template <>
struct glz::meta<TomlSources> {
  using T                     = TomlSources;
  static constexpr auto value = object("ccusage_command", &T::ccusageCommand, "usage_script", &T::usageScript, "tracking_dir", &T::trackingDir);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("general", &T::general, "display", &T::display, "sources", &T::sources);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace ccstatus::config {
  namespace {
    constexpr PCStr APP_DIR     = "ccstatus";
    constexpr PCStr CONFIG_FILE = "config.toml";
    constexpr PCStr SCRIPT_NAME = "calculate-usage.sh";

    /// Expands a leading `~/`.
    auto ExpandHome(const String& path) -> fs::path {
      if (path == "~" || path.starts_with("~/"))
        if (Result<String> home = GetEnv("HOME"))
          return fs::path(*home) / path.substr(std::min<usize>(path.size(), 2));

      return fs::path(path);
    }
  } // namespace

  auto Sources::getDefaultTrackingDir() -> fs::path {
    if (Result<String> home = GetEnv("HOME"))
      return fs::path(*home) / ".claude";

    return fs::path(".") / ".claude";
  }

  Config::Config() {
    sources.trackingDir = Sources::getDefaultTrackingDir();
    sources.usageScript = sources.trackingDir / SCRIPT_NAME;
  }

  auto Config::getCandidatePaths() -> Vec<fs::path> {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / APP_DIR / CONFIG_FILE);

    if (Result<String> result = GetEnv("HOME")) {
      possiblePaths.emplace_back(fs::path(*result) / ".config" / APP_DIR / CONFIG_FILE);
      possiblePaths.emplace_back(fs::path(*result) / ".ccstatus" / CONFIG_FILE);
    }

    // The working directory is the user's project, whose config.toml is not ours.
    return possiblePaths;
  }

  auto Config::getConfigPath() -> Option<fs::path> {
    for (const fs::path& path : getCandidatePaths())
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return None;
  }

  auto Config::getInstance() -> Config {
    Config cfg;

    const Option<fs::path> configPath = getConfigPath();

    if (!configPath) {
      debug_log("No config file found, using defaults");
      return cfg;
    }

    TomlConfig   tomlCfg;
    String       buffer;
    glz::context ctx {};

    ctx.current_file = configPath->string();

    if (const auto fileError = glz::file_to_buffer(buffer, ctx.current_file); bool(fileError)) {
      warn_log("Failed to read config file: {}", configPath->string());
      return cfg;
    }

    const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer, ctx);

    if (readError) {
      warn_log("Failed to parse config file {}: {}", configPath->string(), glz::format_error(readError, buffer));
      return cfg;
    }

    debug_log("Config loaded from {}", configPath->string());

    if (!tomlCfg.general.theme.empty())
      cfg.general.theme = tomlCfg.general.theme;

    if (tomlCfg.display.maxPathLength > 0)
      cfg.display.maxPathLength = static_cast<usize>(tomlCfg.display.maxPathLength);
    else if (tomlCfg.display.maxPathLength < 0)
      warn_log("Ignoring negative max_path_length {}", tomlCfg.display.maxPathLength);

    cfg.display.showLatency = tomlCfg.display.showLatency;

    if (!tomlCfg.sources.ccusageCommand.empty())
      cfg.sources.ccusageCommand = tomlCfg.sources.ccusageCommand;

    if (!tomlCfg.sources.trackingDir.empty()) {
      cfg.sources.trackingDir = ExpandHome(tomlCfg.sources.trackingDir);
      cfg.sources.usageScript = cfg.sources.trackingDir / SCRIPT_NAME;
    }

    if (!tomlCfg.sources.usageScript.empty())
      cfg.sources.usageScript = ExpandHome(tomlCfg.sources.usageScript);

    return cfg;
  }
} // namespace ccstatus::config
