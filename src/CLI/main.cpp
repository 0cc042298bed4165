#include <cstdlib>                   // EXIT_SUCCESS, EXIT_FAILURE
#include <format>                    // std::format
#include <iostream>                  // std::cin
#include <iterator>                  // std::istreambuf_iterator
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, case_insensitive}
#include <unistd.h>                  // isatty, STDIN_FILENO

#include <CCStatus/Core/Input.hpp>
#include <CCStatus/Core/Theme.hpp>
#include <CCStatus/Core/Widget.hpp>
#include <CCStatus/Utils/ArgumentParser.hpp>
#include <CCStatus/Utils/Env.hpp>
#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"
#include "Core/SessionInfo.hpp"
#include "UI/UI.hpp"

#ifndef CCSTATUS_VERSION
  #define CCSTATUS_VERSION "0.0.0"
#endif

using namespace ccstatus::utils::types;
using namespace ccstatus::utils::logging;
using namespace ccstatus::config;
using namespace ccstatus::ui;
using namespace ccstatus::cli;

using ccstatus::utils::env::GetEnv;

using enum ccstatus::utils::error::StatusErrorCode;

struct CliOptions {
  // Modes
  bool doctorMode     = false;
  bool listThemes     = false;
  bool showConfigPath = false;

  // Output options
  bool   jsonOutput = false;
  bool   prettyJson = false;
  String theme;
};

namespace {
  auto ReadStdin() -> Result<String> {
    String text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    if (std::cin.bad())
      ERR(IoError, "Failed to read standard input");

    return text;
  }

  /// --theme, then CCSTATUS_THEME, then the config file.
  auto ResolveThemeName(const CliOptions& opts, const Config& config) -> String {
    if (!opts.theme.empty())
      return opts.theme;

    if (Result<String> fromEnv = GetEnv("CCSTATUS_THEME"))
      return *fromEnv;

    return config.general.theme.value_or("");
  }
} // namespace

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  CliOptions opts;

  {
    using ccstatus::utils::argparse::ArgumentParser;

#ifdef CCSTATUS_GIT_HASH
    String versionString = std::format("ccstatus {} [{}]", CCSTATUS_VERSION, CCSTATUS_GIT_HASH);
#else
    String versionString = std::format("ccstatus {}", CCSTATUS_VERSION);
#endif

    ArgumentParser parser("ccstatus", versionString);

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level. Overrides CCSTATUS_LOG_LEVEL.")
      .defaultValue(LogLevel::Warn);

    parser
      .addArguments("-t", "--theme")
      .help("Theme to render with. Overrides CCSTATUS_THEME and the config file.")
      .defaultValue(String(""))
      .bindTo(opts.theme);

    parser
      .addArguments("--list-themes")
      .help("List the built-in themes and exit.")
      .flag()
      .bindTo(opts.listThemes);

    parser
      .addArguments("-d", "--doctor")
      .help("Reports which external sources failed and why.")
      .flag()
      .bindTo(opts.doctorMode);

    parser
      .addArguments("--json")
      .help("Output the widget list as JSON instead of an ANSI line.")
      .flag()
      .bindTo(opts.jsonOutput);

    parser
      .addArguments("--pretty")
      .help("Pretty-print JSON output. Only valid when --json is used.")
      .flag()
      .bindTo(opts.prettyJson);

    parser
      .addArguments("--show-config-path")
      .help("Display the active configuration file location.")
      .flag()
      .bindTo(opts.showConfigPath);

    if (Result<> result = parser.parseInto({ argv, static_cast<usize>(argc) }); !result) {
      error_at(result.error());
      return EXIT_FAILURE;
    }

    if (parser.helpRequested()) {
      parser.printHelp();
      return EXIT_SUCCESS;
    }

    if (parser.versionRequested()) {
      Println("{}", parser.getVersion());
      return EXIT_SUCCESS;
    }

    LogLevel level = LogLevel::Warn;

    if (parser.get<bool>("--verbose"))
      level = LogLevel::Debug;
    else if (parser.isUsed("--log-level"))
      level = parser.getEnum<LogLevel>("--log-level");
    else if (Result<String> fromEnv = GetEnv("CCSTATUS_LOG_LEVEL")) {
      if (const Option<LogLevel> parsed = magic_enum::enum_cast<LogLevel>(*fromEnv, magic_enum::case_insensitive))
        level = *parsed;
      else
        warn_log("Ignoring unknown CCSTATUS_LOG_LEVEL '{}'", *fromEnv);
    }

    SetRuntimeLogLevel(level);
  }

  if (opts.listThemes) {
    PrintThemeList();
    return EXIT_SUCCESS;
  }

  if (opts.showConfigPath) {
    if (const Option<fs::path> path = Config::getConfigPath())
      Println("{}", path->string());
    else
      Println("No configuration file found; using built-in defaults.");

    return EXIT_SUCCESS;
  }

  const Config config = Config::getInstance();

  const ccstatus::core::theme::Theme& theme = ccstatus::core::theme::GetTheme(ResolveThemeName(opts, config));

  ccstatus::core::input::StatusInput input;

  // The doctor report works without a piped envelope.
  if (!opts.doctorMode || isatty(STDIN_FILENO) == 0) {
    Result<String> text = ReadStdin();

    if (!text) {
      error_at(text.error());
      return EXIT_FAILURE;
    }

    Result<ccstatus::core::input::StatusInput> parsed = ccstatus::core::input::ParseStatusInput(*text);

    if (!parsed) {
      if (!opts.doctorMode) {
        error_at(parsed.error());
        return EXIT_FAILURE;
      }

      warn_at(parsed.error());
    } else {
      input = std::move(*parsed);
    }
  }

  const SessionInfo data(config, input);

  if (opts.doctorMode)
    PrintDoctorReport(data);
  else if (opts.jsonOutput) {
    if (Result<> printed = PrintWidgetsJson(CreateWidgets(config, data, theme), theme, opts.prettyJson); !printed) {
      error_at(printed.error());
      return EXIT_FAILURE;
    }
  } else
    Println("{}", CreateStatusLine(config, data, theme));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
