#pragma once

#include <algorithm>  // std::copy_n
#include <chrono>     // std::chrono::system_clock
#include <cstdio>     // stderr, stdout
#include <ctime>      // localtime_r, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <mutex>      // std::mutex, std::lock_guard
#include <print>      // std::print
#include <type_traits> // std::is_same_v, std::is_base_of_v
#include <utility>    // std::forward

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace ccstatus::utils::logging {
  namespace types = ::ccstatus::utils::types;

  inline auto GetLogMutex() -> std::mutex& {
    static std::mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes text to stdout or stderr.
   * @param text The text to write
   * @param useStderr Whether to write to stderr instead of stdout
   */
  inline auto WriteToConsole(const types::StringView text, bool useStderr = false) -> void {
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print(stdout, "{}", text);
  }

  enum class LogColor : types::u8 {
    Black         = 0,
    Red           = 1,
    Green         = 2,
    Yellow        = 3,
    Blue          = 4,
    Magenta       = 5,
    Cyan          = 6,
    White         = 7,
    Gray          = 8,
    BrightRed     = 9,
    BrightGreen   = 10,
    BrightYellow  = 11,
    BrightBlue    = 12,
    BrightMagenta = 13,
    BrightCyan    = 14,
    BrightWhite   = 15,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";
    static constexpr types::PCStr DIM_START    = "\033[2m";

    // BOLD + COLOR + TEXT + RESET
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Log levels, most verbose first.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  /**
   * @brief Gets the current runtime log level.
   *
   * Defaults to Warn: the status line runs on every prompt and should stay
   * quiet unless something is actually wrong.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Warn;
    return Level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  /**
   * @brief Applies ANSI styling to text based on the provided style options.
   */
  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 32);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers (user-facing, stdout)
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  /**
   * @brief Returns an ISO8601-like local timestamp (YYYY-MM-DDTHH:MM:SS).
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) != nullptr) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  /**
   * @brief Extracts a module-like target from a function name.
   * @details "auto ccstatus::services::git::GetGitInfo(...)" becomes "ccstatus::services::git".
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    auto         spacePos = func.rfind(' ', lastColonPos);
    types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Core Logging Implementation
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Writes one log event to stderr.
   *
   * Every level goes to stderr; stdout belongs to the status line.
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using std::chrono::system_clock;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);

    types::String line;
    line.reserve(message.size() + 96);

    line += Stylize(timestamp, { .color = LogColor::Gray, .dim = true });
    line += ' ';
    line += GetLevelInfo().at(static_cast<types::usize>(level));
    line += ' ';
#ifndef NDEBUG
    line += Stylize(std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line()), { .color = LogColor::Gray, .italic = true });
    line += ' ';
#else
    (void)loc;
#endif
    line += Stylize(target, { .bold = true });
    line += ": ";
    line += message;
    line += '\n';

    const std::lock_guard lock(GetLogMutex());
    WriteToConsole(line, true);
  }

  /**
   * @brief Logs an error object (StatusError or std::exception) at the given level.
   */
  template <typename ErrorType>
  auto LogError(
    const LogLevel          level,
    const types::StringView target,
    const ErrorType&        errorObj
  ) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    std::source_location logLocation;
    types::String        errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::StatusError>) {
      logLocation      = errorObj.location;
      errorMessagePart = errorObj.message;
    } else {
      logLocation = std::source_location::current();
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = errorObj.what();
      else if constexpr (requires { errorObj.message; })
        errorMessagePart = errorObj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

    LogImpl(level, logLocation, target, "{}", errorMessagePart);
  }
} // namespace ccstatus::utils::logging

#define CCSTATUS_LOG_TARGET ::ccstatus::utils::logging::ExtractTarget(__FUNCTION__)

#define trace_log(fmt, ...) \
  ::ccstatus::utils::logging::LogImpl(::ccstatus::utils::logging::LogLevel::Trace, std::source_location::current(), CCSTATUS_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) \
  ::ccstatus::utils::logging::LogImpl(::ccstatus::utils::logging::LogLevel::Debug, std::source_location::current(), CCSTATUS_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define info_log(fmt, ...) \
  ::ccstatus::utils::logging::LogImpl(::ccstatus::utils::logging::LogLevel::Info, std::source_location::current(), CCSTATUS_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log(fmt, ...) \
  ::ccstatus::utils::logging::LogImpl(::ccstatus::utils::logging::LogLevel::Warn, std::source_location::current(), CCSTATUS_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define error_log(fmt, ...) \
  ::ccstatus::utils::logging::LogImpl(::ccstatus::utils::logging::LogLevel::Error, std::source_location::current(), CCSTATUS_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) \
  ::ccstatus::utils::logging::LogError(::ccstatus::utils::logging::LogLevel::Debug, CCSTATUS_LOG_TARGET, error_obj)

#define warn_at(error_obj) \
  ::ccstatus::utils::logging::LogError(::ccstatus::utils::logging::LogLevel::Warn, CCSTATUS_LOG_TARGET, error_obj)

#define error_at(error_obj) \
  ::ccstatus::utils::logging::LogError(::ccstatus::utils::logging::LogLevel::Error, CCSTATUS_LOG_TARGET, error_obj)
