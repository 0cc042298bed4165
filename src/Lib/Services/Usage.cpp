#include <CCStatus/Services/Usage.hpp>

#include <format> // std::format

#include <CCStatus/Services/Tracking.hpp>
#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Process.hpp>
#include <CCStatus/Utils/Strings.hpp>

namespace ccstatus::services::usage {
  namespace {
    using namespace ccstatus::utils::types;

    using ccstatus::core::metrics::ROLLING_WINDOW;
    using ccstatus::core::metrics::TimePoint;
    using ccstatus::utils::error::StatusError;
    using ccstatus::utils::process::FindExecutable;
    using ccstatus::utils::process::RunCommand;
    using ccstatus::utils::process::ShellQuote;
    using ccstatus::utils::strings::ParseNumber;
    using ccstatus::utils::strings::SplitWhitespace;

    using enum ccstatus::utils::error::StatusErrorCode;

    namespace keys = ccstatus::core::provider::keys;

    struct Patterns {
      std::regex tokens { R"re("tokens"\s*:\s*(\d+)|"totalTokens"\s*:\s*(\d+))re" };
      std::regex inputTokens { R"re("inputTokens"\s*:\s*(\d+))re" };
      std::regex outputTokens { R"re("outputTokens"\s*:\s*(\d+))re" };
      std::regex messages { R"re("messages"\s*:\s*(\d+)|"messageCount"\s*:\s*(\d+))re" };
      std::regex startTime { R"re("start_time"\s*:\s*"([^"]+)")re" };

      std::regex statsDaily { R"re("totalTokens"\s*:\s*(\d+)|total.*tokens.*:\s*(\d+))re" };
      std::regex statsWeekly { R"re("weeklyTokens"\s*:\s*(\d+)|weekly.*tokens.*:\s*(\d+))re" };
      std::regex statsSession { R"re("sessionTokens"\s*:\s*(\d+)|session.*tokens.*:\s*(\d+))re" };
      std::regex statsInput { R"re("inputTokens"\s*:\s*(\d+)|input.*tokens.*:\s*(\d+))re" };
      std::regex statsOutput { R"re("outputTokens"\s*:\s*(\d+)|output.*tokens.*:\s*(\d+))re" };
      std::regex statsMessages { R"re("messages"\s*:\s*(\d+)|message.*count.*:\s*(\d+))re" };
    };

    auto GetPatterns() -> const Patterns& {
      static const Patterns PATTERNS;
      return PATTERNS;
    }
  } // namespace

  auto ExtractCount(const String& text, const std::regex& pattern) -> Option<i64> {
    std::smatch match;

    if (!std::regex_search(text, match, pattern))
      return None;

    for (usize i = 1; i < match.size(); ++i) {
      if (!match[i].matched || match[i].length() == 0)
        continue;

      if (Result<i64> count = ParseNumber<i64>(match[i].str()))
        return *count;
    }

    return None;
  }

  CcusageProvider::CcusageProvider()
    : FieldMapProvider("ccusage") {}

  auto CcusageProvider::load(const StringView command, const StringView sessionId, const TimePoint now) -> Result<> {
    Result<fs::path> executable = FindExecutable(command);

    if (!executable) {
      setLastError(executable.error());
      return Err(executable.error());
    }

    const String   program   = ShellQuote(executable->string());
    Option<String> lastError = None;
    bool           anyOutput = false;

    auto run = [&](const String& arguments) -> Option<String> {
      Result<String> output = RunCommand(std::format("{} {}", program, arguments));

      if (!output) {
        debug_log("ccusage {}: {}", arguments, output.error().message);
        lastError = output.error().message;
        return None;
      }

      anyOutput = true;
      return std::move(*output);
    };

    if (const Option<String> blocks = run("blocks --json"))
      applyBlocks(*blocks, now);

    if (!sessionId.empty()) {
      setText(keys::SessionId, String(sessionId));

      if (const Option<String> session = run(std::format("session {} --json", ShellQuote(sessionId))))
        applySession(*session);
    }

    Option<String> stats = run("stats --json");

    if (!stats)
      stats = run("stats");

    if (stats)
      applyStats(*stats);

    if (!anyOutput) {
      StatusError err(ApiUnavailable, std::format("Every ccusage query failed: {}", lastError.value_or("no output")));
      setLastError(err);
      return Err(std::move(err));
    }

    return {};
  }

  auto CcusageProvider::applyBlocks(const String& text, const TimePoint now) -> Unit {
    const Patterns& patterns = GetPatterns();

    if (const Option<i64> tokens = ExtractCount(text, patterns.tokens))
      setInteger(keys::SessionTokens, *tokens);

    if (const Option<i64> input = ExtractCount(text, patterns.inputTokens))
      setInteger(keys::InputTokens, *input);

    if (const Option<i64> output = ExtractCount(text, patterns.outputTokens))
      setInteger(keys::OutputTokens, *output);

    if (const Option<i64> messages = ExtractCount(text, patterns.messages))
      setInteger(keys::Messages, *messages);

    std::smatch match;

    if (!std::regex_search(text, match, patterns.startTime))
      return;

    const String startText = match[1].str();

    if (Result<TimePoint> start = tracking::ParseRfc3339(startText)) {
      if (*start > now)
        debug_log("Latest ccusage block starts in the future ({}), ignoring it", startText);
      else if (now - *start < ROLLING_WINDOW)
        setText(keys::WindowStart, startText);
      else
        debug_log("Latest ccusage block started at {}, outside the rolling window", startText);
    }
  }

  auto CcusageProvider::applySession(const String& text) -> Unit {
    const Patterns& patterns = GetPatterns();

    const auto overrideIfPositive = [&](const StringView key, const std::regex& pattern) -> void {
      if (const Option<i64> value = ExtractCount(text, pattern); value && *value > 0)
        setInteger(key, *value);
    };

    overrideIfPositive(keys::SessionTokens, patterns.tokens);
    overrideIfPositive(keys::InputTokens, patterns.inputTokens);
    overrideIfPositive(keys::OutputTokens, patterns.outputTokens);
    overrideIfPositive(keys::Messages, patterns.messages);
  }

  auto CcusageProvider::applyStats(const String& text) -> Unit {
    const Patterns& patterns = GetPatterns();

    if (const Option<i64> daily = ExtractCount(text, patterns.statsDaily))
      setInteger(keys::DailyTokens, *daily);

    if (const Option<i64> weekly = ExtractCount(text, patterns.statsWeekly))
      setInteger(keys::WeeklyTokens, *weekly);

    const auto fillIfMissing = [&](const StringView key, const std::regex& pattern) -> void {
      if (integerOr0(key) != 0)
        return;

      if (const Option<i64> value = ExtractCount(text, pattern))
        setInteger(key, *value);
    };

    fillIfMissing(keys::SessionTokens, patterns.statsSession);
    fillIfMissing(keys::InputTokens, patterns.statsInput);
    fillIfMissing(keys::OutputTokens, patterns.statsOutput);
    fillIfMissing(keys::Messages, patterns.statsMessages);
  }

  UsageScriptProvider::UsageScriptProvider()
    : FieldMapProvider("usage_script") {}

  auto UsageScriptProvider::load(const fs::path& script) -> Result<> {
    std::error_code errc;

    if (!fs::exists(script, errc)) {
      StatusError err(NotFound, std::format("Usage script not found: {}", script.string()));
      setLastError(err);
      return Err(std::move(err));
    }

    Result<String> output = RunCommand(ShellQuote(script.string()));

    if (!output) {
      setLastError(output.error());
      return Err(output.error());
    }

    applyOutput(*output);
    return {};
  }

  auto UsageScriptProvider::applyOutput(const StringView text) -> Unit {
    const Vec<StringView> fields = SplitWhitespace(text);

    const auto assign = [&](const usize index, const StringView key) -> void {
      if (Result<i64> value = ParseNumber<i64>(fields[index]))
        setInteger(key, *value);
      else
        debug_log("Usage script field {} ignored: {}", index, value.error().message);
    };

    if (fields.size() < 3) {
      debug_log("Usage script printed {} field(s), expected at least 3", fields.size());
      return;
    }

    assign(0, keys::SessionTokens);
    assign(1, keys::DailyTokens);
    assign(2, keys::Messages);

    if (fields.size() >= 5) {
      assign(3, keys::InputTokens);
      assign(4, keys::OutputTokens);
    }
  }
} // namespace ccstatus::services::usage
