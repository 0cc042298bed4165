#include <CCStatus/Core/Metrics.hpp>

#include <algorithm>   // std::clamp, std::max
#include <cmath>       // std::llround
#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, _}

#include <CCStatus/Utils/Strings.hpp>

namespace ccstatus::core::metrics {
  namespace {
    using namespace ccstatus::utils::types;

    using ccstatus::utils::strings::ToLower;

    using std::chrono::days;
    using std::chrono::duration_cast;
    using std::chrono::floor;
    using std::chrono::hours;
    using std::chrono::minutes;
    using std::chrono::seconds;

    // ELLIPSIS "…"
    constexpr StringView ELLIPSIS = "\xE2\x80\xA6";

    auto ClampPercent(const i64 value) -> i32 {
      return static_cast<i32>(std::clamp<i64>(value, 0, 100));
    }

    /// round(part / whole * 100), clamped.
    auto RoundedPercent(const i64 part, const i64 whole) -> i32 {
      if (part <= 0 || whole <= 0)
        return 0;

      return ClampPercent(std::llround(static_cast<f64>(part) / static_cast<f64>(whole) * 100.0));
    }
  } // namespace

  auto UsagePercentage(const i64 dailyTokens, const i64 contextTokens, const i64 contextChars) -> i32 {
    i64 effectiveContext = 0;

    if (contextTokens > 0)
      effectiveContext = contextTokens;
    else if (contextChars > 0)
      effectiveContext = contextChars / CHARS_PER_TOKEN;

    const i32 contextPct = RoundedPercent(effectiveContext, CONTEXT_LIMIT);
    const i32 dailyPct   = RoundedPercent(dailyTokens, DAILY_LIMIT);

    return std::max(contextPct, dailyPct);
  }

  auto DailyUsagePercentage(const i64 dailyTokens) -> i32 {
    return RoundedPercent(dailyTokens, DAILY_LIMIT);
  }

  auto WeeklyUsagePercentage(const i64 weeklyTokens) -> i32 {
    return RoundedPercent(weeklyTokens, WEEKLY_LIMIT);
  }

  auto CompactionPercentage(const i64 contextTokens) -> i32 {
    if (contextTokens <= 0)
      return 0;

    if (contextTokens < COMPACTION_THRESHOLD)
      return RoundedPercent(contextTokens, COMPACTION_THRESHOLD);

    constexpr i64 dangerZone = CONTEXT_LIMIT - COMPACTION_THRESHOLD;
    const i64     remaining  = CONTEXT_LIMIT - contextTokens;

    return ClampPercent(std::llround(static_cast<f64>(dangerZone - remaining) / static_cast<f64>(dangerZone) * 100.0));
  }

  auto ContextEfficiency(const i64 contextTokens) -> f64 {
    if (contextTokens <= 0)
      return 0.0;

    return std::clamp(static_cast<f64>(contextTokens) / static_cast<f64>(CONTEXT_LIMIT) * 100.0, 0.0, 100.0);
  }

  auto RemainingPercentage(const i32 consumed) -> i32 {
    return std::max(0, 100 - consumed);
  }

  auto RatesForModel(const StringView modelName) -> CostRates {
    const String lower = ToLower(modelName);

    if (lower.contains("sonnet"))
      return SONNET_RATES;

    if (lower.contains("haiku"))
      return HAIKU_RATES;

    if (lower.contains("opus"))
      return OPUS_RATES;

    return SONNET_RATES;
  }

  auto CalculateCost(const StringView modelName, const i64 inputTokens, const i64 outputTokens) -> Cost {
    const CostRates rates = RatesForModel(modelName);

    const f64 session =
      (static_cast<f64>(std::max<i64>(inputTokens, 0)) * rates.input +
       static_cast<f64>(std::max<i64>(outputTokens, 0)) * rates.output) /
      1'000'000.0;

    return { .session = session, .daily = session };
  }

  auto FormatTokens(const i64 tokens) -> String {
    using matchit::match, matchit::is, matchit::_;

    return match(tokens)(
      is | (_ > 1'000'000) = [&] -> String { return std::format("{:.1f}M", static_cast<f64>(tokens) / 1'000'000.0); },
      is | (_ > 1'000)     = [&] -> String { return std::format("{:.1f}k", static_cast<f64>(tokens) / 1'000.0); },
      is | _               = [&] -> String { return std::format("{}", tokens); }
    );
  }

  auto FormatCost(const f64 cost) -> String {
    using matchit::match, matchit::is, matchit::_;

    return match(cost)(
      is | (_ < 0.01) = [&] -> String { return std::format("{:.3f}¢", cost * 100.0); },
      is | (_ < 1.0)  = [&] -> String { return std::format("{:.2f}¢", cost * 100.0); },
      is | _          = [&] -> String { return std::format("${:.2f}", cost); }
    );
  }

  auto FormatEfficiency(const f64 efficiency) -> String {
    return std::format("{:.1f}%", efficiency);
  }

  auto FormatLatency(const f64 latencyMs) -> String {
    if (latencyMs < 1000.0)
      return std::format("{:.0f}ms", latencyMs);

    return std::format("{:.1f}s", latencyMs / 1000.0);
  }

  auto FormatHoursMinutes(const seconds duration) -> String {
    if (duration <= seconds::zero())
      return "0m";

    const auto hrs  = duration_cast<hours>(duration);
    const auto mins = duration_cast<minutes>(duration - hrs);

    if (hrs.count() == 0)
      return std::format("{}m", mins.count());

    return std::format("{}h {}m", hrs.count(), mins.count());
  }

  auto FormatDaysHours(const seconds duration) -> String {
    const auto dys = duration_cast<days>(duration);

    if (dys.count() <= 0)
      return FormatHoursMinutes(duration);

    const auto hrs = duration_cast<hours>(duration - dys);
    return std::format("{}d {}h", dys.count(), hrs.count());
  }

  auto TruncatePath(const StringView path, const usize maxLength) -> String {
    if (path.size() <= maxLength)
      return String(path);

    if (maxLength > 5)
      return String(ELLIPSIS) + String(path.substr(path.size() - (maxLength - 1)));

    return String(path.substr(0, maxLength));
  }

  auto FormatWorkspacePath(const StringView path, const StringView home) -> String {
    if (home.empty() || home == "/" || !path.starts_with(home))
      return String(path);

    const StringView rest = path.substr(home.size());

    // "/home/al" must not match "/home/alice".
    if (!rest.empty() && rest.front() != '/')
      return String(path);

    return "~" + String(rest);
  }

  auto TimeToReset(const Option<TimePoint>& windowStart, const TimePoint now, const seconds localTimeOfDay) -> ResetInfo {
    // A start in the future is clock skew; count to midnight instead.
    if (windowStart && *windowStart <= now) {
      const auto elapsed = duration_cast<seconds>(now - *windowStart);

      if (elapsed < ROLLING_WINDOW)
        return { .remaining = FormatHoursMinutes(ROLLING_WINDOW - elapsed), .label = "5hr" };

      return { .remaining = "0m", .label = "5hr" };
    }

    const seconds untilMidnight = days { 1 } - localTimeOfDay;
    return { .remaining = FormatHoursMinutes(untilMidnight), .label = "daily" };
  }

  auto TimeToWeeklyReset(const TimePoint now) -> ResetInfo {
    using std::chrono::Monday;
    using std::chrono::sys_days;
    using std::chrono::weekday;

    const sys_days today = floor<days>(now);
    days           ahead = Monday - weekday { today };

    if (ahead.count() == 0)
      ahead = days { 7 };

    const auto untilReset = duration_cast<seconds>((today + ahead) - now);

    return { .remaining = FormatDaysHours(untilReset), .label = "weekly" };
  }

  auto BlockElapsed(const Option<TimePoint>& windowStart, const TimePoint now, const seconds localTimeOfDay) -> String {
    if (windowStart) {
      const auto elapsed = duration_cast<seconds>(now - *windowStart);

      if (elapsed >= seconds::zero() && elapsed < ROLLING_WINDOW)
        return FormatHoursMinutes(elapsed);
    }

    const auto    hourOfDay  = duration_cast<hours>(localTimeOfDay);
    const hours   blockStart = (hourOfDay / ROLLING_WINDOW) * ROLLING_WINDOW;

    return FormatHoursMinutes(localTimeOfDay - blockStart);
  }

  auto ModelDisplayName(const StringView displayName, const StringView modelId) -> String {
    const String lower = ToLower(displayName.empty() ? modelId : displayName);

    if (lower.empty())
      return "unknown";

    for (const StringView family : { StringView("opus"), StringView("sonnet"), StringView("haiku") })
      if (lower.contains(family))
        return String(family);

    return lower;
  }
} // namespace ccstatus::core::metrics
