#include <CCStatus/Core/Session.hpp>

#include <algorithm> // std::max
#include <format>    // std::format
#include <limits>    // std::numeric_limits

#include <CCStatus/Core/Color.hpp>

namespace ccstatus::core::session {
  namespace {
    using namespace ccstatus::utils::types;

    namespace keys = provider::keys;

    auto Positive(const provider::IMetricsProvider& source, const StringView key) -> i64 {
      const i64 value = source.getInteger(key).value_or(0);
      return value > 0 ? value : 0;
    }

    // Both operands are non-negative.
    constexpr auto SaturatingAdd(const i64 lhs, const i64 rhs) -> i64 {
      constexpr i64 max = std::numeric_limits<i64>::max();

      return lhs > max - rhs ? max : lhs + rhs;
    }
  } // namespace

  auto GitSummary::display() const -> types::String {
    if (changes > 0)
      return std::format("{} {}±{}", color::GitBranchGlyph, branch, changes);

    return std::format("{} {}", color::GitBranchGlyph, branch);
  }

  auto ResolveUsage(
    const provider::IMetricsProvider& script,
    const provider::IMetricsProvider& ccusage,
    const input::StatusInput&         input
  ) -> UsageTotals {
    UsageTotals totals;

    if (const i64 scriptDaily = Positive(script, keys::DailyTokens); scriptDaily > 0) {
      totals.dailyTokens         = scriptDaily;
      totals.sessionInputTokens  = Positive(script, keys::InputTokens);
      totals.sessionOutputTokens = Positive(script, keys::OutputTokens);
      totals.source              = UsageSource::UsageScript;
    } else if (const i64 ccusageDaily = Positive(ccusage, keys::DailyTokens); ccusageDaily > 0) {
      totals.dailyTokens         = ccusageDaily;
      totals.sessionInputTokens  = Positive(ccusage, keys::InputTokens);
      totals.sessionOutputTokens = Positive(ccusage, keys::OutputTokens);
      totals.source              = UsageSource::Ccusage;
    } else if (const i64 inputTotal = input.getTotalTokens(); inputTotal > 0) {
      totals.dailyTokens         = inputTotal;
      totals.sessionInputTokens  = input.getInputTokens();
      totals.sessionOutputTokens = input.getOutputTokens();
      totals.source              = UsageSource::InputTotal;
    } else {
      totals.sessionInputTokens  = std::max<i64>(input.getInputTokens(), 0);
      totals.sessionOutputTokens = std::max<i64>(input.getOutputTokens(), 0);
      totals.dailyTokens         = SaturatingAdd(totals.sessionInputTokens, totals.sessionOutputTokens);
      totals.source              = UsageSource::InputSum;
    }

    if (const i64 weekly = Positive(script, keys::WeeklyTokens); weekly > 0)
      totals.weeklyTokens = weekly;
    else if (const i64 ccWeekly = Positive(ccusage, keys::WeeklyTokens); ccWeekly > 0)
      totals.weeklyTokens = ccWeekly;
    else
      totals.weeklyTokens = Positive(ccusage, keys::DailyTokens);

    if (const i64 messages = Positive(script, keys::Messages); messages > 0)
      totals.messages = messages;
    else
      totals.messages = Positive(ccusage, keys::Messages);

    return totals;
  }
} // namespace ccstatus::core::session
