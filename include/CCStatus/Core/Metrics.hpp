/**
 * @file Metrics.hpp
 * @brief Pure calculators turning raw counters into display quantities.
 *
 * Every function here is total: missing or nonsensical input (zero,
 * negative, absent timestamps) degrades to a neutral value. Percentages are
 * rounded to the nearest integer and always clamped to [0, 100].
 */

#pragma once

#include <chrono> // std::chrono::system_clock, std::chrono::seconds

#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::core::metrics {
  namespace types = ::ccstatus::utils::types;

  using TimePoint = std::chrono::system_clock::time_point;

  inline constexpr types::i64 CONTEXT_LIMIT = 200'000;   ///< Context window, in tokens.
  inline constexpr types::i64 DAILY_LIMIT   = 430'000;   ///< Estimated daily token budget.
  inline constexpr types::i64 WEEKLY_LIMIT  = 3'000'000; ///< Estimated weekly token budget.
  inline constexpr types::i64 MESSAGE_LIMIT = 225;       ///< Messages per rolling window.

  inline constexpr types::i64 CHARS_PER_TOKEN = 4;
  inline constexpr types::f64 COMPACTION_RATIO = 0.9;

  /// Context size at which compaction kicks in (floor(CONTEXT_LIMIT * 0.9)).
  inline constexpr types::i64 COMPACTION_THRESHOLD = static_cast<types::i64>(CONTEXT_LIMIT * COMPACTION_RATIO);

  inline constexpr std::chrono::hours ROLLING_WINDOW { 5 };

  /**
   * @struct CostRates
   * @brief USD per one million tokens.
   */
  struct CostRates {
    types::f64 input;
    types::f64 output;

    auto operator==(const CostRates&) const -> bool = default;
  };

  inline constexpr CostRates SONNET_RATES { .input = 3.00, .output = 15.00 };
  inline constexpr CostRates HAIKU_RATES { .input = 0.25, .output = 1.25 };
  inline constexpr CostRates OPUS_RATES { .input = 15.00, .output = 75.00 };

  /**
   * @struct Cost
   * @brief Session and daily cost in USD. Both are currently the same figure.
   */
  struct Cost {
    types::f64 session;
    types::f64 daily;
  };

  /**
   * @struct ResetInfo
   * @brief Time left until a usage limit resets, with the limit's label.
   */
  struct ResetInfo {
    types::String remaining; ///< e.g. "2h 14m", "3d 4h", "0m"
    types::String label;     ///< "5hr", "daily" or "weekly"
  };

  // ── Percentages ──────────────────────────────────────────────────────────

  /**
   * @brief Overall usage: the larger of context and daily consumption.
   *
   * Context tokens are estimated as `contextChars / 4` when no token count is
   * given. Each sub-metric is clamped before taking the maximum.
   */
  [[nodiscard]] auto UsagePercentage(types::i64 dailyTokens, types::i64 contextTokens, types::i64 contextChars) -> types::i32;

  [[nodiscard]] auto DailyUsagePercentage(types::i64 dailyTokens) -> types::i32;

  [[nodiscard]] auto WeeklyUsagePercentage(types::i64 weeklyTokens) -> types::i32;

  /**
   * @brief How close the context is to compaction.
   *
   * Below COMPACTION_THRESHOLD this is progress towards the threshold; at or
   * above it, progress through the remaining "danger zone" up to the limit.
   */
  [[nodiscard]] auto CompactionPercentage(types::i64 contextTokens) -> types::i32;

  /// Context window utilisation as an unrounded percentage in [0, 100].
  [[nodiscard]] auto ContextEfficiency(types::i64 contextTokens) -> types::f64;

  /// 100 minus @p consumed, floored at 0.
  [[nodiscard]] auto RemainingPercentage(types::i32 consumed) -> types::i32;

  // ── Cost ─────────────────────────────────────────────────────────────────

  /// Rates chosen by case-insensitive substring match; Sonnet rates by default.
  [[nodiscard]] auto RatesForModel(types::StringView modelName) -> CostRates;

  [[nodiscard]] auto CalculateCost(types::StringView modelName, types::i64 inputTokens, types::i64 outputTokens) -> Cost;

  // ── Formatting ───────────────────────────────────────────────────────────

  /// 500 -> "500", 5000 -> "5.0k", 2500000 -> "2.5M".
  [[nodiscard]] auto FormatTokens(types::i64 tokens) -> types::String;

  /// 0.005 -> "0.500¢", 0.15 -> "15.00¢", 1.5 -> "$1.50".
  [[nodiscard]] auto FormatCost(types::f64 cost) -> types::String;

  [[nodiscard]] auto FormatEfficiency(types::f64 efficiency) -> types::String;

  /// 250 -> "250ms", 1500 -> "1.5s".
  [[nodiscard]] auto FormatLatency(types::f64 latencyMs) -> types::String;

  /// "{h}h {m}m", or "{m}m" below one hour. Negative durations format as "0m".
  [[nodiscard]] auto FormatHoursMinutes(std::chrono::seconds duration) -> types::String;

  /// "{d}d {h}h", falling back to FormatHoursMinutes() below one day.
  [[nodiscard]] auto FormatDaysHours(std::chrono::seconds duration) -> types::String;

  // ── Paths ────────────────────────────────────────────────────────────────

  /**
   * @brief Shortens @p path to at most @p maxLength bytes of tail.
   *
   * Paths that fit are returned unchanged. Otherwise the last
   * `maxLength - 1` bytes are kept behind an ellipsis; for very small limits
   * (five or fewer) the head is kept instead.
   */
  [[nodiscard]] auto TruncatePath(types::StringView path, types::usize maxLength) -> types::String;

  /// Replaces a leading @p home directory with `~`.
  [[nodiscard]] auto FormatWorkspacePath(types::StringView path, types::StringView home) -> types::String;

  // ── Time ─────────────────────────────────────────────────────────────────

  /**
   * @brief Time left in the 5-hour rolling window.
   *
   * With a known @p windowStart the label is "5hr" and the result is either
   * the remaining time or "0m" once the window has elapsed. Without one the
   * countdown is to the next local midnight, labelled "daily". A start later
   * than @p now is treated as unknown.
   *
   * @param windowStart Start of the current rolling window, if known.
   * @param now Current time.
   * @param localTimeOfDay Time since local midnight.
   */
  [[nodiscard]] auto TimeToReset(const types::Option<TimePoint>& windowStart, TimePoint now, std::chrono::seconds localTimeOfDay) -> ResetInfo;

  /// Time until the next Monday 00:00 UTC (seven days out on a Monday).
  [[nodiscard]] auto TimeToWeeklyReset(TimePoint now) -> ResetInfo;

  /**
   * @brief Time elapsed in the current usage block.
   *
   * Uses @p windowStart when it is known and less than five hours old;
   * otherwise the block is the local 5-hour slot counted from midnight.
   */
  [[nodiscard]] auto BlockElapsed(const types::Option<TimePoint>& windowStart, TimePoint now, std::chrono::seconds localTimeOfDay) -> types::String;

  // ── Model ────────────────────────────────────────────────────────────────

  /**
   * @brief Short model label: "opus", "sonnet" or "haiku" by substring,
   *        otherwise the lower-cased name.
   *
   * @p displayName is preferred; @p modelId is used when it is empty.
   */
  [[nodiscard]] auto ModelDisplayName(types::StringView displayName, types::StringView modelId) -> types::String;
} // namespace ccstatus::core::metrics
