/**
 * @file Session.hpp
 * @brief Everything one render needs, gathered up front.
 *
 * Widget assembly is a pure function of a SessionSnapshot, a theme and
 * display options; the snapshot is the only place where data from stdin,
 * the environment and external providers meets.
 */

#pragma once

#include <chrono> // std::chrono::seconds

#include <CCStatus/Utils/Types.hpp>

#include "Input.hpp"
#include "Metrics.hpp"
#include "Provider.hpp"

namespace ccstatus::core::session {
  namespace types = ::ccstatus::utils::types;

  using metrics::TimePoint;

  /**
   * @enum UsageSource
   * @brief Where the resolved daily token figure came from.
   */
  enum class UsageSource : types::u8 {
    UsageScript, ///< The user's calculate-usage script.
    Ccusage,     ///< The ccusage CLI.
    InputTotal,  ///< totalTokens from the stdin envelope.
    InputSum,    ///< inputTokens + outputTokens from the stdin envelope.
  };

  struct UsageTotals {
    types::i64  dailyTokens         = 0;
    types::i64  weeklyTokens        = 0;
    types::i64  sessionInputTokens  = 0;
    types::i64  sessionOutputTokens = 0;
    types::i64  messages            = 0;
    UsageSource source              = UsageSource::InputSum;
  };

  struct GitSummary {
    types::String branch;
    types::i64    changes = 0; ///< Lines reported by `git status --porcelain`.

    /// "<glyph> branch" or "<glyph> branch±N".
    [[nodiscard]] auto display() const -> types::String;
  };

  struct LatencySample {
    types::f64 averageMs    = 0.0;
    types::f64 lastMs       = 0.0;
    types::i64 requestCount = 0;
  };

  /**
   * @struct SessionSnapshot
   * @brief Immutable input to widget assembly.
   */
  struct SessionSnapshot {
    types::String                user;
    types::String                host;          ///< Short host name (up to the first dot).
    types::String                workspacePath; ///< Home prefix already replaced by `~`.
    types::Option<GitSummary>    git;
    types::String                modelDisplayName;
    types::String                modelId;
    UsageTotals                  usage;
    types::i64                   contextTokens     = 0;
    types::i64                   contextCharacters = 0;
    types::Option<LatencySample> latency;
    types::Option<TimePoint>     windowStart;
    TimePoint                    now;
    std::chrono::seconds         localTimeOfDay { 0 };
  };

  /**
   * @brief Picks token, weekly and message totals from the available sources.
   *
   * Daily tokens come from the usage script, then ccusage, then the input's
   * total, then input + output; session input/output tokens come from the
   * same source. Weekly tokens: script, ccusage weekly, ccusage daily, 0.
   * Messages: script, ccusage, 0. A value only counts when it is positive.
   */
  [[nodiscard]] auto ResolveUsage(
    const provider::IMetricsProvider& script,
    const provider::IMetricsProvider& ccusage,
    const input::StatusInput&         input
  ) -> UsageTotals;
} // namespace ccstatus::core::session
