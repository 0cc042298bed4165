/**
 * @file Provider.hpp
 * @brief Best-effort key/value access to external metrics sources.
 *
 * Every external source (the ccusage CLI, a usage script, the tracking
 * files) is exposed through IMetricsProvider. Calculators and widget
 * assembly never know where a value came from; a source that failed simply
 * reports every field as missing.
 */

#pragma once

#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::core::provider {
  namespace types = ::ccstatus::utils::types;
  namespace error = ::ccstatus::utils::error;

  /**
   * @brief Well-known field names shared by providers and consumers.
   */
  namespace keys {
    inline constexpr types::StringView SessionTokens = "session_tokens";
    inline constexpr types::StringView DailyTokens   = "daily_tokens";
    inline constexpr types::StringView WeeklyTokens  = "weekly_tokens";
    inline constexpr types::StringView InputTokens   = "input_tokens";
    inline constexpr types::StringView OutputTokens  = "output_tokens";
    inline constexpr types::StringView Messages      = "messages";
    inline constexpr types::StringView WindowStart   = "window_start";   ///< RFC3339 text.
    inline constexpr types::StringView SessionId     = "session_id";
    inline constexpr types::StringView LatencyAvgMs  = "latency_avg_ms";
    inline constexpr types::StringView LatencyLastMs = "latency_last_ms";
    inline constexpr types::StringView RequestCount  = "request_count";
  } // namespace keys

  /**
   * @class IMetricsProvider
   * @brief Read-only view of the fields one external source produced.
   */
  class IMetricsProvider {
   public:
    IMetricsProvider()                                           = default;
    IMetricsProvider(const IMetricsProvider&)                    = default;
    IMetricsProvider(IMetricsProvider&&)                         = default;
    virtual ~IMetricsProvider()                                  = default;
    auto operator=(const IMetricsProvider&) -> IMetricsProvider& = default;
    auto operator=(IMetricsProvider&&) -> IMetricsProvider&      = default;

    /// Short identifier, e.g. "ccusage".
    [[nodiscard]] virtual auto getId() const -> types::StringView = 0;

    [[nodiscard]] virtual auto getInteger(types::StringView key) const -> types::Option<types::i64> = 0;

    /// Real-valued field. Integer fields are returned converted.
    [[nodiscard]] virtual auto getNumber(types::StringView key) const -> types::Option<types::f64> = 0;

    [[nodiscard]] virtual auto getText(types::StringView key) const -> types::Option<types::String> = 0;

    /// Why the source produced nothing (or less than expected), if known.
    [[nodiscard]] virtual auto getLastError() const -> const types::Option<error::StatusError>& = 0;
  };

  /**
   * @class FieldMapProvider
   * @brief Map-backed provider; concrete sources fill it once when loaded.
   */
  class FieldMapProvider : public IMetricsProvider {
   public:
    explicit FieldMapProvider(types::String providerId);

    [[nodiscard]] auto getId() const -> types::StringView override;
    [[nodiscard]] auto getInteger(types::StringView key) const -> types::Option<types::i64> override;
    [[nodiscard]] auto getNumber(types::StringView key) const -> types::Option<types::f64> override;
    [[nodiscard]] auto getText(types::StringView key) const -> types::Option<types::String> override;
    [[nodiscard]] auto getLastError() const -> const types::Option<error::StatusError>& override;

    auto setInteger(types::StringView key, types::i64 value) -> types::Unit;
    auto setNumber(types::StringView key, types::f64 value) -> types::Unit;
    auto setText(types::StringView key, types::String value) -> types::Unit;
    auto setLastError(error::StatusError err) -> types::Unit;

    /// Integer field, or 0 when it is missing.
    [[nodiscard]] auto integerOr0(types::StringView key) const -> types::i64;

    [[nodiscard]] auto empty() const -> bool;

   private:
    types::String                                     m_id;
    types::UnorderedMap<types::String, types::i64>    m_integers;
    types::UnorderedMap<types::String, types::f64>    m_numbers;
    types::UnorderedMap<types::String, types::String> m_texts;
    types::Option<error::StatusError>                 m_lastError;
  };
} // namespace ccstatus::core::provider
