#pragma once

#include <filesystem> // std::filesystem::path

#include <CCStatus/Core/Metrics.hpp>
#include <CCStatus/Core/Provider.hpp>
#include <CCStatus/Core/Session.hpp>
#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::services::tracking {
  namespace fs    = std::filesystem;
  namespace types = ::ccstatus::utils::types;

  inline constexpr types::StringView LATENCY_FILE       = "latency.txt";
  inline constexpr types::StringView SESSION_START_FILE = "session_start";
  inline constexpr types::StringView SESSION_ID_FILE    = "current_session";

  /**
   * @brief Parses an RFC3339 timestamp ("2024-01-01T10:00:00Z",
   *        "2024-01-01T10:00:00.123+02:00").
   *
   * Surrounding whitespace is ignored. A time zone designator is required.
   * @return ParseError on anything else.
   */
  auto ParseRfc3339(types::StringView text) -> types::Result<core::metrics::TimePoint>;

  /**
   * @brief Parses the latency sample file: average ms, last ms and request
   *        count on the first three lines.
   *
   * Fewer than three lines is an error. A line that does not parse leaves its
   * field at zero.
   */
  auto ParseLatency(types::StringView text) -> types::Result<core::session::LatencySample>;

  /**
   * @class TrackingProvider
   * @brief Exposes the flat files in the tracking directory.
   *
   * Fields: latency_avg_ms, latency_last_ms, request_count, window_start,
   * session_id. Each file is optional.
   */
  class TrackingProvider : public core::provider::FieldMapProvider {
   public:
    TrackingProvider();

    /**
     * @brief Reads every tracking file under @p directory.
     * @return NotFound when the directory itself does not exist; missing or
     *         malformed files are skipped.
     */
    auto load(const fs::path& directory) -> types::Result<>;

    /// Latency fields as one sample, if the latency file was read.
    [[nodiscard]] auto latency() const -> types::Option<core::session::LatencySample>;
  };
} // namespace ccstatus::services::tracking
