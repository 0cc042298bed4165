/**
 * @file Usage.hpp
 * @brief Token and message totals scraped from external tools.
 *
 * Both sources are best-effort. Output is matched with regular expressions
 * (ccusage) or split on whitespace (the usage script); anything that does not
 * match leaves the corresponding field missing.
 */

#pragma once

#include <filesystem> // std::filesystem::path
#include <regex>      // std::regex

#include <CCStatus/Core/Metrics.hpp>
#include <CCStatus/Core/Provider.hpp>
#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::services::usage {
  namespace fs    = std::filesystem;
  namespace types = ::ccstatus::utils::types;

  /**
   * @brief Runs @p pattern against @p text and returns the first non-empty
   *        capture group that parses as an integer.
   */
  auto ExtractCount(const types::String& text, const std::regex& pattern) -> types::Option<types::i64>;

  /**
   * @class CcusageProvider
   * @brief Fields scraped from `ccusage blocks`, `ccusage session` and
   *        `ccusage stats`.
   */
  class CcusageProvider : public core::provider::FieldMapProvider {
   public:
    CcusageProvider();

    /**
     * @brief Locates @p command on PATH and runs its subcommands.
     *
     * The session query only runs when @p sessionId is non-empty. Stats are
     * requested as JSON first and as plain text if that fails.
     *
     * @return NotFound when the executable is missing; ApiUnavailable when
     *         every subcommand failed.
     */
    auto load(types::StringView command, types::StringView sessionId, core::metrics::TimePoint now) -> types::Result<>;

    /// Current block: session/input/output tokens, messages and an active window start.
    auto applyBlocks(const types::String& text, core::metrics::TimePoint now) -> types::Unit;

    /// Session-specific values; only positive values override block values.
    auto applySession(const types::String& text) -> types::Unit;

    /// Daily and weekly totals; fills session fields still missing.
    auto applyStats(const types::String& text) -> types::Unit;
  };

  /**
   * @class UsageScriptProvider
   * @brief Fields printed by the user's calculate-usage script.
   *
   * Output of five or more whitespace-separated integers is read as session
   * tokens, daily tokens, messages, input tokens, output tokens; three or four
   * as session tokens, daily tokens, messages.
   */
  class UsageScriptProvider : public core::provider::FieldMapProvider {
   public:
    UsageScriptProvider();

    /**
     * @brief Runs @p script if it exists.
     * @return NotFound when the script is absent, or the execution error.
     */
    auto load(const fs::path& script) -> types::Result<>;

    auto applyOutput(types::StringView text) -> types::Unit;
  };
} // namespace ccstatus::services::usage
