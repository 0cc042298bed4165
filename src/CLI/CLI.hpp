/**
 * @file CLI.hpp
 * @brief Alternate output modes: doctor report, JSON widgets, theme list.
 */

#pragma once

#include <CCStatus/Core/Theme.hpp>
#include <CCStatus/Core/Widget.hpp>
#include <CCStatus/Utils/Types.hpp>

#include "Core/SessionInfo.hpp"

namespace ccstatus::cli {
  /**
   * @brief Print which external sources produced data and why the others
   *        did not.
   */
  auto PrintDoctorReport(const SessionInfo& data) -> utils::types::Unit;

  /**
   * @brief Serialize the widget list as JSON.
   * @return The JSON text, or the glaze error message.
   */
  auto WidgetsToJson(
    utils::types::Span<const core::widget::Widget> widgets,
    const core::theme::Theme&                      theme,
    bool                                           prettyJson
  ) -> utils::types::Result<utils::types::String>;

  /**
   * @brief Print the widget list as JSON instead of an ANSI line.
   * @return The serialization error, if any; nothing is printed then.
   */
  auto PrintWidgetsJson(
    utils::types::Span<const core::widget::Widget> widgets,
    const core::theme::Theme&                      theme,
    bool                                           prettyJson
  ) -> utils::types::Result<>;

  /**
   * @brief Print every built-in theme name, one per line, default first.
   */
  auto PrintThemeList() -> utils::types::Unit;
} // namespace ccstatus::cli
