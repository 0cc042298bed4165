#pragma once

#include <CCStatus/Core/Theme.hpp>
#include <CCStatus/Core/Widget.hpp>
#include <CCStatus/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Core/SessionInfo.hpp"

namespace ccstatus::ui {
  namespace types  = ::ccstatus::utils::types;
  namespace config = ::ccstatus::config;
  namespace widget = ::ccstatus::core::widget;
  namespace theme  = ::ccstatus::core::theme;

  /**
   * @brief Display options taken from the configuration.
   */
  auto GetWidgetOptions(const config::Config& config) -> widget::WidgetOptions;

  /**
   * @brief Builds the widgets for the collected session.
   */
  auto CreateWidgets(const config::Config& config, const cli::SessionInfo& data, const theme::Theme& theme) -> types::Vec<widget::Widget>;

  /**
   * @brief Creates the status line (without a trailing newline).
   * @param config The application configuration.
   * @param data The collected session data.
   * @param theme The resolved theme.
   * @return The rendered ANSI line.
   */
  auto CreateStatusLine(const config::Config& config, const cli::SessionInfo& data, const theme::Theme& theme) -> types::String;
} // namespace ccstatus::ui
