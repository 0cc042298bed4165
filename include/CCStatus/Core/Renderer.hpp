/**
 * @file Renderer.hpp
 * @brief Joins widgets into one ANSI-styled line.
 */

#pragma once

#include <CCStatus/Utils/Types.hpp>

#include "Theme.hpp"
#include "Widget.hpp"

namespace ccstatus::core::render {
  namespace types = ::ccstatus::utils::types;

  /**
   * @enum Transition
   * @brief Background state between two adjacent widgets.
   */
  enum class Transition : types::u8 {
    BackgroundToBackground,
    BackgroundToPlain,
    Plain,
  };

  [[nodiscard]] auto ClassifyTransition(const widget::Widget& current, const widget::Widget& next) -> Transition;

  /**
   * @brief Renders one segment.
   *
   * `<bg><fg> text <reset>` for a Powerline theme and a widget with a
   * background, `<fg>text<reset>` otherwise.
   */
  [[nodiscard]] auto RenderSegment(const widget::Widget& widget, const theme::Theme& theme) -> types::String;

  /**
   * @brief Separator placed between @p current and @p next.
   *
   * Non-Powerline themes always get a space-padded pipe in the separator
   * color. Powerline themes get an arrow whose color is derived from the
   * current widget's background only, drawn over the next widget's
   * background when it has one; plain-to-plain uses a thin arrow.
   */
  [[nodiscard]] auto RenderSeparator(const widget::Widget& current, const widget::Widget& next, const theme::Theme& theme) -> types::String;

  /// All segments with separators in between. Empty list -> empty string.
  [[nodiscard]] auto Render(types::Span<const widget::Widget> widgets, const theme::Theme& theme) -> types::String;
} // namespace ccstatus::core::render
