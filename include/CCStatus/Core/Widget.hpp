/**
 * @file Widget.hpp
 * @brief Widget assembly: snapshot + theme -> ordered styled segments.
 */

#pragma once

#include <CCStatus/Utils/Types.hpp>

#include "Color.hpp"
#include "Session.hpp"
#include "Theme.hpp"

namespace ccstatus::core::widget {
  namespace types = ::ccstatus::utils::types;

  using color::Color;

  /**
   * @enum WidgetKind
   * @brief Semantic role of a widget, in display order.
   */
  enum class WidgetKind : types::u8 {
    Identity,
    Path,
    Git,
    Model,
    Remaining,
    Weekly,
    Daily,
    Tokens,
    Cost,
    Messages,
    Efficiency,
    Compaction,
    Latency,
    Timer,
    Reset,
  };

  /**
   * @struct Widget
   * @brief One rendered segment. An empty background marks a plain segment.
   */
  struct Widget {
    WidgetKind    kind;
    types::String text;
    Color         foreground;
    Color         background;

    /// Lower-case category name, e.g. "tokens".
    [[nodiscard]] auto name() const -> types::String;

    [[nodiscard]] auto hasBackground() const -> bool {
      return !background.empty();
    }
  };

  struct WidgetOptions {
    types::usize maxPathLength = 30;
    bool         showLatency   = false;
  };

  /**
   * @brief Builds the widget list in its fixed order.
   *
   * identity, path, git?, model, remaining, weekly|daily?, tokens?, cost?,
   * messages?, efficiency?, compaction?, latency?, timer, reset.
   * Optional widgets are dropped when their metric is zero or absent; the
   * relative order of the rest never changes.
   */
  [[nodiscard]] auto BuildWidgets(
    const session::SessionSnapshot& snapshot,
    const theme::Theme&             theme,
    const WidgetOptions&            options = {}
  ) -> types::Vec<Widget>;
} // namespace ccstatus::core::widget
