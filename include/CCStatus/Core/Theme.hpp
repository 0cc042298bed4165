/**
 * @file Theme.hpp
 * @brief Theme registry: named, immutable style profiles.
 *
 * A Theme is plain data. Static roles carry a fixed foreground/background
 * pair; usage-driven widgets consult a ThresholdRule, which maps an integer
 * percentage to a style at widget-build time.
 */

#pragma once

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_count

#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Types.hpp>

#include "Color.hpp"

namespace ccstatus::core::theme {
  namespace types = ::ccstatus::utils::types;

  using color::Color;

  /**
   * @enum Role
   * @brief Widget categories with a fixed style.
   */
  enum class Role : types::u8 {
    Identity,
    Path,
    Git,
    Model,
    Tokens,
    Time,
    Cost,
    Messages,
    Efficiency,
    Latency,
  };

  inline constexpr types::usize ROLE_COUNT = magic_enum::enum_count<Role>();

  /**
   * @struct Style
   * @brief Foreground/background pair. An empty background marks a plain segment.
   */
  struct Style {
    Color foreground;
    Color background;

    [[nodiscard]] auto hasBackground() const -> bool {
      return !background.empty();
    }

    auto operator==(const Style&) const -> bool = default;
  };

  /**
   * @struct ThresholdRule
   * @brief Three-band mapping from a percentage to a style.
   *
   * `percent < lowerBound` selects @ref below, `percent < upperBound`
   * selects @ref between, anything else @ref above.
   */
  struct ThresholdRule {
    types::i32 lowerBound;
    types::i32 upperBound;
    Style      below;
    Style      between;
    Style      above;

    [[nodiscard]] auto styleFor(types::i32 percent) const -> Style;
  };

  /**
   * @struct Theme
   * @brief A named bundle of style rules applied to every widget of one render.
   */
  struct Theme {
    types::String                   name;         ///< Lookup key, e.g. "powerline".
    types::String                   displayName;  ///< Human-readable name, e.g. "Powerline".
    types::Array<Style, ROLE_COUNT> roles;        ///< Indexed by Role.
    ThresholdRule                   remaining;    ///< Remaining-usage widget (input: percent left).
    ThresholdRule                   compaction;   ///< Compaction widget (input: percent consumed).
    ThresholdRule                   weekly;       ///< Weekly/daily widget (input: percent consumed).
    Color                           separator;    ///< Color of plain separators.
    bool                            usePowerline; ///< Arrow separators and background blocks.

    [[nodiscard]] auto style(Role role) const -> const Style&;
  };

  /**
   * @brief All registered themes; the default (powerline) is first.
   */
  [[nodiscard]] auto GetThemes() -> types::Span<const Theme>;

  /**
   * @brief Looks up a theme by name (case-insensitive).
   * @return NotFound for unknown names.
   */
  [[nodiscard]] auto FindTheme(types::StringView name) -> types::Result<const Theme*>;

  /**
   * @brief Looks up a theme by name, falling back to the default theme.
   *
   * Never fails: an empty or unknown name yields the powerline theme.
   */
  [[nodiscard]] auto GetTheme(types::StringView name) -> const Theme&;

  [[nodiscard]] auto GetDefaultTheme() -> const Theme&;
} // namespace ccstatus::core::theme
