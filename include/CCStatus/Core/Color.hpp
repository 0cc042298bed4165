/**
 * @file Color.hpp
 * @brief ANSI color tokens and Powerline glyphs.
 *
 * A color is an escape sequence kept as a string. Colors are compared only
 * by their encoded bytes; the single structural operation is
 * BackgroundToForeground(), an explicit lookup over the 16-color palette.
 */

#pragma once

#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::core::color {
  namespace types = ::ccstatus::utils::types;

  /// An encoded ANSI style sequence. Empty means "no color".
  using Color = types::String;

  inline constexpr types::StringView Reset = "\033[0m";
  inline constexpr types::StringView Bold  = "\033[1m";
  inline constexpr types::StringView Dim   = "\033[2m";

  // Foregrounds
  inline constexpr types::StringView Black   = "\033[30m";
  inline constexpr types::StringView Red     = "\033[31m";
  inline constexpr types::StringView Green   = "\033[32m";
  inline constexpr types::StringView Yellow  = "\033[33m";
  inline constexpr types::StringView Blue    = "\033[34m";
  inline constexpr types::StringView Magenta = "\033[35m";
  inline constexpr types::StringView Cyan    = "\033[36m";
  inline constexpr types::StringView White   = "\033[37m";

  inline constexpr types::StringView BrightBlack   = "\033[90m";
  inline constexpr types::StringView BrightRed     = "\033[91m";
  inline constexpr types::StringView BrightGreen   = "\033[92m";
  inline constexpr types::StringView BrightYellow  = "\033[93m";
  inline constexpr types::StringView BrightBlue    = "\033[94m";
  inline constexpr types::StringView BrightMagenta = "\033[95m";
  inline constexpr types::StringView BrightCyan    = "\033[96m";
  inline constexpr types::StringView BrightWhite   = "\033[97m";

  // Backgrounds
  inline constexpr types::StringView BgBlack   = "\033[40m";
  inline constexpr types::StringView BgRed     = "\033[41m";
  inline constexpr types::StringView BgGreen   = "\033[42m";
  inline constexpr types::StringView BgYellow  = "\033[43m";
  inline constexpr types::StringView BgBlue    = "\033[44m";
  inline constexpr types::StringView BgMagenta = "\033[45m";
  inline constexpr types::StringView BgCyan    = "\033[46m";
  inline constexpr types::StringView BgWhite   = "\033[47m";

  inline constexpr types::StringView BgBrightBlack   = "\033[100m";
  inline constexpr types::StringView BgBrightRed     = "\033[101m";
  inline constexpr types::StringView BgBrightGreen   = "\033[102m";
  inline constexpr types::StringView BgBrightYellow  = "\033[103m";
  inline constexpr types::StringView BgBrightBlue    = "\033[104m";
  inline constexpr types::StringView BgBrightMagenta = "\033[105m";
  inline constexpr types::StringView BgBrightCyan    = "\033[106m";
  inline constexpr types::StringView BgBrightWhite   = "\033[107m";

  // Powerline glyphs (Nerd Font private use area)
  inline constexpr types::StringView PowerlineArrow     = "\xEE\x82\xB0"; // U+E0B0
  inline constexpr types::StringView PowerlineThinArrow = "\xEE\x82\xB1"; // U+E0B1
  inline constexpr types::StringView GitBranchGlyph     = "\xEE\x82\xA0"; // U+E0A0

  /// Foreground used when a background has no palette counterpart.
  inline constexpr types::StringView NeutralForeground = White;

  /**
   * @brief Builds a 24-bit foreground sequence `ESC[38;2;r;g;bm`.
   */
  [[nodiscard]] auto TrueColor(types::u8 red, types::u8 green, types::u8 blue) -> Color;

  /**
   * @brief Builds a 24-bit background sequence `ESC[48;2;r;g;bm`.
   */
  [[nodiscard]] auto TrueColorBg(types::u8 red, types::u8 green, types::u8 blue) -> Color;

  /**
   * @brief Maps a palette background to the matching palette foreground.
   *
   * The mapping is a fixed 16-entry table. Anything else, true-color
   * backgrounds included, yields NeutralForeground.
   */
  [[nodiscard]] auto BackgroundToForeground(types::StringView background) -> types::StringView;
} // namespace ccstatus::core::color
