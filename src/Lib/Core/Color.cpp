#include <CCStatus/Core/Color.hpp>

#include <format> // std::format

namespace ccstatus::core::color {
  namespace {
    // clang-format off
    constexpr types::Array<types::Pair<types::StringView, types::StringView>, 16> BACKGROUND_TO_FOREGROUND = {{
      { BgBlack,         Black         },
      { BgRed,           Red           },
      { BgGreen,         Green         },
      { BgYellow,        Yellow        },
      { BgBlue,          Blue          },
      { BgMagenta,       Magenta       },
      { BgCyan,          Cyan          },
      { BgWhite,         White         },
      { BgBrightBlack,   BrightBlack   },
      { BgBrightRed,     BrightRed     },
      { BgBrightGreen,   BrightGreen   },
      { BgBrightYellow,  BrightYellow  },
      { BgBrightBlue,    BrightBlue    },
      { BgBrightMagenta, BrightMagenta },
      { BgBrightCyan,    BrightCyan    },
      { BgBrightWhite,   BrightWhite   },
    }};
    // clang-format on
  } // namespace

  auto TrueColor(const types::u8 red, const types::u8 green, const types::u8 blue) -> Color {
    return std::format("\033[38;2;{};{};{}m", red, green, blue);
  }

  auto TrueColorBg(const types::u8 red, const types::u8 green, const types::u8 blue) -> Color {
    return std::format("\033[48;2;{};{};{}m", red, green, blue);
  }

  auto BackgroundToForeground(const types::StringView background) -> types::StringView {
    for (const auto& [bg, fg] : BACKGROUND_TO_FOREGROUND)
      if (bg == background)
        return fg;

    return NeutralForeground;
  }
} // namespace ccstatus::core::color
