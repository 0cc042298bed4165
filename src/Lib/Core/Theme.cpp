#include <CCStatus/Core/Theme.hpp>

#include <matchit.hpp> // matchit::{match, is, _}

#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Strings.hpp>

namespace ccstatus::core::theme {
  namespace {
    using namespace ccstatus::core::color;
    using namespace ccstatus::utils::types;

    using ccstatus::utils::strings::EqualsIgnoreCase;

    using enum ccstatus::utils::error::StatusErrorCode;

    auto Fg(const StringView foreground) -> Style {
      return Style { .foreground = Color(foreground), .background = {} };
    }

    auto FgBg(const StringView foreground, const StringView background) -> Style {
      return Style { .foreground = Color(foreground), .background = Color(background) };
    }

    auto MakeRoles(
      Style identity,
      Style path,
      Style git,
      Style model,
      Style tokens,
      Style time,
      Style cost,
      Style messages,
      Style efficiency,
      Style latency
    ) -> Array<Style, ROLE_COUNT> {
      return {
        std::move(identity),
        std::move(path),
        std::move(git),
        std::move(model),
        std::move(tokens),
        std::move(time),
        std::move(cost),
        std::move(messages),
        std::move(efficiency),
        std::move(latency),
      };
    }

    auto MakePowerline() -> Theme {
      return Theme {
        .name        = "powerline",
        .displayName = "Powerline",
        .roles       = MakeRoles(
          FgBg(BrightWhite, BgBlue),        // identity
          FgBg(Black, BgBrightCyan),        // path
          FgBg(BrightWhite, BgBrightGreen), // git
          FgBg(BrightWhite, BgMagenta),     // model
          FgBg(BrightWhite, BgBrightBlack), // tokens
          FgBg(BrightWhite, BgBrightBlue),  // time
          FgBg(BrightWhite, BgRed),         // cost
          FgBg(BrightWhite, BgMagenta),     // messages
          FgBg(BrightWhite, BgBrightBlue),  // efficiency
          FgBg(BrightWhite, BgBrightGreen)  // latency
        ),
        .remaining = {
          .lowerBound = 10,
          .upperBound = 30,
          .below      = FgBg(BrightWhite, BgRed),
          .between    = FgBg(Black, BgYellow),
          .above      = FgBg(Black, BgGreen),
        },
        .compaction = {
          .lowerBound = 50,
          .upperBound = 80,
          .below      = FgBg(BrightWhite, BgGreen),
          .between    = FgBg(Black, BgYellow),
          .above      = FgBg(BrightWhite, BgRed),
        },
        .weekly = {
          .lowerBound = 60,
          .upperBound = 85,
          .below      = FgBg(BrightWhite, BgBrightBlue),
          .between    = FgBg(Black, BgYellow),
          .above      = FgBg(BrightWhite, BgRed),
        },
        .separator    = Color(Reset),
        .usePowerline = true,
      };
    }

    auto MakeMinimal() -> Theme {
      return Theme {
        .name        = "minimal",
        .displayName = "Minimal",
        .roles       = MakeRoles(
          Fg(BrightGreen),   // identity
          Fg(BrightBlue),    // path
          Fg(BrightYellow),  // git
          Fg(BrightMagenta), // model
          Fg(BrightBlack),   // tokens
          Fg(BrightCyan),    // time
          Fg(BrightRed),     // cost
          Fg(BrightMagenta), // messages
          Fg(BrightBlue),    // efficiency
          Fg(BrightGreen)    // latency
        ),
        .remaining = {
          .lowerBound = 10,
          .upperBound = 30,
          .below      = Fg(BrightRed),
          .between    = Fg(BrightYellow),
          .above      = Fg(BrightGreen),
        },
        .compaction = {
          .lowerBound = 50,
          .upperBound = 80,
          .below      = Fg(BrightGreen),
          .between    = Fg(BrightYellow),
          .above      = Fg(BrightRed),
        },
        .weekly = {
          .lowerBound = 60,
          .upperBound = 85,
          .below      = Fg(BrightBlue),
          .between    = Fg(BrightYellow),
          .above      = Fg(BrightRed),
        },
        .separator    = Color(BrightBlack),
        .usePowerline = false,
      };
    }

    auto MakeGruvbox() -> Theme {
      const Color orange = TrueColor(254, 128, 25);
      const Color yellow = TrueColor(250, 189, 47);
      const Color red    = TrueColor(251, 73, 52);
      const Color green  = TrueColor(184, 187, 38);
      const Color bright = TrueColor(142, 192, 124);
      const Color aqua   = TrueColor(131, 165, 152);
      const Color purple = TrueColor(211, 134, 155);
      const Color light  = TrueColor(235, 219, 178);

      const Color bg0 = TrueColorBg(40, 40, 40);
      const Color bg1 = TrueColorBg(60, 56, 54);
      const Color bg2 = TrueColorBg(80, 73, 69);
      const Color bg3 = TrueColorBg(102, 92, 84);
      const Color bgS = TrueColorBg(50, 48, 47);

      return Theme {
        .name        = "gruvbox",
        .displayName = "Gruvbox",
        .roles       = MakeRoles(
          FgBg(orange, bg0), // identity
          FgBg(aqua, bg2),   // path
          FgBg(orange, bg1), // git
          FgBg(purple, bg3), // model
          FgBg(light, bgS),  // tokens
          FgBg(bright, bg0), // time
          FgBg(red, bg0),    // cost
          FgBg(purple, bg1), // messages
          FgBg(aqua, bg2),   // efficiency
          FgBg(bright, bgS)  // latency
        ),
        .remaining = {
          .lowerBound = 10,
          .upperBound = 30,
          .below      = FgBg(red, bg1),
          .between    = FgBg(yellow, bg1),
          .above      = FgBg(green, bg1),
        },
        .compaction = {
          .lowerBound = 50,
          .upperBound = 80,
          .below      = FgBg(bright, bg1),
          .between    = FgBg(yellow, bg1),
          .above      = FgBg(red, bg1),
        },
        .weekly = {
          .lowerBound = 60,
          .upperBound = 85,
          .below      = FgBg(aqua, bg1),
          .between    = FgBg(yellow, bg1),
          .above      = FgBg(red, bg1),
        },
        .separator    = TrueColor(80, 73, 69),
        .usePowerline = true,
      };
    }

    auto Registry() -> const Array<Theme, 3>& {
      static const Array<Theme, 3> THEMES = { MakePowerline(), MakeMinimal(), MakeGruvbox() };
      return THEMES;
    }
  } // namespace

  auto ThresholdRule::styleFor(const types::i32 percent) const -> Style {
    using matchit::match, matchit::is, matchit::_;

    return match(percent)(
      is | (_ < lowerBound) = below,
      is | (_ < upperBound) = between,
      is | _                = above
    );
  }

  auto Theme::style(const Role role) const -> const Style& {
    return roles.at(static_cast<types::usize>(role));
  }

  auto GetThemes() -> types::Span<const Theme> {
    return Registry();
  }

  auto GetDefaultTheme() -> const Theme& {
    return Registry().front();
  }

  auto FindTheme(const types::StringView name) -> types::Result<const Theme*> {
    for (const Theme& theme : Registry())
      if (EqualsIgnoreCase(theme.name, name))
        return &theme;

    ERR_FMT(NotFound, "Unknown theme '{}'", name);
  }

  auto GetTheme(const types::StringView name) -> const Theme& {
    if (types::Result<const Theme*> theme = FindTheme(name))
      return **theme;

    if (!name.empty())
      debug_log("Unknown theme '{}', using {}", name, GetDefaultTheme().name);

    return GetDefaultTheme();
  }
} // namespace ccstatus::core::theme
