#include <boost/ut.hpp>

#include <CCStatus/Core/Color.hpp>
#include <CCStatus/Core/Theme.hpp>
#include <CCStatus/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace ccstatus::core;
  using namespace ccstatus::utils::types;

  "True color sequences"_test = [] -> void {
    expect(color::TrueColor(254, 128, 25) == String("\033[38;2;254;128;25m"));
    expect(color::TrueColorBg(40, 40, 40) == String("\033[48;2;40;40;40m"));
  };

  "Background to foreground palette lookup"_test = [] -> void {
    expect(color::BackgroundToForeground(color::BgBlue) == color::Blue);
    expect(color::BackgroundToForeground(color::BgBrightCyan) == color::BrightCyan);
    expect(color::BackgroundToForeground(color::BgBlack) == color::Black);
  };

  "Unknown backgrounds map to the neutral foreground"_test = [] -> void {
    expect(color::BackgroundToForeground(color::TrueColorBg(1, 2, 3)) == color::NeutralForeground);
    expect(color::BackgroundToForeground("") == color::NeutralForeground);
  };

  "Registry lists the default theme first"_test = [] -> void {
    const Span<const theme::Theme> themes = theme::GetThemes();

    expect(themes.size() == 3_ul);
    expect(themes.front().name == String("powerline"));
    expect(theme::GetDefaultTheme().name == String("powerline"));
  };

  "Theme lookup is case-insensitive"_test = [] -> void {
    Result<const theme::Theme*> found = theme::FindTheme("GruvBox");

    expect(found.has_value());
    expect((*found)->name == String("gruvbox"));
  };

  "Unknown theme names fall back to the default"_test = [] -> void {
    Result<const theme::Theme*> missing = theme::FindTheme("solarized");

    expect(!missing.has_value());
    expect(missing.error().code == ccstatus::utils::error::StatusErrorCode::NotFound);
    expect(theme::GetTheme("solarized").name == String("powerline"));
    expect(theme::GetTheme("").name == String("powerline"));
  };

  "Repeated lookups return identical styles"_test = [] -> void {
    const theme::Theme& first  = theme::GetTheme("gruvbox");
    const theme::Theme& second = theme::GetTheme("gruvbox");

    expect(first.roles == second.roles);
    expect(first.separator == second.separator);
  };

  "Minimal theme has no backgrounds"_test = [] -> void {
    const theme::Theme& minimal = theme::GetTheme("minimal");

    expect(!minimal.usePowerline);

    for (const theme::Style& style : minimal.roles)
      expect(!style.hasBackground());
  };

  "Powerline themes give every role a background"_test = [] -> void {
    for (const StringView name : { StringView("powerline"), StringView("gruvbox") }) {
      const theme::Theme& current = theme::GetTheme(name);

      expect(current.usePowerline);

      for (const theme::Style& style : current.roles)
        expect(style.hasBackground());
    }
  };

  "Threshold rule bands"_test = [] -> void {
    const theme::ThresholdRule& rule = theme::GetDefaultTheme().remaining;

    expect(rule.styleFor(5) == rule.below);
    expect(rule.styleFor(10) == rule.between);
    expect(rule.styleFor(29) == rule.between);
    expect(rule.styleFor(30) == rule.above);
    expect(rule.styleFor(100) == rule.above);
  };

  "Role lookup"_test = [] -> void {
    const theme::Theme& powerline = theme::GetDefaultTheme();

    expect(powerline.style(theme::Role::Identity).background == String(color::BgBlue));
    expect(powerline.style(theme::Role::Path).foreground == String(color::Black));
  };

  return 0;
}
