#include <boost/ut.hpp>
#include <format> // std::format

#include <CCStatus/Core/Color.hpp>
#include <CCStatus/Core/Renderer.hpp>
#include <CCStatus/Core/Theme.hpp>
#include <CCStatus/Core/Widget.hpp>
#include <CCStatus/Utils/Types.hpp>

using namespace boost::ut;
using namespace ccstatus::core;
using namespace ccstatus::utils::types;

using widget::Widget;
using widget::WidgetKind;

namespace {
  auto Block(const WidgetKind kind, String text, const StringView background) -> Widget {
    return Widget { .kind = kind, .text = std::move(text), .foreground = String(color::BrightWhite), .background = String(background) };
  }

  auto Plain(const WidgetKind kind, String text) -> Widget {
    return Widget { .kind = kind, .text = std::move(text), .foreground = String(color::Green), .background = {} };
  }
} // namespace

auto main() -> int {
  "Transition classification"_test = [] -> void {
    const Widget blue  = Block(WidgetKind::Identity, "me@host", color::BgBlue);
    const Widget red   = Block(WidgetKind::Cost, "$ 1.00", color::BgRed);
    const Widget plain = Plain(WidgetKind::Path, "~/code");

    expect(render::ClassifyTransition(blue, red) == render::Transition::BackgroundToBackground);
    expect(render::ClassifyTransition(blue, plain) == render::Transition::BackgroundToPlain);
    expect(render::ClassifyTransition(plain, blue) == render::Transition::Plain);
    expect(render::ClassifyTransition(plain, plain) == render::Transition::Plain);
  };

  "Powerline segment is padded on its background"_test = [] -> void {
    const theme::Theme& powerline = theme::GetTheme("powerline");
    const Widget        blue      = Block(WidgetKind::Identity, "me@host", color::BgBlue);

    expect(render::RenderSegment(blue, powerline) == std::format("{}{} me@host {}", color::BgBlue, color::BrightWhite, color::Reset));
  };

  "Plain segment is foreground only"_test = [] -> void {
    const theme::Theme& minimal = theme::GetTheme("minimal");
    const Widget        plain   = Plain(WidgetKind::Path, "~/code");

    expect(render::RenderSegment(plain, minimal) == std::format("{}~/code{}", color::Green, color::Reset));
  };

  "Arrow color comes from the current background"_test = [] -> void {
    const theme::Theme& powerline = theme::GetTheme("powerline");
    const Widget        blue      = Block(WidgetKind::Identity, "me@host", color::BgBlue);
    const Widget        red       = Block(WidgetKind::Cost, "$ 1.00", color::BgRed);

    expect(render::RenderSeparator(blue, red, powerline) == std::format("{}{}{}{}", color::BgRed, color::Blue, color::PowerlineArrow, color::Reset));
    expect(render::RenderSeparator(blue, Plain(WidgetKind::Path, "x"), powerline) == std::format("{}{}{}", color::Blue, color::PowerlineArrow, color::Reset));
  };

  "Arrow color ignores the next widget's background"_test = [] -> void {
    const theme::Theme& powerline = theme::GetTheme("powerline");
    const Widget        magenta   = Block(WidgetKind::Model, "opus", color::BgMagenta);
    const Widget        toGreen   = Block(WidgetKind::Remaining, "80%", color::BgGreen);
    const Widget        toRed     = Block(WidgetKind::Remaining, "5%", color::BgRed);

    const String greenSeparator = render::RenderSeparator(magenta, toGreen, powerline);
    const String redSeparator   = render::RenderSeparator(magenta, toRed, powerline);

    expect(greenSeparator.substr(String(color::BgGreen).size()) == redSeparator.substr(String(color::BgRed).size()));
    expect(render::RenderSeparator(toGreen, magenta, powerline) != greenSeparator);
  };

  "True-color backgrounds use the neutral arrow color"_test = [] -> void {
    const theme::Theme& gruvbox = theme::GetTheme("gruvbox");
    const Widget        first   = Block(WidgetKind::Identity, "me@host", color::TrueColorBg(40, 40, 40));

    expect(render::RenderSeparator(first, Plain(WidgetKind::Path, "x"), gruvbox) == std::format("{}{}{}", color::NeutralForeground, color::PowerlineArrow, color::Reset));
  };

  "Plain neighbours get a thin arrow in powerline themes"_test = [] -> void {
    const theme::Theme& powerline = theme::GetTheme("powerline");
    const Widget        plain     = Plain(WidgetKind::Path, "~/code");

    expect(render::RenderSeparator(plain, plain, powerline) == std::format(" {}{}{} ", powerline.separator, color::PowerlineThinArrow, color::Reset));
  };

  "Non-powerline themes use a pipe"_test = [] -> void {
    const theme::Theme& minimal = theme::GetTheme("minimal");
    const Widget        blue    = Block(WidgetKind::Identity, "me@host", color::BgBlue);
    const Widget        plain   = Plain(WidgetKind::Path, "~/code");

    expect(render::RenderSeparator(blue, plain, minimal) == std::format(" {}|{} ", minimal.separator, color::Reset));
  };

  "Render joins segments with one separator between each pair"_test = [] -> void {
    const theme::Theme& minimal = theme::GetTheme("minimal");
    const Vec<Widget>   widgets = { Plain(WidgetKind::Identity, "a"), Plain(WidgetKind::Path, "b"), Plain(WidgetKind::Model, "c") };

    const String separator = std::format(" {}|{} ", minimal.separator, color::Reset);
    const String expected  = std::format("{0}a{1}{2}{0}b{1}{2}{0}c{1}", color::Green, color::Reset, separator);

    expect(render::Render(widgets, minimal) == expected);
  };

  "Render of no widgets is empty"_test = [] -> void {
    expect(render::Render({}, theme::GetDefaultTheme()).empty());
  };

  "Rendered line has no newline"_test = [] -> void {
    const Vec<Widget> widgets = { Block(WidgetKind::Identity, "me@host", color::BgBlue), Block(WidgetKind::Reset, "weekly reset 1d 2h", color::BgBrightBlue) };

    expect(render::Render(widgets, theme::GetDefaultTheme()).find('\n') == String::npos);
  };

  return 0;
}
