#include <CCStatus/Core/Renderer.hpp>

#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, ds, _}

#include <CCStatus/Core/Color.hpp>

namespace ccstatus::core::render {
  namespace {
    using namespace ccstatus::utils::types;

    using color::BackgroundToForeground;
    using color::PowerlineArrow;
    using color::PowerlineThinArrow;
    using color::Reset;
    using theme::Theme;
    using widget::Widget;
  } // namespace

  auto ClassifyTransition(const Widget& current, const Widget& next) -> Transition {
    using matchit::match, matchit::is, matchit::ds, matchit::_;

    return match(current.hasBackground(), next.hasBackground())(
      is | ds(true, true)  = Transition::BackgroundToBackground,
      is | ds(true, false) = Transition::BackgroundToPlain,
      is | _               = Transition::Plain
    );
  }

  auto RenderSegment(const Widget& widget, const Theme& theme) -> String {
    if (theme.usePowerline && widget.hasBackground())
      return std::format("{}{} {} {}", widget.background, widget.foreground, widget.text, Reset);

    return std::format("{}{}{}", widget.foreground, widget.text, Reset);
  }

  auto RenderSeparator(const Widget& current, const Widget& next, const Theme& theme) -> String {
    if (!theme.usePowerline)
      return std::format(" {}|{} ", theme.separator, Reset);

    switch (ClassifyTransition(current, next)) {
      case Transition::BackgroundToBackground:
        return std::format("{}{}{}{}", next.background, BackgroundToForeground(current.background), PowerlineArrow, Reset);
      case Transition::BackgroundToPlain:
        return std::format("{}{}{}", BackgroundToForeground(current.background), PowerlineArrow, Reset);
      case Transition::Plain:
        break;
    }

    return std::format(" {}{}{} ", theme.separator, PowerlineThinArrow, Reset);
  }

  auto Render(const Span<const Widget> widgets, const Theme& theme) -> String {
    String line;

    for (usize i = 0; i < widgets.size(); ++i) {
      line += RenderSegment(widgets[i], theme);

      if (i + 1 < widgets.size())
        line += RenderSeparator(widgets[i], widgets[i + 1], theme);
    }

    return line;
  }
} // namespace ccstatus::core::render
