#include "UI.hpp"

#include <CCStatus/Core/Renderer.hpp>

namespace ccstatus::ui {
  using namespace ccstatus::utils::types;

  auto GetWidgetOptions(const config::Config& config) -> widget::WidgetOptions {
    return widget::WidgetOptions {
      .maxPathLength = config.display.maxPathLength,
      .showLatency   = config.display.showLatency,
    };
  }

  auto CreateWidgets(const config::Config& config, const cli::SessionInfo& data, const theme::Theme& theme) -> Vec<widget::Widget> {
    return widget::BuildWidgets(data.snapshot, theme, GetWidgetOptions(config));
  }

  auto CreateStatusLine(const config::Config& config, const cli::SessionInfo& data, const theme::Theme& theme) -> String {
    const Vec<widget::Widget> widgets = CreateWidgets(config, data, theme);

    return core::render::Render(widgets, theme);
  }
} // namespace ccstatus::ui
