#include <CCStatus/Core/Widget.hpp>

#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <CCStatus/Core/Metrics.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Strings.hpp>

namespace ccstatus::core::widget {
  namespace {
    using namespace ccstatus::utils::types;

    using session::SessionSnapshot;
    using theme::Role;
    using theme::Style;
    using theme::Theme;

    constexpr StringView TIMER_ICON      = "⏱";
    constexpr StringView TOKEN_ICON      = "🔤";
    constexpr StringView DOLLAR_ICON     = "$";
    constexpr StringView MESSAGE_ICON    = "💬";
    constexpr StringView EFFICIENCY_ICON = "📊";
    constexpr StringView LATENCY_ICON    = "⚡";
    constexpr StringView COMPACTION_ICON = "🗜️";
    constexpr StringView WEEKLY_ICON     = "📅";
    constexpr StringView DAILY_ICON      = "📊";

    class WidgetList {
     public:
      explicit WidgetList(const Theme& theme) : m_theme(theme) {}

      auto add(const WidgetKind kind, String text, const Style& style) -> Unit {
        m_widgets.push_back(Widget { .kind = kind, .text = std::move(text), .foreground = style.foreground, .background = style.background });
      }

      auto add(const WidgetKind kind, String text, const Role role) -> Unit {
        add(kind, std::move(text), m_theme.style(role));
      }

      auto take() -> Vec<Widget> {
        return std::move(m_widgets);
      }

     private:
      const Theme& m_theme;
      Vec<Widget>  m_widgets;
    };
  } // namespace

  auto Widget::name() const -> types::String {
    return utils::strings::ToLower(magic_enum::enum_name(kind));
  }

  auto BuildWidgets(const SessionSnapshot& snapshot, const Theme& theme, const WidgetOptions& options) -> Vec<Widget> {
    using namespace metrics;

    WidgetList widgets(theme);

    const session::UsageTotals& usage = snapshot.usage;

    widgets.add(WidgetKind::Identity, std::format("{}@{}", snapshot.user, snapshot.host), Role::Identity);
    widgets.add(WidgetKind::Path, TruncatePath(snapshot.workspacePath, options.maxPathLength), Role::Path);

    if (snapshot.git)
      widgets.add(WidgetKind::Git, snapshot.git->display(), Role::Git);

    widgets.add(WidgetKind::Model, ModelDisplayName(snapshot.modelDisplayName, snapshot.modelId), Role::Model);

    const i32 usagePercent     = UsagePercentage(usage.dailyTokens, snapshot.contextTokens, snapshot.contextCharacters);
    const i32 remainingPercent = RemainingPercentage(usagePercent);
    widgets.add(WidgetKind::Remaining, std::format("{}%", remainingPercent), theme.remaining.styleFor(remainingPercent));

    // Show whichever budget is the tighter one.
    if (usage.weeklyTokens > 0 || usage.dailyTokens > 0) {
      const i32 dailyPercent  = DailyUsagePercentage(usage.dailyTokens);
      const i32 weeklyPercent = WeeklyUsagePercentage(usage.weeklyTokens);

      if (weeklyPercent > dailyPercent && weeklyPercent > 0)
        widgets.add(WidgetKind::Weekly, std::format("{} {}%", WEEKLY_ICON, weeklyPercent), theme.weekly.styleFor(weeklyPercent));
      else if (dailyPercent > 0)
        widgets.add(WidgetKind::Daily, std::format("{} {}%", DAILY_ICON, dailyPercent), theme.weekly.styleFor(dailyPercent));
    }

    if (usage.dailyTokens > 0)
      widgets.add(WidgetKind::Tokens, std::format("{} {}", TOKEN_ICON, FormatTokens(usage.dailyTokens)), Role::Tokens);

    if (usage.sessionInputTokens > 0 || usage.sessionOutputTokens > 0) {
      const StringView modelName = snapshot.modelDisplayName.empty() ? StringView(snapshot.modelId) : StringView(snapshot.modelDisplayName);
      const Cost       cost      = CalculateCost(modelName, usage.sessionInputTokens, usage.sessionOutputTokens);

      widgets.add(WidgetKind::Cost, std::format("{} {}", DOLLAR_ICON, FormatCost(cost.session)), Role::Cost);
    }

    if (usage.messages > 0)
      widgets.add(WidgetKind::Messages, std::format("{} {}/{}", MESSAGE_ICON, usage.messages, MESSAGE_LIMIT), Role::Messages);

    if (snapshot.contextTokens > 0) {
      widgets.add(WidgetKind::Efficiency, std::format("{} {}", EFFICIENCY_ICON, FormatEfficiency(ContextEfficiency(snapshot.contextTokens))), Role::Efficiency);

      const i32 compactionPercent = CompactionPercentage(snapshot.contextTokens);
      widgets.add(WidgetKind::Compaction, std::format("{} {}%", COMPACTION_ICON, compactionPercent), theme.compaction.styleFor(compactionPercent));
    }

    if (options.showLatency && snapshot.latency && snapshot.latency->averageMs > 0.0)
      widgets.add(WidgetKind::Latency, std::format("{} {}", LATENCY_ICON, FormatLatency(snapshot.latency->averageMs)), Role::Latency);

    if (const String elapsed = BlockElapsed(snapshot.windowStart, snapshot.now, snapshot.localTimeOfDay); !elapsed.empty())
      widgets.add(WidgetKind::Timer, std::format("{} {}", TIMER_ICON, elapsed), Role::Time);

    // A live 5-hour countdown wins; otherwise the weekly reset is shown.
    const ResetInfo rolling = TimeToReset(snapshot.windowStart, snapshot.now, snapshot.localTimeOfDay);
    const ResetInfo reset   = (rolling.label == "5hr" && rolling.remaining != "0m") ? rolling : TimeToWeeklyReset(snapshot.now);

    widgets.add(WidgetKind::Reset, std::format("{} reset {}", reset.label, reset.remaining), Role::Time);

    Vec<Widget> result = widgets.take();
    debug_log("Built {} widgets with theme '{}'", result.size(), theme.name);

    return result;
  }
} // namespace ccstatus::core::widget
