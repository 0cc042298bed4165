/**
 * @file CLI.cpp
 * @brief Alternate output modes implementation
 */

#include "CLI.hpp"

#include <chrono>                    // std::chrono::{floor, seconds}
#include <format>                    // std::format
#include <glaze/glaze.hpp>           // glz::{write, write_json, format_error, meta}
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Logging.hpp>

namespace {
  struct JsonWidget {
    ccstatus::utils::types::String name;
    ccstatus::utils::types::String text;
    ccstatus::utils::types::String foreground;
    ccstatus::utils::types::String background;
  };

  struct JsonOutput {
    ccstatus::utils::types::String          theme;
    ccstatus::utils::types::Vec<JsonWidget> widgets;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<JsonWidget> {
  using T                     = JsonWidget;
  static constexpr auto value = object("name", &T::name, "text", &T::text, "foreground", &T::foreground, "background", &T::background);
};

template <>
struct glz::meta<JsonOutput> {
  using T                     = JsonOutput;
  static constexpr auto value = object("theme", &T::theme, "widgets", &T::widgets);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace ccstatus::cli {
  using namespace utils::types;
  using namespace utils::logging;

  using utils::error::StatusError;

  auto PrintDoctorReport(const SessionInfo& data) -> Unit {
    constexpr usize                                       sourceCount = 5;
    Array<Option<Pair<String, StatusError>>, sourceCount> failures {};

    usize failureCount = 0;

#define CCSTATUS_CHECK(expr, label) \
  if (!(expr))                      \
  failures.at(failureCount++) = { label, (expr).error() }

    CCSTATUS_CHECK(data.ccusageStatus, "ccusage");
    CCSTATUS_CHECK(data.usageScriptStatus, "Usage script");
    CCSTATUS_CHECK(data.trackingStatus, "Tracking files");
    CCSTATUS_CHECK(data.gitStatus, "Git");
    CCSTATUS_CHECK(data.host, "Host");

#undef CCSTATUS_CHECK

    Println("Doctor Report:");
    Println("==============");
    Println();
    Println("External Sources:");
    Println("-----------------");

    if (failureCount == 0)
      Println("  ✓ All {} sources were successful!", sourceCount);
    else {
      Println("  Out of {} sources, {} failed.\n", sourceCount, failureCount);

      for (const Option<Pair<String, StatusError>>& failure : failures)
        if (failure)
          Println(
            R"(  ✗ "{}" failed: {} ({}))",
            failure->first,
            failure->second.message,
            magic_enum::enum_name(failure->second.code)
          );
    }

    const core::session::SessionSnapshot& snap = data.snapshot;

    Println();
    Println("Resolved Values:");
    Println("----------------");
    Println("  usage source:   {}", magic_enum::enum_name(snap.usage.source));
    Println("  daily tokens:   {}", snap.usage.dailyTokens);
    Println("  weekly tokens:  {}", snap.usage.weeklyTokens);
    Println("  messages:       {}", snap.usage.messages);
    Println("  context tokens: {}", snap.contextTokens);
    Println("  window start:   {}", snap.windowStart ? std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(*snap.windowStart)) : String("none"));
  }

  auto WidgetsToJson(
    const Span<const core::widget::Widget> widgets,
    const core::theme::Theme&              theme,
    const bool                             prettyJson
  ) -> Result<String> {
    JsonOutput output { .theme = theme.name, .widgets = {} };

    for (const core::widget::Widget& widget : widgets)
      output.widgets.push_back({
        .name       = widget.name(),
        .text       = widget.text,
        .foreground = widget.foreground,
        .background = widget.background,
      });

    String jsonStr;

    const glz::error_ctx errorContext =
      prettyJson
      ? glz::write<glz::opts { .prettify = true }>(output, jsonStr)
      : glz::write_json(output, jsonStr);

    if (errorContext)
      ERR_FMT(utils::error::StatusErrorCode::InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }

  auto PrintWidgetsJson(
    const Span<const core::widget::Widget> widgets,
    const core::theme::Theme&              theme,
    const bool                             prettyJson
  ) -> Result<> {
    const String json = TRY(WidgetsToJson(widgets, theme, prettyJson));

    Println("{}", json);

    return {};
  }

  auto PrintThemeList() -> Unit {
    for (const core::theme::Theme& theme : core::theme::GetThemes())
      Println("{}", theme.name);
  }
} // namespace ccstatus::cli
