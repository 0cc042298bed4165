#include <boost/ut.hpp>
#include <limits>

#include <CCStatus/Core/Input.hpp>
#include <CCStatus/Core/Provider.hpp>
#include <CCStatus/Core/Session.hpp>
#include <CCStatus/Utils/Types.hpp>

using namespace boost::ut;
using namespace ccstatus::core;
using namespace ccstatus::utils::types;

using input::ParseStatusInput;
using input::StatusInput;
using provider::FieldMapProvider;

namespace keys = provider::keys;

auto main() -> int {
  "Parses the nested envelope"_test = [] -> void {
    Result<StatusInput> parsed = ParseStatusInput(R"({
      "model": { "id": "claude-opus-4", "display_name": "Opus" },
      "workspace": { "current_dir": "/home/alice/code", "project_dir": "/home/alice" },
      "usage": { "inputTokens": 1200, "outputTokens": 300, "totalTokens": 1500 },
      "contextUsage": { "characters": 8000, "tokens": 2000 },
      "session_id": "abc-123"
    })");

    expect(parsed.has_value());
    expect(parsed->model.displayName == String("Opus"));
    expect(parsed->getModelName() == StringView("Opus"));
    expect(parsed->getWorkspacePath() == String("/home/alice/code"));
    expect(parsed->getInputTokens() == 1200);
    expect(parsed->getOutputTokens() == 300);
    expect(parsed->getTotalTokens() == 1500);
    expect(parsed->getContextTokens() == 2000);
    expect(parsed->getContextCharacters() == 8000);
    expect(parsed->sessionId.has_value());
    expect(*parsed->sessionId == String("abc-123"));
  };

  "Falls back to the flat legacy fields"_test = [] -> void {
    Result<StatusInput> parsed = ParseStatusInput(R"({
      "model": { "id": "claude-3-haiku" },
      "workspaceDirectory": "/srv/app",
      "inputTokens": 10,
      "outputTokens": 20,
      "context": { "tokens": 99 }
    })");

    expect(parsed.has_value());
    expect(parsed->getModelName() == StringView("claude-3-haiku"));
    expect(parsed->getWorkspacePath() == String("/srv/app"));
    expect(parsed->getInputTokens() == 10);
    expect(parsed->getOutputTokens() == 20);
    expect(parsed->getTotalTokens() == 0);
    expect(parsed->getContextTokens() == 99);
    expect(!parsed->sessionId.has_value());
  };

  "Empty object gives defaults"_test = [] -> void {
    Result<StatusInput> parsed = ParseStatusInput("{}");

    expect(parsed.has_value());
    expect(parsed->getWorkspacePath() == String("~"));
    expect(parsed->getModelName().empty());
    expect(parsed->getContextTokens() == 0);
  };

  "Unknown keys are ignored"_test = [] -> void {
    Result<StatusInput> parsed = ParseStatusInput(R"({"hook_event_name": "Status", "version": "1.0", "cost": {"total_cost_usd": 0.1}})");

    expect(parsed.has_value());
  };

  "Malformed or empty input is a parse error"_test = [] -> void {
    for (const StringView text : { StringView(""), StringView("   \n"), StringView("{\"model\": "), StringView("not json") }) {
      Result<StatusInput> parsed = ParseStatusInput(text);

      expect(!parsed.has_value());
      expect(parsed.error().code == ccstatus::utils::error::StatusErrorCode::ParseError);
    }
  };

  "Usage script wins over ccusage and input"_test = [] -> void {
    FieldMapProvider script("usage_script");
    FieldMapProvider ccusage("ccusage");

    script.setInteger(keys::DailyTokens, 5'000);
    script.setInteger(keys::InputTokens, 100);
    script.setInteger(keys::Messages, 7);
    ccusage.setInteger(keys::DailyTokens, 9'000);
    ccusage.setInteger(keys::WeeklyTokens, 80'000);
    ccusage.setInteger(keys::Messages, 40);

    StatusInput input;
    input.totalTokens = 123;

    const session::UsageTotals totals = session::ResolveUsage(script, ccusage, input);

    expect(totals.source == session::UsageSource::UsageScript);
    expect(totals.dailyTokens == 5'000);
    expect(totals.sessionInputTokens == 100);
    expect(totals.weeklyTokens == 80'000);
    expect(totals.messages == 7);
  };

  "Ccusage daily doubles as weekly when weekly is missing"_test = [] -> void {
    FieldMapProvider script("usage_script");
    FieldMapProvider ccusage("ccusage");

    ccusage.setInteger(keys::DailyTokens, 9'000);
    ccusage.setInteger(keys::OutputTokens, 50);

    const session::UsageTotals totals = session::ResolveUsage(script, ccusage, StatusInput {});

    expect(totals.source == session::UsageSource::Ccusage);
    expect(totals.dailyTokens == 9'000);
    expect(totals.sessionOutputTokens == 50);
    expect(totals.weeklyTokens == 9'000);
    expect(totals.messages == 0);
  };

  "Input totals are used when no provider has data"_test = [] -> void {
    FieldMapProvider script("usage_script");
    FieldMapProvider ccusage("ccusage");

    // Non-positive provider values do not count.
    script.setInteger(keys::DailyTokens, 0);
    ccusage.setInteger(keys::DailyTokens, -4);

    StatusInput withTotal;
    withTotal.totalTokens = 1'500;

    expect(session::ResolveUsage(script, ccusage, withTotal).source == session::UsageSource::InputTotal);
    expect(session::ResolveUsage(script, ccusage, withTotal).dailyTokens == 1'500);

    StatusInput withParts;
    withParts.inputTokens  = 200;
    withParts.outputTokens = 300;

    const session::UsageTotals totals = session::ResolveUsage(script, ccusage, withParts);

    expect(totals.source == session::UsageSource::InputSum);
    expect(totals.dailyTokens == 500);
    expect(totals.weeklyTokens == 0);
  };

  "Input token sum saturates instead of overflowing"_test = [] -> void {
    FieldMapProvider script("usage_script");
    FieldMapProvider ccusage("ccusage");

    Result<StatusInput> parsed = ParseStatusInput(R"({"inputTokens": 5000000000000000000, "outputTokens": 5000000000000000000})");

    expect(fatal(parsed.has_value()));

    const session::UsageTotals totals = session::ResolveUsage(script, ccusage, *parsed);

    expect(totals.source == session::UsageSource::InputSum);
    expect(totals.dailyTokens == std::numeric_limits<i64>::max());
    expect(totals.dailyTokens > 0);
  };

  "Provider fields are typed"_test = [] -> void {
    FieldMapProvider tracking("tracking");

    expect(tracking.empty());
    expect(tracking.getId() == StringView("tracking"));

    tracking.setInteger(keys::RequestCount, 3);
    tracking.setNumber(keys::LatencyAvgMs, 12.5);
    tracking.setText(keys::SessionId, "abc");

    expect(!tracking.empty());
    expect(tracking.getInteger(keys::RequestCount) == Option<i64>(3));
    expect(tracking.getNumber(keys::RequestCount) == Option<f64>(3.0));
    expect(tracking.getNumber(keys::LatencyAvgMs) == Option<f64>(12.5));
    expect(!tracking.getInteger(keys::LatencyAvgMs).has_value());
    expect(tracking.getText(keys::SessionId) == Option<String>("abc"));
    expect(tracking.integerOr0(keys::Messages) == 0);
    expect(!tracking.getLastError().has_value());
  };

  return 0;
}
