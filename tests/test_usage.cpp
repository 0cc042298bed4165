#include <boost/ut.hpp>
#include <chrono> // std::chrono::sys_days
#include <regex>  // std::regex

#include <CCStatus/Core/Provider.hpp>
#include <CCStatus/Services/Usage.hpp>
#include <CCStatus/Utils/Types.hpp>

using namespace boost::ut;
using namespace ccstatus::services::usage;
using namespace ccstatus::utils::types;
using namespace std::chrono_literals;

using ccstatus::core::metrics::TimePoint;

namespace keys = ccstatus::core::provider::keys;

namespace {
  auto Noon() -> TimePoint {
    using namespace std::chrono;
    return sys_days { year { 2024 } / January / 3 } + 12h;
  }

  constexpr PCStr ACTIVE_BLOCK = R"({"blocks":[{"id":"2024-01-03T10:00:00.000Z","start_time":"2024-01-03T10:00:00.000Z","isActive":true,)"
                                 R"("tokens":1234,"inputTokens":1000,"outputTokens":234,"messageCount":9}]})";
} // namespace

auto main() -> int {
  "ExtractCount takes the first matching group"_test = [] -> void {
    const std::regex pattern(R"re("messages"\s*:\s*(\d+)|"messageCount"\s*:\s*(\d+))re");

    expect(ExtractCount(R"({"messages": 42})", pattern) == Option<i64>(42));
    expect(ExtractCount(R"({"messageCount":7})", pattern) == Option<i64>(7));
    expect(!ExtractCount(R"({"other": 1})", pattern).has_value());
  };

  "Blocks populate session fields and the live window"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyBlocks(ACTIVE_BLOCK, Noon());

    expect(ccusage.getInteger(keys::SessionTokens) == Option<i64>(1234));
    expect(ccusage.getInteger(keys::InputTokens) == Option<i64>(1000));
    expect(ccusage.getInteger(keys::OutputTokens) == Option<i64>(234));
    expect(ccusage.getInteger(keys::Messages) == Option<i64>(9));
    expect(ccusage.getText(keys::WindowStart) == Option<String>("2024-01-03T10:00:00.000Z"));
  };

  "Stale blocks do not set a window start"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyBlocks(R"({"blocks":[{"start_time":"2024-01-03T06:00:00Z","tokens":5}]})", Noon());

    expect(ccusage.getInteger(keys::SessionTokens) == Option<i64>(5));
    expect(!ccusage.getText(keys::WindowStart).has_value());
  };

  "Blocks starting in the future do not set a window start"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyBlocks(R"({"blocks":[{"start_time":"2024-01-03T14:00:00Z","tokens":7}]})", Noon());

    expect(ccusage.getInteger(keys::SessionTokens) == Option<i64>(7));
    expect(!ccusage.getText(keys::WindowStart).has_value());
  };

  "Session output overrides only with positive values"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyBlocks(ACTIVE_BLOCK, Noon());
    ccusage.applySession(R"({"sessionId":"abc","tokens":0,"inputTokens":2000,"messages":3})");

    expect(ccusage.getInteger(keys::SessionTokens) == Option<i64>(1234));
    expect(ccusage.getInteger(keys::InputTokens) == Option<i64>(2000));
    expect(ccusage.getInteger(keys::OutputTokens) == Option<i64>(234));
    expect(ccusage.getInteger(keys::Messages) == Option<i64>(3));
  };

  "JSON stats set daily and weekly totals"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyBlocks(ACTIVE_BLOCK, Noon());
    ccusage.applyStats(R"({"totalTokens": 50000, "weeklyTokens": 200000, "messages": 50})");

    expect(ccusage.getInteger(keys::DailyTokens) == Option<i64>(50'000));
    expect(ccusage.getInteger(keys::WeeklyTokens) == Option<i64>(200'000));
    // Block values are kept.
    expect(ccusage.getInteger(keys::Messages) == Option<i64>(9));
  };

  "Stats fill fields still missing"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyStats(R"({"totalTokens":1,"sessionTokens":77,"outputTokens":5})");

    expect(ccusage.getInteger(keys::SessionTokens) == Option<i64>(77));
    expect(ccusage.getInteger(keys::OutputTokens) == Option<i64>(5));
    expect(!ccusage.getInteger(keys::InputTokens).has_value());
  };

  "Plain text stats"_test = [] -> void {
    CcusageProvider ccusage;
    ccusage.applyStats("total tokens: 1234\nweekly tokens: 5000\n");

    expect(ccusage.getInteger(keys::DailyTokens) == Option<i64>(1234));
    expect(ccusage.getInteger(keys::WeeklyTokens) == Option<i64>(5000));
  };

  "Missing ccusage executable is reported"_test = [] -> void {
    CcusageProvider ccusage;
    Result<>        result = ccusage.load("ccstatus-no-such-tool-4821", "", Noon());

    expect(!result.has_value());
    expect(result.error().code == ccstatus::utils::error::StatusErrorCode::NotFound);
    expect(ccusage.getLastError().has_value());
    expect(ccusage.empty());
  };

  "Usage script with five fields"_test = [] -> void {
    UsageScriptProvider script;
    script.applyOutput("1200 45000 12 800 400\n");

    expect(script.getInteger(keys::SessionTokens) == Option<i64>(1200));
    expect(script.getInteger(keys::DailyTokens) == Option<i64>(45'000));
    expect(script.getInteger(keys::Messages) == Option<i64>(12));
    expect(script.getInteger(keys::InputTokens) == Option<i64>(800));
    expect(script.getInteger(keys::OutputTokens) == Option<i64>(400));
  };

  "Usage script with three fields"_test = [] -> void {
    UsageScriptProvider script;
    script.applyOutput("1 2 3");

    expect(script.getInteger(keys::Messages) == Option<i64>(3));
    expect(!script.getInteger(keys::InputTokens).has_value());
  };

  "Usage script output that is too short or malformed"_test = [] -> void {
    UsageScriptProvider shortOutput;
    shortOutput.applyOutput("10 20");

    expect(shortOutput.empty());

    UsageScriptProvider malformed;
    malformed.applyOutput("1 abc 3");

    expect(malformed.getInteger(keys::SessionTokens) == Option<i64>(1));
    expect(!malformed.getInteger(keys::DailyTokens).has_value());
    expect(malformed.getInteger(keys::Messages) == Option<i64>(3));
  };

  "Missing usage script is NotFound"_test = [] -> void {
    UsageScriptProvider script;
    Result<>            result = script.load("/nonexistent/ccstatus/calculate-usage.sh");

    expect(!result.has_value());
    expect(result.error().code == ccstatus::utils::error::StatusErrorCode::NotFound);
  };

  return 0;
}
