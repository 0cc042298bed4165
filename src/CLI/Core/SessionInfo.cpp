#include "SessionInfo.hpp"

#include <chrono>                    // std::chrono::{system_clock, seconds, days}
#include <ctime>                     // std::time_t, std::tm, localtime_r
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <unistd.h>                  // gethostname

#include <CCStatus/Core/Metrics.hpp>
#include <CCStatus/Services/Git.hpp>
#include <CCStatus/Utils/Env.hpp>
#include <CCStatus/Utils/Logging.hpp>

namespace ccstatus::cli {
  namespace {
    using namespace ccstatus::utils::types;

    using ccstatus::core::metrics::TimePoint;
    using ccstatus::utils::env::GetEnv;

    using enum ccstatus::utils::error::StatusErrorCode;

    namespace keys = ccstatus::core::provider::keys;

    using std::chrono::seconds;
    using std::chrono::system_clock;

    /// Host name up to the first dot.
    auto GetShortHost() -> Result<String> {
      Array<char, 256> buffer {};

      if (gethostname(buffer.data(), buffer.size() - 1) != 0)
        ERR(ApiUnavailable, "gethostname failed");

      String host(buffer.data());

      if (const usize dot = host.find('.'); dot != String::npos && dot > 0)
        host.resize(dot);

      if (host.empty())
        ERR(NotFound, "Empty host name");

      return host;
    }

    auto LocalTimeOfDay(const TimePoint now) -> seconds {
      const std::time_t nowTt = system_clock::to_time_t(now);

      std::tm nowTm {};

      if (localtime_r(&nowTt, &nowTm) == nullptr) {
        debug_log("localtime_r failed, using UTC time of day");
        return std::chrono::duration_cast<seconds>(now - std::chrono::floor<std::chrono::days>(now));
      }

      return seconds { (nowTm.tm_hour * 3600) + (nowTm.tm_min * 60) + nowTm.tm_sec };
    }

    auto ResolveSessionId(const core::input::StatusInput& input, const services::tracking::TrackingProvider& tracking) -> String {
      if (input.sessionId && !input.sessionId->empty())
        return *input.sessionId;

      if (Result<String> fromEnv = GetEnv("CLAUDE_SESSION_ID"))
        return *fromEnv;

      return tracking.getText(keys::SessionId).value_or("");
    }

    auto ParseWindowStart(const core::provider::IMetricsProvider& source) -> Option<TimePoint> {
      const Option<String> text = source.getText(keys::WindowStart);

      if (!text)
        return None;

      if (Result<TimePoint> start = services::tracking::ParseRfc3339(*text))
        return *start;

      return None;
    }
  } // namespace

  SessionInfo::SessionInfo(const Config& config, const core::input::StatusInput& input) {
    debug_log("SessionInfo: collecting");

    const TimePoint now = system_clock::now();

    trackingStatus = tracking.load(config.sources.trackingDir);

    if (!trackingStatus)
      debug_log("tracking: {}", trackingStatus.error().message);

    const String sessionId = ResolveSessionId(input, tracking);

    ccusageStatus = ccusage.load(config.sources.ccusageCommand, sessionId, now);

    if (!ccusageStatus)
      debug_log("ccusage: {}", ccusageStatus.error().message);

    usageScriptStatus = usageScript.load(config.sources.usageScript);

    if (!usageScriptStatus)
      debug_log("usage script: {}", usageScriptStatus.error().message);

    const String workspace = input.getWorkspacePath();

    gitStatus = services::git::GetGitInfo(workspace);

    if (!gitStatus)
      debug_log("git: {}", gitStatus.error().message);

    host = GetShortHost();

    Option<TimePoint> windowStart = ParseWindowStart(ccusage);

    if (!windowStart)
      windowStart = ParseWindowStart(tracking);

    snapshot = core::session::SessionSnapshot {
      .user              = config::General::getDefaultName(),
      .host              = host.value_or("localhost"),
      .workspacePath     = core::metrics::FormatWorkspacePath(workspace, GetEnv("HOME").value_or("")),
      .git               = gitStatus ? Option<core::session::GitSummary>(*gitStatus) : None,
      .modelDisplayName  = input.model.displayName,
      .modelId           = input.model.id,
      .usage             = core::session::ResolveUsage(usageScript, ccusage, input),
      .contextTokens     = input.getContextTokens(),
      .contextCharacters = input.getContextCharacters(),
      .latency           = tracking.latency(),
      .windowStart       = windowStart,
      .now               = now,
      .localTimeOfDay    = LocalTimeOfDay(now),
    };

    debug_log("SessionInfo: usage from {}", magic_enum::enum_name(snapshot.usage.source));
  }
} // namespace ccstatus::cli
