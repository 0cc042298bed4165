#pragma once

#include <CCStatus/Core/Input.hpp>
#include <CCStatus/Core/Session.hpp>
#include <CCStatus/Services/Tracking.hpp>
#include <CCStatus/Services/Usage.hpp>
#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace ccstatus::cli {
  namespace types = ::ccstatus::utils::types;

  using config::Config;

  /**
   * @brief Everything gathered for one invocation.
   *
   * Every external lookup is attempted once. Failures never abort
   * collection; they are kept here so --doctor can report them.
   */
  struct SessionInfo {
    core::session::SessionSnapshot snapshot;

    services::usage::CcusageProvider         ccusage;
    services::usage::UsageScriptProvider     usageScript;
    services::tracking::TrackingProvider     tracking;
    types::Result<>                          ccusageStatus;
    types::Result<>                          usageScriptStatus;
    types::Result<>                          trackingStatus;
    types::Result<core::session::GitSummary> gitStatus;
    types::Result<types::String>             host;

    SessionInfo(const Config& config, const core::input::StatusInput& input);
  };
} // namespace ccstatus::cli
