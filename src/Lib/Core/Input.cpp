#include <CCStatus/Core/Input.hpp>

#include <glaze/glaze.hpp>

#include <CCStatus/Utils/Logging.hpp>

using ccstatus::core::input::ContextUsage;
using ccstatus::core::input::CostData;
using ccstatus::core::input::ModelInfo;
using ccstatus::core::input::StatusInput;
using ccstatus::core::input::UsageInfo;
using ccstatus::core::input::WorkspaceInfo;

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<ModelInfo> {
  using T                     = ModelInfo;
  static constexpr auto value = object("id", &T::id, "display_name", &T::displayName);
};

template <>
struct glz::meta<WorkspaceInfo> {
  using T                     = WorkspaceInfo;
  static constexpr auto value = object("current_dir", &T::currentDir, "project_dir", &T::projectDir);
};

template <>
struct glz::meta<UsageInfo> {
  using T                     = UsageInfo;
  static constexpr auto value = object("inputTokens", &T::inputTokens, "outputTokens", &T::outputTokens, "totalTokens", &T::totalTokens);
};

template <>
struct glz::meta<ContextUsage> {
  using T                     = ContextUsage;
  static constexpr auto value = object("characters", &T::characters, "tokens", &T::tokens);
};

template <>
struct glz::meta<CostData> {
  using T                     = CostData;
  static constexpr auto value = object("sessionCost", &T::sessionCost, "dailyCost", &T::dailyCost);
};

template <>
struct glz::meta<StatusInput> {
  using T                     = StatusInput;
  static constexpr auto value = object(
    "model",
    &T::model,
    "workspace",
    &T::workspace,
    "workspaceDirectory",
    &T::workspaceDirectory,
    "usage",
    &T::usage,
    "inputTokens",
    &T::inputTokens,
    "outputTokens",
    &T::outputTokens,
    "totalTokens",
    &T::totalTokens,
    "contextUsage",
    &T::contextUsage,
    "context",
    &T::context,
    "costData",
    &T::costData,
    "sessionCost",
    &T::sessionCost,
    "dailyCost",
    &T::dailyCost,
    "session_id",
    &T::sessionId
  );
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace ccstatus::core::input {
  using namespace ccstatus::utils::types;

  using enum ccstatus::utils::error::StatusErrorCode;

  auto StatusInput::getInputTokens() const -> i64 {
    if (usage && usage->inputTokens > 0)
      return usage->inputTokens;

    return inputTokens;
  }

  auto StatusInput::getOutputTokens() const -> i64 {
    if (usage && usage->outputTokens > 0)
      return usage->outputTokens;

    return outputTokens;
  }

  auto StatusInput::getTotalTokens() const -> i64 {
    if (usage && usage->totalTokens > 0)
      return usage->totalTokens;

    return totalTokens;
  }

  auto StatusInput::getContextTokens() const -> i64 {
    if (contextUsage && contextUsage->tokens > 0)
      return contextUsage->tokens;

    if (context && context->tokens > 0)
      return context->tokens;

    return 0;
  }

  auto StatusInput::getContextCharacters() const -> i64 {
    if (contextUsage && contextUsage->characters > 0)
      return contextUsage->characters;

    if (context && context->characters > 0)
      return context->characters;

    return 0;
  }

  auto StatusInput::getWorkspacePath() const -> String {
    if (!workspace.currentDir.empty())
      return workspace.currentDir;

    if (!workspaceDirectory.empty())
      return workspaceDirectory;

    return "~";
  }

  auto StatusInput::getModelName() const -> StringView {
    return model.displayName.empty() ? StringView(model.id) : StringView(model.displayName);
  }

  auto ParseStatusInput(const StringView text) -> Result<StatusInput> {
    if (text.find_first_not_of(" \t\r\n") == StringView::npos)
      ERR(ParseError, "Empty input, expected a JSON object");

    StatusInput input;
    String      buffer(text);

    if (const auto error = glz::read<glz::opts { .error_on_unknown_keys = false }>(input, buffer))
      ERR_FMT(ParseError, "Failed to parse input JSON: {}", glz::format_error(error, buffer));

    debug_log("Parsed input for model '{}' in '{}'", input.getModelName(), input.getWorkspacePath());

    return input;
  }
} // namespace ccstatus::core::input
