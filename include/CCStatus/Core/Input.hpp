/**
 * @file Input.hpp
 * @brief The JSON envelope read from standard input.
 */

#pragma once

#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/Types.hpp>

namespace ccstatus::core::input {
  namespace types = ::ccstatus::utils::types;

  struct ModelInfo {
    types::String id;
    types::String displayName;
  };

  struct WorkspaceInfo {
    types::String currentDir;
    types::String projectDir;
  };

  struct UsageInfo {
    types::i64 inputTokens  = 0;
    types::i64 outputTokens = 0;
    types::i64 totalTokens  = 0;
  };

  struct ContextUsage {
    types::i64 characters = 0;
    types::i64 tokens     = 0;
  };

  struct CostData {
    types::f64 sessionCost = 0.0;
    types::f64 dailyCost   = 0.0;
  };

  /**
   * @struct StatusInput
   * @brief One status-line request. Every field is optional on the wire.
   *
   * Several values exist in two places (a nested object and a flat legacy
   * field); use the accessors rather than the raw members.
   */
  struct StatusInput {
    ModelInfo                    model;
    WorkspaceInfo                workspace;
    types::String                workspaceDirectory; ///< Legacy alternative to workspace.current_dir.
    types::Option<UsageInfo>     usage;
    types::i64                   inputTokens  = 0;
    types::i64                   outputTokens = 0;
    types::i64                   totalTokens  = 0;
    types::Option<ContextUsage>  contextUsage;
    types::Option<ContextUsage>  context; ///< Legacy alternative to contextUsage.
    types::Option<CostData>      costData;
    types::f64                   sessionCost = 0.0;
    types::f64                   dailyCost   = 0.0;
    types::Option<types::String> sessionId;

    [[nodiscard]] auto getInputTokens() const -> types::i64;
    [[nodiscard]] auto getOutputTokens() const -> types::i64;
    [[nodiscard]] auto getTotalTokens() const -> types::i64;
    [[nodiscard]] auto getContextTokens() const -> types::i64;
    [[nodiscard]] auto getContextCharacters() const -> types::i64;

    /// workspace.current_dir, then workspaceDirectory, then "~".
    [[nodiscard]] auto getWorkspacePath() const -> types::String;

    /// The model's display name, or its id when the display name is empty.
    [[nodiscard]] auto getModelName() const -> types::StringView;
  };

  /**
   * @brief Parses the stdin envelope. Unknown keys are ignored.
   * @return ParseError for empty or malformed text.
   */
  [[nodiscard]] auto ParseStatusInput(types::StringView text) -> types::Result<StatusInput>;
} // namespace ccstatus::core::input
