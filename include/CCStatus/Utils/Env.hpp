#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv

#include "Error.hpp"
#include "Types.hpp"

namespace ccstatus::utils::env {
  namespace types = ::ccstatus::utils::types;
  namespace error = ::ccstatus::utils::error;

  using enum error::StatusErrorCode;

  /**
   * @brief Retrieves an environment variable.
   * @param name The name of the environment variable.
   * @return The value, or NotFound when unset. A variable set to the empty
   *         string is reported as NotFound as well, since every caller treats
   *         empty and unset the same way.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
    const types::PCStr value = std::getenv(name);

    if (!value || *value == '\0')
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
  }

  /**
   * @brief Retrieves an environment variable, or @p fallback if it is unset.
   */
  [[nodiscard]] inline auto GetEnvOr(const types::PCStr name, types::StringView fallback) -> types::String {
    if (types::Result<types::String> value = GetEnv(name))
      return *value;

    return types::String(fallback);
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
    setenv(name, value, 1);
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Unit {
    unsetenv(name);
  }
} // namespace ccstatus::utils::env
