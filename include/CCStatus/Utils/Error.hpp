#pragma once

#include <format>          // std::format (ERR_FMT)
#include <source_location> // std::source_location

#include "Types.hpp"

namespace ccstatus::utils::error {
  /**
   * @enum StatusErrorCode
   * @brief Broad categories for everything that can go wrong while gathering
   *        or rendering a status line.
   */
  enum class StatusErrorCode : types::u8 {
    ApiUnavailable,  ///< A required tool or OS facility is missing or failed unexpectedly.
    InternalError,   ///< A logic error inside ccstatus itself.
    InvalidArgument, ///< An invalid argument was passed to a function or on the command line.
    IoError,         ///< General I/O error (filesystem, pipes, stdin).
    NotFound,        ///< A file, directory, executable or field was not found.
    Other,           ///< Anything unclassified.
    ParseError,      ///< Text from stdin, a file or a subprocess could not be parsed.
  };

  /**
   * @struct StatusError
   * @brief Error payload carried by Result.
   */
  struct StatusError {
    types::String        message;  ///< Human-readable description.
    std::source_location location; ///< Where the error was raised.
    StatusErrorCode      code;     ///< General category of the error.

    StatusError(const StatusErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };
} // namespace ccstatus::utils::error

#define ERR(errc, msg)          return ::ccstatus::utils::types::Err(::ccstatus::utils::error::StatusError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::ccstatus::utils::types::Err(::ccstatus::utils::error::StatusError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Rust-style error propagation.
 *
 * Evaluates @p expr (a Result<T> with non-void T). On error, returns the
 * error from the enclosing function; otherwise yields the success value.
 *
 * @note Uses GNU statement expressions (GCC and Clang).
 *
 * @code
 * auto loadSnapshot() -> Result<Snapshot> {
 *   StatusInput input = TRY(ParseStatusInput(text));
 *   return Snapshot { input };
 * }
 * @endcode
 */
#define TRY(expr)                                                                             \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _ccs_try_result = (expr);                                                        \
      if (!_ccs_try_result)                                                                   \
        return ::ccstatus::utils::types::Err(_ccs_try_result.error());                        \
      std::move(*_ccs_try_result);                                                            \
    })                                                                                        \
      _Pragma("clang diagnostic pop")

/**
 * @brief Error propagation for Result<void>.
 */
#define TRY_VOID(expr)                                                                        \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _ccs_try_result = (expr);                                                        \
      if (!_ccs_try_result)                                                                   \
        return ::ccstatus::utils::types::Err(_ccs_try_result.error());                        \
    })                                                                                        \
      _Pragma("clang diagnostic pop")
