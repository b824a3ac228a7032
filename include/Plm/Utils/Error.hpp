#pragma once

#include <format>          // std::format
#include <source_location> // std::source_location
#include <utility>         // std::move

#include "Types.hpp"

namespace plm::utils::error {
  namespace types = ::plm::utils::types;

  /**
   * @enum PlmErrorCode
   * @brief Error kinds reported by the plugin lifecycle manager.
   */
  enum class PlmErrorCode : types::u8 {
    NotFound,             ///< Referenced plugin has no registry entry.
    AlreadyRegistered,    ///< An active entry already uses the name.
    InvalidState,         ///< Transition illegal from the current state, or a conflicting operation is in flight.
    InitializationFailed, ///< The plugin's initialize hook failed.
    InstallFailed,        ///< The plugin's install hook failed.
    UninstallFailed,      ///< The plugin's uninstall hook failed.
    ShutdownFailed,       ///< The plugin's shutdown hook failed.
    ConfigNotFound,       ///< Configuration document does not exist.
    ConfigMalformed,      ///< Configuration document has the wrong shape.
    ConfigIoError,        ///< Configuration document could not be read or written.
    ValidationFailed,     ///< Aggregate validation failure.
    InvalidArgument,      ///< Caller supplied a bad name, version or option.
    Timeout,              ///< Caller stopped waiting for an in-flight operation.
    LoadFailed,           ///< A plugin implementation could not be instantiated.
    InternalError,        ///< Anything else.
  };

  /**
   * @struct PlmError
   * @brief Error value carried by Result.
   */
  struct PlmError {
    PlmErrorCode         code;
    types::String        message;
    std::source_location location;

    PlmError(const PlmErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : code(errc), message(std::move(msg)), location(loc) {}
  };
} // namespace plm::utils::error

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ERR(errc, msg) \
  return ::plm::utils::types::Err(::plm::utils::error::PlmError(::plm::utils::error::PlmErrorCode::errc, msg))

#define ERR_FMT(errc, ...) \
  return ::plm::utils::types::Err(::plm::utils::error::PlmError(::plm::utils::error::PlmErrorCode::errc, std::format(__VA_ARGS__)))

// Unwraps a Result, returning its error from the enclosing function on failure.
#define TRY(expr)                                     \
  ({                                                  \
    auto&& _tryResult = (expr);                       \
    if (!_tryResult)                                  \
      return ::plm::utils::types::Err(_tryResult.error()); \
    std::move(*_tryResult);                           \
  })

// TRY for Result<Unit>, which has no value to unwrap.
#define TRY_VOID(expr)                                         \
  do {                                                         \
    if (auto&& _tryResult = (expr); !_tryResult)               \
      return ::plm::utils::types::Err(_tryResult.error());     \
  } while (false)
// NOLINTEND(cppcoreguidelines-macro-usage)
