/**
 * @file error.h
 * @brief Error codes and result types for DirectLink
 *
 * DirectLink uses a Result type pattern for error handling. No public
 * operation throws; failures are returned or reported through the
 * coordinator's log and status channels.
 */

#ifndef DIRECTLINK_ERROR_H
#define DIRECTLINK_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace directlink {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  InvalidArgument = 2,
  AlreadyInitialized = 5,

  // P2P errors (200-299)
  PlatformUnsupported = 200,
  RequestRejected = 201,
  NotConnected = 203,

  // Platform errors (500-599)
  PlatformError = 500
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 *
 * For ErrorCode::RequestRejected, @ref reason holds the platform's
 * failure reason code (see FailureReason in types.h).
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;
  int reason = 0;

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }

  /// Platform request rejected with the given reason code
  static Error rejected(int reason_code, std::string msg = "");
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<ConnectionInfo> result = fetch();
 *   if (result) {
 *       use(result.value());
 *   } else {
 *       report(result.error());
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  bool is_ok() const { return std::holds_alternative<T>(data_); }
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define DIRECTLINK_TRY(result)                                                 \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define DIRECTLINK_REQUIRE(condition, error_code, message)                     \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::directlink::Error(error_code, message);                         \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
DIRECTLINK_API const char *error_code_name(ErrorCode code);

/// Get description for error code
DIRECTLINK_API const char *error_code_description(ErrorCode code);

} // namespace directlink

#endif // DIRECTLINK_ERROR_H
