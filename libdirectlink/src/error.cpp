/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "directlink/error.h"
#include <sstream>

namespace directlink {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";

  case ErrorCode::PlatformUnsupported:
    return "PlatformUnsupported";
  case ErrorCode::RequestRejected:
    return "RequestRejected";
  case ErrorCode::NotConnected:
    return "NotConnected";

  case ErrorCode::PlatformError:
    return "PlatformError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";

  case ErrorCode::PlatformUnsupported:
    return "WiFi Direct is not supported on this device";
  case ErrorCode::RequestRejected:
    return "The P2P service rejected the request";
  case ErrorCode::NotConnected:
    return "Not connected to any device";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Error
// ============================================================================

Error Error::rejected(int reason_code, std::string msg) {
  Error err(ErrorCode::RequestRejected, std::move(msg));
  err.reason = reason_code;
  return err;
}

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (code == ErrorCode::RequestRejected) {
    oss << "(" << reason << ")";
  }

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace directlink
