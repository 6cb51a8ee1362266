/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "directlink/types.h"

namespace directlink {

// ============================================================================
// DeviceStatus
// ============================================================================

std::string device_status_name(DeviceStatus status) {
  switch (status) {
  case DeviceStatus::Available:
    return "available";
  case DeviceStatus::Invited:
    return "invited";
  case DeviceStatus::Connected:
    return "connected";
  case DeviceStatus::Failed:
    return "failed";
  case DeviceStatus::Unavailable:
    return "unavailable";
  }
  return "unknown (" + std::to_string(static_cast<int>(status)) + ")";
}

// ============================================================================
// WpsMethod
// ============================================================================

const char *wps_method_name(WpsMethod method) {
  switch (method) {
  case WpsMethod::Pbc:
    return "pbc";
  }
  return "pbc";
}

// ============================================================================
// FailureReason
// ============================================================================

std::string failure_reason_string(int reason) {
  switch (static_cast<FailureReason>(reason)) {
  case FailureReason::P2pUnsupported:
    return "P2P unsupported";
  case FailureReason::Error:
    return "internal error";
  case FailureReason::Busy:
    return "system busy";
  }
  return "unknown error (" + std::to_string(reason) + ")";
}

} // namespace directlink
