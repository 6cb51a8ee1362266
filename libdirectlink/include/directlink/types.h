/**
 * @file types.h
 * @brief Core type definitions for DirectLink
 */

#ifndef DIRECTLINK_TYPES_H
#define DIRECTLINK_TYPES_H

#include "platform.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace directlink {

// ============================================================================
// Peer Devices
// ============================================================================

/**
 * @brief Status of a peer as reported by the P2P service
 *
 * Numeric values follow the platform's wire values.
 */
enum class DeviceStatus : int {
  Connected = 0,
  Invited = 1,
  Failed = 2,
  Available = 3,
  Unavailable = 4
};

/**
 * @brief A peer device record from the platform's peer snapshot
 */
struct PeerDevice {
  std::string name;         // Human readable device name
  std::string address;      // P2P device address (aa:bb:cc:dd:ee:ff)
  std::string primary_type; // Primary device type (e.g. "1-0050F204-1")
  DeviceStatus status = DeviceStatus::Unavailable;

  bool operator==(const PeerDevice &other) const {
    return name == other.name && address == other.address &&
           primary_type == other.primary_type && status == other.status;
  }
  bool operator!=(const PeerDevice &other) const { return !(*this == other); }
};

using PeerList = std::vector<PeerDevice>;

/**
 * @brief Get human-readable name for a device status
 *
 * Out-of-range values yield "unknown (N)".
 */
DIRECTLINK_API std::string device_status_name(DeviceStatus status);

// ============================================================================
// Connection Info
// ============================================================================

/**
 * @brief P2P group information returned by a connectivity query
 */
struct ConnectionInfo {
  bool group_formed = false;
  bool is_group_owner = false;
  std::string group_owner_address; // IPv4 of the group owner, may be empty

  bool operator==(const ConnectionInfo &other) const {
    return group_formed == other.group_formed &&
           is_group_owner == other.is_group_owner &&
           group_owner_address == other.group_owner_address;
  }
};

// ============================================================================
// Connect Configuration
// ============================================================================

/// WPS provisioning method
enum class WpsMethod : uint8_t {
  /// Push Button Configuration (no PIN)
  Pbc = 0
};

/**
 * @brief Configuration passed to P2pService::connect()
 */
struct PeerConfig {
  std::string device_address;
  WpsMethod wps_method = WpsMethod::Pbc;

  /// Group Owner intent (0-15, higher = more likely to be GO)
  int go_intent = 0;
};

DIRECTLINK_API const char *wps_method_name(WpsMethod method);

// ============================================================================
// Failure Reasons
// ============================================================================

/**
 * @brief Reason codes carried by a rejected P2P request
 */
enum class FailureReason : int {
  Error = 0,
  P2pUnsupported = 1,
  Busy = 2
};

/**
 * @brief Translate a platform failure reason code to text
 *
 * Unrecognized codes produce "unknown error (N)".
 */
DIRECTLINK_API std::string failure_reason_string(int reason);

} // namespace directlink

#endif // DIRECTLINK_TYPES_H
