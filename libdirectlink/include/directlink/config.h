/**
 * @file config.h
 * @brief Coordinator and platform configuration for DirectLink
 */

#ifndef DIRECTLINK_CONFIG_H
#define DIRECTLINK_CONFIG_H

#include "error.h"
#include "platform.h"
#include <chrono>
#include <string>

namespace directlink {

/**
 * @brief Configuration for the coordinator and the platform P2P service
 */
struct CoordinatorConfig {
  // ========================================================================
  // Platform
  // ========================================================================

  /// WiFi interface managed by wpa_supplicant (empty = try common names)
  std::string interface_name;

  /// Timeout for ordinary blocking platform calls
  std::chrono::milliseconds request_timeout{5000};

  /// Timeout for the connect call (group negotiation can be slow)
  std::chrono::milliseconds connect_timeout{30000};

  // ========================================================================
  // P2P
  // ========================================================================

  /// Group Owner intent used for connect requests (0-15)
  int go_intent = 0;

  /// How long a discovery request runs (0 = platform default)
  std::chrono::seconds discovery_timeout{30};

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;
};

/// Highest Group Owner intent accepted by the P2P stack
constexpr int MAX_GO_INTENT = 15;

} // namespace directlink

#endif // DIRECTLINK_CONFIG_H
