/**
 * @file directlink.h
 * @brief Main DirectLink API Header
 *
 * DirectLink - WiFi Direct discovery and connection for Linux
 *
 * This is the main header file for the DirectLink library. It provides:
 * - Peer discovery over WiFi Direct
 * - Automatic or manual connection to a peer
 * - Group information once the P2P group has formed
 *
 * Quick Start:
 * @code
 *   #include <directlink/directlink.h>
 *
 *   directlink::CoordinatorConfig config;
 *   directlink::ConnectionCoordinator coordinator(
 *       directlink::create_platform_p2p_service(config, dispatcher), config);
 *
 *   coordinator.on_devices_changed([](const directlink::PeerList &peers) {
 *       std::cout << "Peers: " << peers.size() << std::endl;
 *   });
 *
 *   coordinator.initialize();
 *   coordinator.auto_discover_and_connect();
 * @endcode
 */

#ifndef DIRECTLINK_DIRECTLINK_H
#define DIRECTLINK_DIRECTLINK_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "config.h"
#include "p2p_service.h"
#include "connection_coordinator.h"
#include "event_demultiplexer.h"

namespace directlink {

// ============================================================================
// Version Information
// ============================================================================

/// DirectLink major version
constexpr int VERSION_MAJOR = 1;

/// DirectLink minor version
constexpr int VERSION_MINOR = 0;

/// DirectLink patch version
constexpr int VERSION_PATCH = 0;

/// DirectLink version string
constexpr const char *VERSION_STRING = "1.0.0";

} // namespace directlink

#endif // DIRECTLINK_DIRECTLINK_H
