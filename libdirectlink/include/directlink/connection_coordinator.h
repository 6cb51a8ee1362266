/**
 * @file connection_coordinator.h
 * @brief WiFi Direct discovery and connection coordinator
 *
 * The coordinator issues discovery, connect and disconnect requests to a
 * P2pService and keeps a small state model up to date from the request
 * completions and from platform events routed by EventDemultiplexer.
 *
 * Connection Flow (auto connect):
 *   1. auto_discover_and_connect() disconnects an existing group, marks an
 *      auto connect as pending and starts discovery
 *   2. The platform reports PeersChanged; request_peers() fetches the list
 *   3. The first Available peer (else the first peer) is connected with PBC
 *   4. The platform reports ConnectionChanged(connected); the coordinator
 *      fetches the group info and reports the connection
 *
 * All operations and callbacks run on a single thread. Nothing throws;
 * failures are reported through the log and status channels.
 *
 * Example usage:
 * @code
 *   ConnectionCoordinator coordinator(
 *       create_platform_p2p_service(config, dispatcher), config);
 *
 *   coordinator.on_log([](const std::string &line) { show(line); });
 *   coordinator.on_connection_changed(
 *       [](bool connected, const std::optional<ConnectionInfo> &info) {});
 *
 *   if (coordinator.initialize()) {
 *     coordinator.auto_discover_and_connect();
 *   }
 * @endcode
 */

#ifndef DIRECTLINK_CONNECTION_COORDINATOR_H
#define DIRECTLINK_CONNECTION_COORDINATOR_H

#include "config.h"
#include "error.h"
#include "p2p_service.h"
#include "platform.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace directlink {

// ============================================================================
// Coordinator State
// ============================================================================

/**
 * @brief Observable state of the coordinator
 *
 * is_connected is true only while the last fetched ConnectionInfo had
 * group_formed set. connected_device is recorded when a connect request is
 * accepted, before the group actually forms.
 */
struct CoordinatorState {
  bool is_connected = false;
  bool is_discovering = false;
  bool auto_connect_pending = false;
  std::optional<PeerDevice> connected_device;
  std::optional<ConnectionInfo> connection_info;

  /// Latest peer snapshot, in platform order
  PeerList devices;
};

// ============================================================================
// Connection Coordinator
// ============================================================================

class DIRECTLINK_API ConnectionCoordinator {
public:
  explicit ConnectionCoordinator(std::unique_ptr<P2pService> service,
                                 const CoordinatorConfig &config = {});
  ~ConnectionCoordinator();

  // Non-copyable
  ConnectionCoordinator(const ConnectionCoordinator &) = delete;
  ConnectionCoordinator &operator=(const ConnectionCoordinator &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Acquire the platform handle and register for platform events
   * @return PlatformUnsupported when the host has no WiFi Direct support
   *
   * Failures are also logged. Calling initialize() twice returns
   * AlreadyInitialized.
   */
  Result<void> initialize();

  /**
   * @brief Stop discovery, disconnect, unregister events, release platform
   *
   * Idempotent.
   */
  void shutdown();

  bool is_initialized() const;

  // ========================================================================
  // Discovery
  // ========================================================================

  /// Ask the platform to start peer discovery
  void discover_peers();

  /// Ask the platform to stop peer discovery
  void stop_discovery();

  /**
   * @brief Fetch the current peer snapshot and replace the device list
   *
   * Consumes a pending auto connect when the snapshot is non-empty.
   */
  void request_peers();

  // ========================================================================
  // Connection
  // ========================================================================

  /// Connect to a peer using push button configuration
  void connect_to_device(const PeerDevice &device);

  /// Disconnect if needed, then discover and connect to the first peer
  void auto_discover_and_connect();

  /// Fetch group information and update is_connected from it
  void request_connection_info();

  /// Remove the current group, falling back to cancelling the connect
  void disconnect();

  // ========================================================================
  // Platform Notifications
  // ========================================================================

  void handle_wifi_p2p_state(bool enabled);
  void handle_disconnected();
  void handle_this_device_changed(const PeerDevice &device);

  /// Emit a line on the log channel
  void log(const std::string &message);

  // ========================================================================
  // State
  // ========================================================================

  const CoordinatorState &state() const;
  bool is_connected() const;
  bool is_discovering() const;
  const PeerList &devices() const;

  const CoordinatorConfig &config() const;

  // ========================================================================
  // Callbacks
  // ========================================================================

  void on_log(std::function<void(const std::string &)> callback);

  void on_devices_changed(std::function<void(const PeerList &)> callback);

  void on_connection_changed(
      std::function<void(bool connected,
                         const std::optional<ConnectionInfo> &info)>
          callback);

  void on_status_changed(std::function<void(const std::string &)> callback);

  void on_this_device_changed(
      std::function<void(const std::optional<PeerDevice> &)> callback);

private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

/**
 * @brief Pick the auto connect target from a peer snapshot
 * @return The first Available device, else the first device, else nothing
 */
DIRECTLINK_API std::optional<PeerDevice>
select_auto_connect_target(const PeerList &devices);

} // namespace directlink

#endif // DIRECTLINK_CONNECTION_COORDINATOR_H
