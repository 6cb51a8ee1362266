/**
 * @file p2p_service.h
 * @brief Platform WiFi Direct service interface
 *
 * P2pService is the boundary between DirectLink and the host's P2P stack.
 * Every request is fire-and-forget: the result arrives later through the
 * supplied callback. Asynchronous state changes of the stack arrive as
 * P2pEvent values delivered to the registered P2pEventSink.
 *
 * Implementations must deliver all callbacks and events on the thread
 * that owns the coordinator. The Linux implementation does this through
 * a Dispatcher supplied at construction.
 */

#ifndef DIRECTLINK_P2P_SERVICE_H
#define DIRECTLINK_P2P_SERVICE_H

#include "config.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace directlink {

// ============================================================================
// Platform Events
// ============================================================================

/// P2P was enabled or disabled on the host
struct P2pStateChanged {
  bool enabled = false;
};

/// The peer list changed; fetch a new snapshot with request_peers()
struct PeersChanged {};

/// The P2P network connected or disconnected
struct ConnectionChanged {
  bool connected = false;
};

/// The local P2P device record changed
struct ThisDeviceChanged {
  std::optional<PeerDevice> device;
};

using P2pEvent = std::variant<P2pStateChanged, PeersChanged,
                              ConnectionChanged, ThisDeviceChanged>;

/**
 * @brief Get a short name for the kind of an event
 */
DIRECTLINK_API const char *p2p_event_name(const P2pEvent &event);

/**
 * @brief Receiver of platform events
 */
class DIRECTLINK_API P2pEventSink {
public:
  virtual ~P2pEventSink() = default;

  virtual void on_p2p_event(const P2pEvent &event) = 0;
};

// ============================================================================
// Callbacks
// ============================================================================

/// Completion of a request: ok when accepted, RequestRejected otherwise
using ActionCallback = std::function<void(Result<void>)>;

/// Delivery of a peer snapshot
using PeersCallback = std::function<void(const PeerList &)>;

/// Delivery of connection info (empty when the platform has none)
using ConnectionInfoCallback =
    std::function<void(const std::optional<ConnectionInfo> &)>;

/// Runs a task on the coordinator's thread
using Dispatcher = std::function<void(std::function<void()>)>;

// ============================================================================
// P2P Service
// ============================================================================

class DIRECTLINK_API P2pService {
public:
  virtual ~P2pService() = default;

  /**
   * @brief Acquire the platform P2P handle
   * @param channel_lost Called if the platform drops the channel later
   * @return PlatformUnsupported if the host has no P2P support
   */
  virtual Result<void> init(std::function<void()> channel_lost) = 0;

  /**
   * @brief Release the platform handle
   *
   * Requests already issued are still sent to the platform. Safe to call
   * more than once.
   */
  virtual void shutdown() = 0;

  /**
   * @brief Register (or, with nullptr, unregister) the event receiver
   */
  virtual void set_event_sink(P2pEventSink *sink) = 0;

  virtual void discover_peers(ActionCallback callback) = 0;
  virtual void stop_peer_discovery(ActionCallback callback) = 0;
  virtual void request_peers(PeersCallback callback) = 0;
  virtual void connect(const PeerConfig &config, ActionCallback callback) = 0;
  virtual void remove_group(ActionCallback callback) = 0;
  virtual void cancel_connect(ActionCallback callback) = 0;
  virtual void request_connection_info(ConnectionInfoCallback callback) = 0;
};

/**
 * @brief Create the P2P service of the host platform
 * @param config Interface and timeout settings
 * @param dispatcher Used to deliver callbacks and events
 */
DIRECTLINK_API std::unique_ptr<P2pService>
create_platform_p2p_service(const CoordinatorConfig &config,
                            Dispatcher dispatcher);

} // namespace directlink

#endif // DIRECTLINK_P2P_SERVICE_H
