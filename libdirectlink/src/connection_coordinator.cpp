/**
 * @file connection_coordinator.cpp
 * @brief WiFi Direct coordinator implementation
 */

#include "directlink/connection_coordinator.h"
#include "directlink/event_demultiplexer.h"
#include <cstdint>

namespace directlink {

namespace {

const char *const SEPARATOR = "------------------------------";
const char *const BANNER = "==============================";

/// Text for a rejected request
std::string rejection_text(const Error &error) {
  if (error.code == ErrorCode::RequestRejected) {
    return failure_reason_string(error.reason);
  }
  if (error.message.empty()) {
    return error_code_name(error.code);
  }
  return error.message;
}

} // namespace

std::optional<PeerDevice> select_auto_connect_target(const PeerList &devices) {
  if (devices.empty()) {
    return std::nullopt;
  }

  for (const auto &device : devices) {
    if (device.status == DeviceStatus::Available) {
      return device;
    }
  }

  return devices.front();
}

// ============================================================================
// ConnectionCoordinator Implementation
// ============================================================================

class ConnectionCoordinator::Impl : public std::enable_shared_from_this<Impl> {
public:
  Impl(ConnectionCoordinator &owner, std::unique_ptr<P2pService> svc,
       const CoordinatorConfig &cfg)
      : service(std::move(svc)), config(cfg), demux(owner) {}

  std::unique_ptr<P2pService> service;
  CoordinatorConfig config;
  EventDemultiplexer demux;
  CoordinatorState state;
  bool initialized = false;

  // Id of the latest request issued on each channel. Completions carrying
  // an older id belong to a superseded request and are dropped. Discovery
  // is the exception, see track_discovery().
  struct RequestIds {
    uint64_t discovery = 0; // start and stop share the channel
    uint64_t discovery_applied = 0;
    uint64_t peers = 0;
    uint64_t connect = 0;
    uint64_t group = 0; // remove group and cancel connect
    uint64_t info = 0;
  } ids;

  // Callbacks
  std::function<void(const std::string &)> log_cb;
  std::function<void(const PeerList &)> devices_changed_cb;
  std::function<void(bool, const std::optional<ConnectionInfo> &)>
      connection_changed_cb;
  std::function<void(const std::string &)> status_changed_cb;
  std::function<void(const std::optional<PeerDevice> &)> this_device_cb;

  void log(const std::string &message) {
    if (log_cb) {
      log_cb(message);
    }
  }

  void set_status(const std::string &status) {
    if (status_changed_cb) {
      status_changed_cb(status);
    }
  }

  void notify_connection(bool connected,
                         const std::optional<ConnectionInfo> &info) {
    if (connection_changed_cb) {
      connection_changed_cb(connected, info);
    }
  }

  void clear_connection() {
    state.is_connected = false;
    state.connected_device.reset();
    state.connection_info.reset();

    // A group snapshot requested before the link went down is stale
    ++ids.info;
  }

  /// Drop every outstanding completion
  void invalidate_requests() {
    ++ids.discovery;
    ids.discovery_applied = ids.discovery;
    ++ids.peers;
    ++ids.connect;
    ++ids.group;
    ++ids.info;
  }

  /**
   * Issue a new request id on @p channel and wrap @p handler so it only
   * runs for that id and only while the coordinator is alive.
   */
  template <typename Arg, typename Handler>
  std::function<void(Arg)> track(uint64_t RequestIds::*channel,
                                 const char *what, Handler handler) {
    const uint64_t id = ++(ids.*channel);
    std::weak_ptr<Impl> weak = shared_from_this();

    return [weak, channel, id, what, handler](Arg arg) {
      auto self = weak.lock();
      if (!self) {
        return;
      }
      if (self->ids.*channel != id) {
        self->log(std::string("Ignoring outdated result of ") + what);
        return;
      }
      handler(*self, arg);
    };
  }

  /**
   * Issue a discovery request id. An accepted start or stop applies unless
   * a later request was already accepted; a rejection only counts while
   * its request is still the latest one issued.
   */
  template <typename Handler>
  ActionCallback track_discovery(const char *what, Handler handler) {
    const uint64_t id = ++ids.discovery;
    std::weak_ptr<Impl> weak = shared_from_this();

    return [weak, id, what, handler](Result<void> result) {
      auto self = weak.lock();
      if (!self) {
        return;
      }

      bool current = result.is_ok() ? id > self->ids.discovery_applied
                                    : id == self->ids.discovery;
      if (!current) {
        self->log(std::string("Ignoring outdated result of ") + what);
        return;
      }
      if (result.is_ok()) {
        self->ids.discovery_applied = id;
      }
      handler(*self, std::move(result));
    };
  }

  bool ready(const char *operation) {
    if (initialized && service) {
      return true;
    }
    if (operation) {
      log(std::string("[error] ") + operation +
          ": WiFi Direct is not initialized");
    }
    return false;
  }

  // ========================================================================
  // Operations
  // ========================================================================

  void discover_peers() {
    if (!ready("discover peers")) {
      return;
    }

    log("Searching for nearby WiFi Direct devices...");
    set_status("Searching for devices...");

    service->discover_peers(track_discovery(
        "peer discovery",
        [](Impl &self, Result<void> result) {
          if (result.is_ok()) {
            self.state.is_discovering = true;
            self.log("Discovery started, waiting for the platform to "
                     "report peers...");
            return;
          }

          self.state.is_discovering = false;
          std::string reason = rejection_text(result.error());
          self.log("[error] Peer discovery failed: " + reason);
          self.set_status("Discovery failed (" + reason + ")");
        }));
  }

  void stop_discovery() {
    if (!ready(nullptr)) {
      return;
    }

    service->stop_peer_discovery(track_discovery(
        "stop discovery",
        [](Impl &self, Result<void> result) {
          if (result.is_ok()) {
            self.state.is_discovering = false;
            self.log("Discovery stopped");
            self.set_status("Idle");
            return;
          }

          self.log("[warning] Failed to stop discovery: " +
                   rejection_text(result.error()));
        }));
  }

  void request_peers() {
    if (!ready(nullptr)) {
      return;
    }

    service->request_peers(track<const PeerList &>(
        &RequestIds::peers, "peer list",
        [](Impl &self, const PeerList &devices) {
          self.on_peers(devices);
        }));
  }

  void on_peers(const PeerList &devices) {
    state.devices = devices;

    if (devices.empty()) {
      log("Device list updated: no devices found");
    } else {
      log("Found " + std::to_string(devices.size()) + " device(s):");
      for (size_t i = 0; i < devices.size(); ++i) {
        const auto &device = devices[i];
        log("  [" + std::to_string(i + 1) + "] " + device.name + " (" +
            device.address + ") - " + device_status_name(device.status));
      }
    }

    if (devices_changed_cb) {
      devices_changed_cb(state.devices);
    }

    if (state.auto_connect_pending && !state.is_connected &&
        !devices.empty()) {
      log("Auto connect: connecting to the first available device...");
      auto target = select_auto_connect_target(devices);
      connect_to_device(*target);
      state.auto_connect_pending = false;
    }
  }

  void connect_to_device(const PeerDevice &device) {
    if (!ready("connect")) {
      return;
    }

    log(SEPARATOR);
    log("Connecting to: " + device.name);
    log("  Address: " + device.address);
    log("  Type: " + device.primary_type);
    log("  Status: " + device_status_name(device.status));
    log(SEPARATOR);
    set_status("Connecting to " + device.name + "...");

    PeerConfig peer_config;
    peer_config.device_address = device.address;
    peer_config.wps_method = WpsMethod::Pbc;
    peer_config.go_intent = config.go_intent;

    service->connect(
        peer_config,
        track<Result<void>>(
            &RequestIds::connect, "connect",
            [device](Impl &self, Result<void> result) {
              if (result.is_ok()) {
                self.log("Connection request sent, waiting for the peer to "
                         "accept...");
                self.log("(The peer may show a pairing prompt)");
                self.state.connected_device = device;
                return;
              }

              std::string reason = rejection_text(result.error());
              self.log("[error] Connection request failed: " + reason);
              self.set_status("Connection failed (" + reason + ")");
            }));
  }

  void auto_discover_and_connect() {
    log(BANNER);
    log("Starting one-step auto connect");
    log(BANNER);

    if (state.is_connected) {
      log("Already connected, disconnecting first...");
      disconnect();
    }

    state.auto_connect_pending = true;
    discover_peers();
  }

  void request_connection_info() {
    if (!ready(nullptr)) {
      return;
    }

    service->request_connection_info(
        track<const std::optional<ConnectionInfo> &>(
            &RequestIds::info, "connection info",
            [](Impl &self, const std::optional<ConnectionInfo> &info) {
              self.on_connection_info(info);
            }));
  }

  void on_connection_info(const std::optional<ConnectionInfo> &info) {
    state.connection_info = info;

    if (info && info->group_formed) {
      state.is_connected = true;
      log(BANNER);
      log("WiFi Direct connection established!");
      log(std::string("  Group Owner: ") +
          (info->is_group_owner ? "this device" : "peer"));
      log("  Group Owner IP: " + info->group_owner_address);
      log(BANNER);
      set_status("Connected");
      notify_connection(true, info);
    } else {
      state.is_connected = false;
      log("Connection info updated: no group formed");
      notify_connection(false, std::nullopt);
    }
  }

  void disconnect() {
    if (!ready(nullptr)) {
      return;
    }

    log("Disconnecting WiFi Direct...");
    set_status("Disconnecting...");

    service->remove_group(track<Result<void>>(
        &RequestIds::group, "remove group",
        [](Impl &self, Result<void> result) {
          if (result.is_ok()) {
            self.clear_connection();
            self.log("Disconnected");
            self.set_status("Disconnected");
            self.notify_connection(false, std::nullopt);
            return;
          }

          self.log("[warning] Disconnect failed: " +
                   rejection_text(result.error()));
          self.cancel_connect();
        }));
  }

  void cancel_connect() {
    if (!ready(nullptr)) {
      return;
    }

    service->cancel_connect(track<Result<void>>(
        &RequestIds::group, "cancel connect",
        [](Impl &self, Result<void> result) {
          if (result.is_ok()) {
            self.state.is_connected = false;
            self.log("Connection cancelled");
            self.set_status("Disconnected");
            return;
          }

          self.log("[warning] Failed to cancel connection: " +
                   rejection_text(result.error()));
          self.set_status("Disconnect error");
        }));
  }

  Result<void> initialize() {
    if (initialized) {
      return Error(ErrorCode::AlreadyInitialized,
                   "WiFi Direct already initialized");
    }
    if (!service) {
      log("[error] This device does not support WiFi Direct");
      return Error(ErrorCode::PlatformUnsupported, "No P2P service");
    }

    log("Initializing WiFi Direct...");

    std::weak_ptr<Impl> weak = shared_from_this();
    auto result = service->init([weak]() {
      if (auto self = weak.lock()) {
        self->log("[warning] WiFi Direct channel disconnected");
      }
    });

    if (result.is_error()) {
      if (result.error().code == ErrorCode::PlatformUnsupported) {
        log("[error] This device does not support WiFi Direct");
      } else {
        log("[error] WiFi Direct initialization failed: " +
            result.error().to_string());
      }
      return result;
    }

    initialized = true;
    log("WiFi Direct initialized");

    service->set_event_sink(&demux);
    log("Event receiver registered");

    return Result<void>::ok();
  }

  void shutdown() {
    if (!initialized) {
      return;
    }

    log("Shutting down WiFi Direct...");

    if (state.is_discovering) {
      stop_discovery();
    }
    if (state.is_connected) {
      disconnect();
    }

    service->set_event_sink(nullptr);
    log("Event receiver unregistered");

    service->shutdown();
    initialized = false;

    invalidate_requests();
    state = CoordinatorState{};

    log("WiFi Direct shut down");
  }
};

// ============================================================================
// ConnectionCoordinator
// ============================================================================

ConnectionCoordinator::ConnectionCoordinator(
    std::unique_ptr<P2pService> service, const CoordinatorConfig &config)
    : impl_(std::make_shared<Impl>(*this, std::move(service), config)) {}

ConnectionCoordinator::~ConnectionCoordinator() { shutdown(); }

Result<void> ConnectionCoordinator::initialize() {
  return impl_->initialize();
}

void ConnectionCoordinator::shutdown() { impl_->shutdown(); }

bool ConnectionCoordinator::is_initialized() const {
  return impl_->initialized;
}

void ConnectionCoordinator::discover_peers() { impl_->discover_peers(); }

void ConnectionCoordinator::stop_discovery() { impl_->stop_discovery(); }

void ConnectionCoordinator::request_peers() { impl_->request_peers(); }

void ConnectionCoordinator::connect_to_device(const PeerDevice &device) {
  impl_->connect_to_device(device);
}

void ConnectionCoordinator::auto_discover_and_connect() {
  impl_->auto_discover_and_connect();
}

void ConnectionCoordinator::request_connection_info() {
  impl_->request_connection_info();
}

void ConnectionCoordinator::disconnect() { impl_->disconnect(); }

void ConnectionCoordinator::handle_wifi_p2p_state(bool enabled) {
  if (enabled) {
    impl_->log("WiFi Direct is enabled");
  } else {
    impl_->log("[warning] WiFi Direct is disabled, please turn on WiFi");
    impl_->set_status("WiFi Direct is disabled");
  }
}

void ConnectionCoordinator::handle_disconnected() {
  impl_->clear_connection();
  impl_->set_status("Disconnected");
  impl_->notify_connection(false, std::nullopt);
}

void ConnectionCoordinator::handle_this_device_changed(
    const PeerDevice &device) {
  impl_->log("[event] This device: " + device.name + " (" + device.address +
             ")");
  if (impl_->this_device_cb) {
    impl_->this_device_cb(device);
  }
}

void ConnectionCoordinator::log(const std::string &message) {
  impl_->log(message);
}

const CoordinatorState &ConnectionCoordinator::state() const {
  return impl_->state;
}

bool ConnectionCoordinator::is_connected() const {
  return impl_->state.is_connected;
}

bool ConnectionCoordinator::is_discovering() const {
  return impl_->state.is_discovering;
}

const PeerList &ConnectionCoordinator::devices() const {
  return impl_->state.devices;
}

const CoordinatorConfig &ConnectionCoordinator::config() const {
  return impl_->config;
}

void ConnectionCoordinator::on_log(
    std::function<void(const std::string &)> callback) {
  impl_->log_cb = std::move(callback);
}

void ConnectionCoordinator::on_devices_changed(
    std::function<void(const PeerList &)> callback) {
  impl_->devices_changed_cb = std::move(callback);
}

void ConnectionCoordinator::on_connection_changed(
    std::function<void(bool, const std::optional<ConnectionInfo> &)>
        callback) {
  impl_->connection_changed_cb = std::move(callback);
}

void ConnectionCoordinator::on_status_changed(
    std::function<void(const std::string &)> callback) {
  impl_->status_changed_cb = std::move(callback);
}

void ConnectionCoordinator::on_this_device_changed(
    std::function<void(const std::optional<PeerDevice> &)> callback) {
  impl_->this_device_cb = std::move(callback);
}

} // namespace directlink
