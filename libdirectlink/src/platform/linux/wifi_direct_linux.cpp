/**
 * @file wifi_direct_linux.cpp
 * @brief WiFi Direct platform service for Linux
 *
 * Implements P2pService on top of wpa_supplicant. Requests are queued to a
 * worker thread that makes the blocking D-Bus calls and also reads the
 * P2PDevice signals. Results and events go back to the caller's thread
 * through the Dispatcher.
 */

#include "directlink/p2p_service.h"
#include "wpa_supplicant.h"
#include <algorithm>
#include <utility>
#include <vector>

namespace directlink {

namespace {

using namespace platform;

constexpr const char *P2P_SIGNAL_RULE =
    "type='signal',sender='fi.w1.wpa_supplicant1',"
    "interface='fi.w1.wpa_supplicant1.Interface.P2PDevice'";

constexpr const char *OWNER_SIGNAL_RULE =
    "type='signal',sender='org.freedesktop.DBus',"
    "interface='org.freedesktop.DBus',member='NameOwnerChanged',"
    "arg0='fi.w1.wpa_supplicant1'";

// Poll interval of the worker between D-Bus reads
constexpr int WORKER_POLL_MS = 100;

Error p2p_unsupported() {
  return Error::rejected(static_cast<int>(FailureReason::P2pUnsupported));
}

/// Convert a failed platform call into a rejected request
Error to_rejection(const Error &error) {
  if (error.code == ErrorCode::RequestRejected) {
    return error;
  }
  return Error::rejected(failure_reason_from_dbus(error.details),
                         error.message);
}

// ============================================================================
// WpaP2pService
// ============================================================================

class WpaP2pService : public P2pService {
public:
  WpaP2pService(const CoordinatorConfig &config, Dispatcher dispatcher)
      : config_(config), dispatcher_(std::move(dispatcher)),
        sink_(std::make_shared<SinkSlot>()) {}

  ~WpaP2pService() override { shutdown(); }

  Result<void> init(std::function<void()> channel_lost) override;
  void shutdown() override;
  void set_event_sink(P2pEventSink *sink) override;

  void discover_peers(ActionCallback callback) override;
  void stop_peer_discovery(ActionCallback callback) override;
  void request_peers(PeersCallback callback) override;
  void connect(const PeerConfig &config, ActionCallback callback) override;
  void remove_group(ActionCallback callback) override;
  void cancel_connect(ActionCallback callback) override;
  void request_connection_info(ConnectionInfoCallback callback) override;

private:
  struct SinkSlot {
    P2pEventSink *sink = nullptr;
  };

  int request_timeout() const {
    return static_cast<int>(config_.request_timeout.count());
  }

  // Coordinator side
  void deliver(std::function<void()> task);
  void complete(ActionCallback callback, Result<void> result);
  void reject(ActionCallback callback);
  void emit(P2pEvent event);
  void post(std::function<void()> task,
            std::function<void()> abandon = nullptr);

  // Worker side
  void run();
  void handle_message(DBusMessage *msg);
  void handle_group_started(DBusMessage *msg);
  void handle_group_finished();
  void emit_this_device(DeviceStatus status);
  void notify_channel_lost();

  CoordinatorConfig config_;
  Dispatcher dispatcher_;
  std::shared_ptr<SinkSlot> sink_;
  std::function<void()> channel_lost_;
  std::unique_ptr<WpaSupplicantContext> ctx_;
};

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> WpaP2pService::init(std::function<void()> channel_lost) {
  DIRECTLINK_REQUIRE(!ctx_, ErrorCode::AlreadyInitialized,
                     "P2P service already started");

  dbus_threads_init_default();

  auto bus = get_system_bus();
  if (bus.is_error()) {
    return Error(ErrorCode::PlatformUnsupported, "System D-Bus unavailable",
                 bus.error().message);
  }

  DBusConnection *conn = bus.value().get();
  DIRECTLINK_REQUIRE(dbus_bus_name_has_owner(conn, WPA_SERVICE, nullptr),
                     ErrorCode::PlatformUnsupported,
                     "wpa_supplicant is not running");

  auto iface =
      find_wifi_interface(conn, config_.interface_name, request_timeout());
  if (iface.is_error()) {
    return iface.error();
  }

  DIRECTLINK_TRY(check_p2p_support(conn, iface.value(), request_timeout()));

  auto ctx = std::make_unique<WpaSupplicantContext>();
  ctx->interface_path = iface.value();
  ctx->interface_name =
      get_interface_name(conn, iface.value()).value_or(config_.interface_name);

  auto group = get_current_group(conn, iface.value());
  if (group.is_ok()) {
    ctx->current_group = group.value();
  }

  std::vector<const char *> added;
  for (const char *rule : {P2P_SIGNAL_RULE, OWNER_SIGNAL_RULE}) {
    DBusErrorWrapper error;
    dbus_bus_add_match(conn, rule, error.get());
    if (error.is_set()) {
      for (const char *match : added) {
        dbus_bus_remove_match(conn, match, nullptr);
      }
      return error.to_error();
    }
    added.push_back(rule);
  }

  ctx->conn = std::move(bus.value());
  ctx_ = std::move(ctx);
  channel_lost_ = std::move(channel_lost);
  ctx_->worker = std::thread(&WpaP2pService::run, this);

  return Result<void>::ok();
}

void WpaP2pService::shutdown() {
  if (!ctx_) {
    return;
  }

  sink_->sink = nullptr;

  // The worker sends every queued request before it exits
  ctx_->stop_requested = true;
  if (ctx_->worker.joinable()) {
    ctx_->worker.join();
  }

  for (const char *rule : {P2P_SIGNAL_RULE, OWNER_SIGNAL_RULE}) {
    dbus_bus_remove_match(ctx_->conn.get(), rule, nullptr);
  }

  ctx_.reset();
  channel_lost_ = nullptr;
}

void WpaP2pService::set_event_sink(P2pEventSink *sink) {
  sink_->sink = sink;

  if (!sink || !ctx_) {
    return;
  }

  // A new receiver first learns the current P2P, device and group state
  post([this]() {
    emit(P2pStateChanged{true});

    auto local = get_local_device(ctx_->conn.get(), ctx_->interface_path,
                                  ctx_->interface_name);
    if (local.is_ok()) {
      ctx_->local_device = local.value();
    }
    emit_this_device(ctx_->current_group.formed() ? DeviceStatus::Connected
                                                  : DeviceStatus::Available);

    if (ctx_->current_group.formed()) {
      emit(ConnectionChanged{true});
    }
  });
}

// ============================================================================
// Dispatch
// ============================================================================

void WpaP2pService::deliver(std::function<void()> task) {
  if (dispatcher_) {
    dispatcher_(std::move(task));
  } else {
    task();
  }
}

void WpaP2pService::complete(ActionCallback callback, Result<void> result) {
  if (!callback) {
    return;
  }
  if (result.is_error()) {
    result = to_rejection(result.error());
  }
  deliver([callback, result]() { callback(result); });
}

void WpaP2pService::reject(ActionCallback callback) {
  complete(std::move(callback), p2p_unsupported());
}

void WpaP2pService::emit(P2pEvent event) {
  std::shared_ptr<SinkSlot> slot = sink_;
  deliver([slot, event]() {
    if (slot->sink) {
      slot->sink->on_p2p_event(event);
    }
  });
}

void WpaP2pService::post(std::function<void()> task,
                         std::function<void()> abandon) {
  ctx_->requests.push(std::move(task), std::move(abandon));
}

// ============================================================================
// Requests
// ============================================================================

// Requests still queued when the worker dies are answered through the
// second lambda

void WpaP2pService::discover_peers(ActionCallback callback) {
  if (!ctx_) {
    reject(std::move(callback));
    return;
  }

  post(
      [this, callback]() {
        auto timeout = static_cast<int>(config_.discovery_timeout.count());
        complete(callback, p2p_find(ctx_->conn.get(), ctx_->interface_path,
                                    timeout, request_timeout()));
      },
      [this, callback]() { reject(callback); });
}

void WpaP2pService::stop_peer_discovery(ActionCallback callback) {
  if (!ctx_) {
    reject(std::move(callback));
    return;
  }

  post(
      [this, callback]() {
        complete(callback, p2p_stop_find(ctx_->conn.get(),
                                         ctx_->interface_path,
                                         request_timeout()));
      },
      [this, callback]() { reject(callback); });
}

void WpaP2pService::request_peers(PeersCallback callback) {
  if (!ctx_) {
    deliver([callback]() { callback(PeerList{}); });
    return;
  }

  post(
      [this, callback]() {
        DBusConnection *conn = ctx_->conn.get();
        PeerList devices;

        auto paths = get_peer_paths(conn, ctx_->interface_path);
        if (paths.is_ok()) {
          auto members = get_group_peer_paths(conn, ctx_->interface_path,
                                              ctx_->current_group);

          for (const auto &path : paths.value()) {
            auto peer = get_peer(conn, path);
            if (peer.is_error()) {
              continue; // Peer vanished between the two calls
            }

            PeerDevice device = peer.value();
            if (std::find(members.begin(), members.end(), path) !=
                members.end()) {
              device.status = DeviceStatus::Connected;
            } else if (device.address == ctx_->pending_peer) {
              device.status = DeviceStatus::Invited;
            }
            devices.push_back(std::move(device));
          }
        }

        deliver([callback, devices]() { callback(devices); });
      },
      [this, callback]() { deliver([callback]() { callback(PeerList{}); }); });
}

void WpaP2pService::connect(const PeerConfig &config, ActionCallback callback) {
  if (!ctx_) {
    reject(std::move(callback));
    return;
  }

  post(
      [this, config, callback]() {
        ctx_->pending_peer = config.device_address;

        auto result =
            p2p_connect(ctx_->conn.get(), ctx_->interface_path, config,
                        static_cast<int>(config_.connect_timeout.count()));
        if (result.is_error()) {
          ctx_->pending_peer.clear();
        }

        complete(callback, std::move(result));
      },
      [this, callback]() { reject(callback); });
}

void WpaP2pService::remove_group(ActionCallback callback) {
  if (!ctx_) {
    reject(std::move(callback));
    return;
  }

  post(
      [this, callback]() {
        complete(callback, p2p_disconnect(ctx_->conn.get(),
                                          ctx_->interface_path,
                                          request_timeout()));
      },
      [this, callback]() { reject(callback); });
}

void WpaP2pService::cancel_connect(ActionCallback callback) {
  if (!ctx_) {
    reject(std::move(callback));
    return;
  }

  post(
      [this, callback]() {
        auto result = p2p_cancel(ctx_->conn.get(), ctx_->interface_path,
                                 request_timeout());
        if (result.is_ok()) {
          ctx_->pending_peer.clear();
        }
        complete(callback, std::move(result));
      },
      [this, callback]() { reject(callback); });
}

void WpaP2pService::request_connection_info(ConnectionInfoCallback callback) {
  if (!ctx_) {
    deliver([callback]() { callback(std::nullopt); });
    return;
  }

  post(
      [this, callback]() {
        auto group = get_current_group(ctx_->conn.get(), ctx_->interface_path);
        if (group.is_error()) {
          deliver([callback]() { callback(std::nullopt); });
          return;
        }

        ConnectionInfo info;
        info.group_formed = group.value().formed();

        if (info.group_formed) {
          // Signal data carries the interface and GO address; keep it
          P2PGroup &current = ctx_->current_group;
          if (current.object_path != group.value().object_path) {
            current.object_path = group.value().object_path;
            current.go_address.clear();
          }
          current.role = group.value().role;

          info.is_group_owner = current.role == P2PGroupRole::GroupOwner;
          if (info.is_group_owner && !current.interface_name.empty()) {
            info.group_owner_address =
                get_p2p_ip_address(current.interface_name).value_or("");
          } else {
            info.group_owner_address = current.go_address;
          }
        }

        deliver([callback, info]() { callback(info); });
      },
      [this, callback]() {
        deliver([callback]() { callback(std::nullopt); });
      });
}

// ============================================================================
// Worker
// ============================================================================

void WpaP2pService::run() {
  DBusConnection *conn = ctx_->conn.get();

  while (!ctx_->stop_requested) {
    ctx_->requests.run_all();

    if (!dbus_connection_read_write(conn, WORKER_POLL_MS)) {
      // Bus connection closed; later requests are answered as unsupported
      ctx_->requests.close();
      notify_channel_lost();
      return;
    }

    while (DBusMessage *raw = dbus_connection_pop_message(conn)) {
      DBusMessageWrapper msg(raw);
      handle_message(msg.get());
    }
  }

  ctx_->requests.run_all();
}

void WpaP2pService::handle_message(DBusMessage *msg) {
  if (dbus_message_is_signal(msg, "org.freedesktop.DBus", "NameOwnerChanged")) {
    const char *name = nullptr;
    const char *old_owner = nullptr;
    const char *new_owner = nullptr;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &name,
                               DBUS_TYPE_STRING, &old_owner, DBUS_TYPE_STRING,
                               &new_owner, DBUS_TYPE_INVALID)) {
      return;
    }
    if (std::string(name) != WPA_SERVICE) {
      return;
    }

    bool available = new_owner && new_owner[0] != '\0';
    emit(P2pStateChanged{available});
    if (!available) {
      ctx_->current_group = P2PGroup{};
      notify_channel_lost();
    }
    return;
  }

  const char *path = dbus_message_get_path(msg);
  if (!path || ctx_->interface_path != path) {
    return;
  }

  if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "DeviceFound") ||
      dbus_message_is_signal(msg, WPA_P2P_IFACE, "DeviceLost")) {
    emit(PeersChanged{});
  } else if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "GroupStarted")) {
    handle_group_started(msg);
  } else if (dbus_message_is_signal(msg, WPA_P2P_IFACE, "GroupFinished")) {
    handle_group_finished();
  } else if (dbus_message_is_signal(msg, WPA_P2P_IFACE,
                                    "GroupFormationFailure") ||
             dbus_message_is_signal(msg, WPA_P2P_IFACE,
                                    "GONegotiationFailure")) {
    ctx_->pending_peer.clear();
    emit(ConnectionChanged{false});
    emit(PeersChanged{});
  }
}

void WpaP2pService::handle_group_started(DBusMessage *msg) {
  P2PGroup group;

  DBusMessageIter iter;
  if (dbus_message_iter_init(msg, &iter)) {
    for_each_dict_entry(&iter, [&](const std::string &key,
                                   DBusMessageIter *value) {
      std::string text;
      std::vector<uint8_t> bytes;
      if (key == "group_object" && read_string(value, text)) {
        group.object_path = text;
      } else if (key == "interface_object" && read_string(value, text)) {
        group.interface_path = text;
      } else if (key == "role" && read_string(value, text)) {
        group.role = text == "GO" ? P2PGroupRole::GroupOwner
                                  : P2PGroupRole::Client;
      } else if (key == "IpAddrGo" && read_bytes(value, bytes) &&
                 bytes.size() == 4) {
        group.go_address = std::to_string(bytes[0]) + "." +
                           std::to_string(bytes[1]) + "." +
                           std::to_string(bytes[2]) + "." +
                           std::to_string(bytes[3]);
      }
    });
  }

  if (!group.interface_path.empty()) {
    group.interface_name =
        get_interface_name(ctx_->conn.get(), group.interface_path)
            .value_or("");
  }

  ctx_->current_group = group;
  ctx_->pending_peer.clear();

  emit(ConnectionChanged{true});
  emit_this_device(DeviceStatus::Connected);
  emit(PeersChanged{});
}

void WpaP2pService::handle_group_finished() {
  ctx_->current_group = P2PGroup{};
  ctx_->pending_peer.clear();

  emit(ConnectionChanged{false});
  emit_this_device(DeviceStatus::Available);
  emit(PeersChanged{});
}

void WpaP2pService::notify_channel_lost() {
  std::function<void()> lost = channel_lost_;
  if (lost) {
    deliver(std::move(lost));
  }
}

void WpaP2pService::emit_this_device(DeviceStatus status) {
  if (!ctx_->local_device) {
    return;
  }
  ctx_->local_device->status = status;
  emit(ThisDeviceChanged{ctx_->local_device});
}

} // namespace

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<P2pService>
create_platform_p2p_service(const CoordinatorConfig &config,
                            Dispatcher dispatcher) {
  return std::make_unique<WpaP2pService>(config, std::move(dispatcher));
}

} // namespace directlink
