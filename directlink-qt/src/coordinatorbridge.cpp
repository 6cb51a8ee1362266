/**
 * @file coordinatorbridge.cpp
 * @brief DirectLink Bridge Implementation
 */

#include "coordinatorbridge.h"
#include <QMetaObject>
#include <QSettings>
#include <directlink/directlink.h>

Q_LOGGING_CATEGORY(lcP2p, "directlink.p2p")

namespace {

DeviceInfo toDeviceInfo(const directlink::PeerDevice &device) {
  DeviceInfo info;
  info.name = QString::fromStdString(device.name);
  info.address = QString::fromStdString(device.address);
  info.primaryType = QString::fromStdString(device.primary_type);
  info.status =
      QString::fromStdString(directlink::device_status_name(device.status));
  info.isAvailable = device.status == directlink::DeviceStatus::Available;
  info.isConnected = device.status == directlink::DeviceStatus::Connected;
  return info;
}

} // namespace

// ============================================================================
// CoordinatorBridge Implementation
// ============================================================================

class CoordinatorBridge::Impl {
public:
  directlink::CoordinatorConfig config;
  std::unique_ptr<directlink::ConnectionCoordinator> coordinator;
  bool discovering = false;
};

CoordinatorBridge::CoordinatorBridge(QObject *parent)
    : QObject(parent), impl_(std::make_unique<Impl>()) {
  impl_->config = loadConfig();
}

CoordinatorBridge::~CoordinatorBridge() { shutdown(); }

// ============================================================================
// Properties
// ============================================================================

bool CoordinatorBridge::isInitialized() const {
  return impl_->coordinator && impl_->coordinator->is_initialized();
}

bool CoordinatorBridge::isDiscovering() const { return impl_->discovering; }

bool CoordinatorBridge::isConnected() const {
  return impl_->coordinator && impl_->coordinator->is_connected();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool CoordinatorBridge::initialize() {
  if (isInitialized()) {
    return true;
  }

  // Completions come from the D-Bus worker; run them on this object's thread
  directlink::Dispatcher dispatcher = [this](std::function<void()> task) {
    QMetaObject::invokeMethod(this, std::move(task), Qt::QueuedConnection);
  };

  impl_->coordinator = std::make_unique<directlink::ConnectionCoordinator>(
      directlink::create_platform_p2p_service(impl_->config, dispatcher),
      impl_->config);
  setupCallbacks();

  auto result = impl_->coordinator->initialize();
  if (result.is_error()) {
    qCWarning(lcP2p) << "Failed to initialize WiFi Direct:"
                     << QString::fromStdString(result.error().to_string());
    emit errorOccurred("WiFi Direct Unavailable",
                       QString::fromStdString(result.error().message));
    return false;
  }

  return true;
}

void CoordinatorBridge::shutdown() {
  if (!impl_->coordinator) {
    return;
  }

  impl_->coordinator->shutdown();
  impl_->coordinator.reset();

  if (impl_->discovering) {
    impl_->discovering = false;
    emit discoveryStateChanged(false);
  }
}

void CoordinatorBridge::setupCallbacks() {
  auto &coordinator = *impl_->coordinator;

  auto syncDiscovery = [this]() {
    bool discovering = impl_->coordinator && impl_->coordinator->is_discovering();
    if (discovering != impl_->discovering) {
      impl_->discovering = discovering;
      emit discoveryStateChanged(discovering);
    }
  };

  coordinator.on_log([this, syncDiscovery](const std::string &line) {
    QString text = QString::fromStdString(line);
    qCInfo(lcP2p).noquote() << text;
    emit logMessage(text);
    syncDiscovery();
  });

  coordinator.on_status_changed(
      [this, syncDiscovery](const std::string &status) {
        emit statusChanged(QString::fromStdString(status));
        syncDiscovery();
      });

  coordinator.on_devices_changed([this](const directlink::PeerList &peers) {
    QList<DeviceInfo> devices;
    for (const auto &peer : peers) {
      devices.append(toDeviceInfo(peer));
    }
    emit devicesChanged(devices);
  });

  coordinator.on_connection_changed(
      [this](bool connected,
             const std::optional<directlink::ConnectionInfo> &info) {
        QString address;
        bool isOwner = false;
        if (info) {
          address = QString::fromStdString(info->group_owner_address);
          isOwner = info->is_group_owner;
        }
        emit connectionChanged(connected, address, isOwner);
      });

  coordinator.on_this_device_changed(
      [this](const std::optional<directlink::PeerDevice> &device) {
        if (device) {
          emit thisDeviceChanged(toDeviceInfo(*device));
        }
      });
}

// ============================================================================
// Discovery
// ============================================================================

void CoordinatorBridge::startDiscovery() {
  if (!impl_->coordinator) {
    emit errorOccurred("Discovery Error", "WiFi Direct is not initialized");
    return;
  }
  impl_->coordinator->discover_peers();
}

void CoordinatorBridge::stopDiscovery() {
  if (impl_->coordinator) {
    impl_->coordinator->stop_discovery();
  }
}

// ============================================================================
// Connection
// ============================================================================

void CoordinatorBridge::autoConnect() {
  if (!impl_->coordinator) {
    emit errorOccurred("Connection Error", "WiFi Direct is not initialized");
    return;
  }
  impl_->coordinator->auto_discover_and_connect();
}

void CoordinatorBridge::connectToDevice(const QString &address) {
  if (!impl_->coordinator) {
    emit errorOccurred("Connection Error", "WiFi Direct is not initialized");
    return;
  }

  std::string target = address.toStdString();
  for (const auto &device : impl_->coordinator->devices()) {
    if (device.address == target) {
      impl_->coordinator->connect_to_device(device);
      return;
    }
  }

  qCWarning(lcP2p) << "Selected peer is no longer listed:" << address;
}

void CoordinatorBridge::disconnect() {
  if (impl_->coordinator) {
    impl_->coordinator->disconnect();
  }
}

// ============================================================================
// Settings
// ============================================================================

const directlink::CoordinatorConfig &CoordinatorBridge::config() const {
  return impl_->config;
}

bool CoordinatorBridge::applyConfig(
    const directlink::CoordinatorConfig &config) {
  auto valid = config.validate();
  if (valid.is_error()) {
    emit errorOccurred("Invalid Settings",
                       QString::fromStdString(valid.error().message));
    return false;
  }

  saveConfig(config);
  impl_->config = config;

  // The platform service binds to its interface at init
  shutdown();
  return initialize();
}

directlink::CoordinatorConfig CoordinatorBridge::loadConfig() {
  QSettings settings(QStringLiteral("DirectLink"), QStringLiteral("DirectLink"));

  directlink::CoordinatorConfig config;
  config.interface_name =
      settings
          .value(QStringLiteral("interfaceName"),
                 QString::fromStdString(config.interface_name))
          .toString()
          .trimmed()
          .toStdString();
  config.go_intent =
      settings.value(QStringLiteral("goIntent"), config.go_intent).toInt();
  config.discovery_timeout = std::chrono::seconds(
      settings
          .value(QStringLiteral("discoveryTimeout"),
                 static_cast<qlonglong>(config.discovery_timeout.count()))
          .toLongLong());

  if (config.validate().is_error()) {
    qCWarning(lcP2p) << "Stored settings are invalid, using defaults";
    config.load_defaults();
  }
  return config;
}

void CoordinatorBridge::saveConfig(
    const directlink::CoordinatorConfig &config) {
  QSettings settings(QStringLiteral("DirectLink"), QStringLiteral("DirectLink"));
  settings.setValue(QStringLiteral("interfaceName"),
                    QString::fromStdString(config.interface_name));
  settings.setValue(QStringLiteral("goIntent"), config.go_intent);
  settings.setValue(QStringLiteral("discoveryTimeout"),
                    static_cast<qlonglong>(config.discovery_timeout.count()));
  settings.sync();
}
