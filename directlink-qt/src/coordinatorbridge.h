/**
 * @file coordinatorbridge.h
 * @brief Bridge between Qt UI and libdirectlink
 *
 * This class owns the ConnectionCoordinator and exposes it via Qt-friendly
 * signals and slots. Platform completions arrive on the D-Bus worker thread
 * and are posted to the GUI thread before they reach the coordinator.
 */

#ifndef COORDINATORBRIDGE_H
#define COORDINATORBRIDGE_H

#include <QList>
#include <QLoggingCategory>
#include <QObject>
#include <QString>
#include <memory>

#include <directlink/config.h>

Q_DECLARE_LOGGING_CATEGORY(lcP2p)

/**
 * @brief Peer information for display in UI
 */
struct DeviceInfo {
  QString name;        // Display name
  QString address;     // P2P device address
  QString primaryType; // WPS primary device type
  QString status;      // "connected", "invited", "available", ...
  bool isAvailable = false;
  bool isConnected = false;
};

/**
 * @brief Bridge class connecting Qt UI to libdirectlink
 */
class CoordinatorBridge : public QObject {
  Q_OBJECT
  Q_PROPERTY(bool isDiscovering READ isDiscovering NOTIFY discoveryStateChanged)
  Q_PROPERTY(bool isConnected READ isConnected NOTIFY connectionChanged)

public:
  explicit CoordinatorBridge(QObject *parent = nullptr);
  ~CoordinatorBridge();

  // ========================================================================
  // Properties
  // ========================================================================

  bool isInitialized() const;
  bool isDiscovering() const;
  bool isConnected() const;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /// Create the platform service and initialize the coordinator
  Q_INVOKABLE bool initialize();
  Q_INVOKABLE void shutdown();

  // ========================================================================
  // Discovery
  // ========================================================================

  Q_INVOKABLE void startDiscovery();
  Q_INVOKABLE void stopDiscovery();

  // ========================================================================
  // Connection
  // ========================================================================

  Q_INVOKABLE void autoConnect();
  Q_INVOKABLE void connectToDevice(const QString &address);
  Q_INVOKABLE void disconnect();

  // ========================================================================
  // Settings
  // ========================================================================

  const directlink::CoordinatorConfig &config() const;

  /// Persist @p config and restart the coordinator with it
  bool applyConfig(const directlink::CoordinatorConfig &config);

  static directlink::CoordinatorConfig loadConfig();
  static void saveConfig(const directlink::CoordinatorConfig &config);

signals:
  void logMessage(const QString &line);
  void statusChanged(const QString &status);
  void discoveryStateChanged(bool isDiscovering);
  void devicesChanged(const QList<DeviceInfo> &devices);
  void connectionChanged(bool connected, const QString &groupOwnerAddress,
                         bool isGroupOwner);
  void thisDeviceChanged(const DeviceInfo &device);
  void errorOccurred(const QString &title, const QString &message);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;

  void setupCallbacks();
};

#endif // COORDINATORBRIDGE_H
