/**
 * @file mainwindow.h
 * @brief Main application window
 */

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "coordinatorbridge.h"
#include <QMainWindow>
#include <memory>

QT_BEGIN_NAMESPACE
namespace Ui {
class MainWindow;
}
QT_END_NAMESPACE

class DeviceModel;

class MainWindow : public QMainWindow {
  Q_OBJECT

public:
  explicit MainWindow(QWidget *parent = nullptr);
  ~MainWindow();

protected:
  void closeEvent(QCloseEvent *event) override;

private slots:
  // UI Actions
  void onAutoConnectClicked();
  void onDiscoverToggled(bool checked);
  void onDeviceClicked(const QModelIndex &index);
  void onDisconnectClicked();
  void onSettingsClicked();
  void onAboutClicked();

  // Bridge signals
  void onLogMessage(const QString &line);
  void onStatusChanged(const QString &status);
  void onDiscoveryStateChanged(bool discovering);
  void onDevicesChanged(const QList<DeviceInfo> &devices);
  void onConnectionChanged(bool connected, const QString &groupOwnerAddress,
                           bool isGroupOwner);
  void onThisDeviceChanged(const DeviceInfo &device);
  void onErrorOccurred(const QString &title, const QString &message);

private:
  std::unique_ptr<Ui::MainWindow> ui;
  std::unique_ptr<CoordinatorBridge> bridge_;
  std::unique_ptr<DeviceModel> deviceModel_;

  void setupUi();
  void setupConnections();
  void updateConnectionState(bool connected);
};

#endif // MAINWINDOW_H
