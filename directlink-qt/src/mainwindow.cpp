/**
 * @file mainwindow.cpp
 * @brief Main window implementation
 */

#include "mainwindow.h"
#include "devicemodel.h"
#include "settingsdialog.h"
#include "ui_mainwindow.h"

#include <QCloseEvent>
#include <QDateTime>
#include <QMessageBox>
#include <QSignalBlocker>
#include <directlink/directlink.h>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent), ui(std::make_unique<Ui::MainWindow>()),
      bridge_(std::make_unique<CoordinatorBridge>(this)),
      deviceModel_(std::make_unique<DeviceModel>(this)) {

  ui->setupUi(this);
  setupUi();
  setupConnections();

  bridge_->initialize();
}

MainWindow::~MainWindow() = default;

// ============================================================================
// Setup
// ============================================================================

void MainWindow::setupUi() {
  setWindowTitle("DirectLink");
  setMinimumSize(420, 560);

  ui->deviceListView->setModel(deviceModel_.get());
  ui->discoverButton->setCheckable(true);
  ui->logView->setReadOnly(true);
  ui->logView->setMaximumBlockCount(2000);

  ui->statusLabel->setText("Idle");
  ui->deviceInfoLabel->setText("This device: unknown");

  updateConnectionState(false);
}

void MainWindow::setupConnections() {
  // UI buttons
  connect(ui->autoConnectButton, &QPushButton::clicked, this,
          &MainWindow::onAutoConnectClicked);

  connect(ui->discoverButton, &QPushButton::toggled, this,
          &MainWindow::onDiscoverToggled);

  connect(ui->disconnectButton, &QPushButton::clicked, this,
          &MainWindow::onDisconnectClicked);

  connect(ui->clearLogButton, &QPushButton::clicked, ui->logView,
          &QPlainTextEdit::clear);

  connect(ui->deviceListView, &QListView::clicked, this,
          &MainWindow::onDeviceClicked);

  connect(ui->actionSettings, &QAction::triggered, this,
          &MainWindow::onSettingsClicked);

  connect(ui->actionAbout, &QAction::triggered, this,
          &MainWindow::onAboutClicked);

  connect(ui->actionQuit, &QAction::triggered, this, &QWidget::close);

  // Bridge signals
  connect(bridge_.get(), &CoordinatorBridge::logMessage, this,
          &MainWindow::onLogMessage);

  connect(bridge_.get(), &CoordinatorBridge::statusChanged, this,
          &MainWindow::onStatusChanged);

  connect(bridge_.get(), &CoordinatorBridge::discoveryStateChanged, this,
          &MainWindow::onDiscoveryStateChanged);

  connect(bridge_.get(), &CoordinatorBridge::devicesChanged, this,
          &MainWindow::onDevicesChanged);

  connect(bridge_.get(), &CoordinatorBridge::connectionChanged, this,
          &MainWindow::onConnectionChanged);

  connect(bridge_.get(), &CoordinatorBridge::thisDeviceChanged, this,
          &MainWindow::onThisDeviceChanged);

  connect(bridge_.get(), &CoordinatorBridge::errorOccurred, this,
          &MainWindow::onErrorOccurred);
}

// ============================================================================
// UI Actions
// ============================================================================

void MainWindow::onAutoConnectClicked() { bridge_->autoConnect(); }

void MainWindow::onDiscoverToggled(bool checked) {
  if (checked) {
    bridge_->startDiscovery();
  } else {
    bridge_->stopDiscovery();
  }
}

void MainWindow::onDeviceClicked(const QModelIndex &index) {
  QString address = deviceModel_->addressAt(index);
  if (!address.isEmpty()) {
    bridge_->connectToDevice(address);
  }
}

void MainWindow::onDisconnectClicked() { bridge_->disconnect(); }

void MainWindow::onSettingsClicked() {
  SettingsDialog dialog(this);
  dialog.setConfig(bridge_->config());

  if (dialog.exec() == QDialog::Accepted) {
    deviceModel_->clear();
    bridge_->applyConfig(dialog.config());
  }
}

void MainWindow::onAboutClicked() {
  QMessageBox::about(this, "About DirectLink",
                     QString("<h2>DirectLink</h2>"
                             "<p>Version %1</p>"
                             "<p>WiFi Direct discovery and connection "
                             "through wpa_supplicant.</p>")
                         .arg(directlink::VERSION_STRING));
}

// ============================================================================
// Bridge Signal Handlers
// ============================================================================

void MainWindow::onLogMessage(const QString &line) {
  QString stamp = QDateTime::currentDateTime().toString("HH:mm:ss");
  ui->logView->appendPlainText(QString("[%1] %2").arg(stamp, line));
}

void MainWindow::onStatusChanged(const QString &status) {
  ui->statusLabel->setText(status);
}

void MainWindow::onDiscoveryStateChanged(bool discovering) {
  // Reflect the state without re-issuing a request
  QSignalBlocker blocker(ui->discoverButton);
  ui->discoverButton->setChecked(discovering);
  ui->discoverButton->setText(discovering ? "Stop Discovery" : "Discover");
}

void MainWindow::onDevicesChanged(const QList<DeviceInfo> &devices) {
  deviceModel_->setDevices(devices);
  ui->statusBar->showMessage(QString("%1 device(s) found").arg(devices.size()),
                             3000);
}

void MainWindow::onConnectionChanged(bool connected,
                                     const QString &groupOwnerAddress,
                                     bool isGroupOwner) {
  updateConnectionState(connected);

  if (!connected) {
    ui->connectionLabel->setText("Not connected");
    return;
  }

  QString role = isGroupOwner ? "group owner" : "client";
  QString address =
      groupOwnerAddress.isEmpty() ? QString("unknown") : groupOwnerAddress;
  ui->connectionLabel->setText(
      QString("Connected as %1, group owner address %2").arg(role, address));
}

void MainWindow::onThisDeviceChanged(const DeviceInfo &device) {
  ui->deviceInfoLabel->setText(QString("This device: %1 (%2) - %3")
                                   .arg(device.name, device.address,
                                        device.status));
}

void MainWindow::onErrorOccurred(const QString &title, const QString &message) {
  QMessageBox::warning(this, title, message);
}

// ============================================================================
// Window Events
// ============================================================================

void MainWindow::closeEvent(QCloseEvent *event) {
  bridge_->shutdown();
  event->accept();
}

// ============================================================================
// Helpers
// ============================================================================

void MainWindow::updateConnectionState(bool connected) {
  ui->disconnectButton->setEnabled(connected);
  ui->autoConnectButton->setEnabled(!connected);
}
