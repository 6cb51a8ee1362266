/**
 * @file settingsdialog.cpp
 * @brief Settings dialog implementation
 */

#include "settingsdialog.h"
#include "ui_settingsdialog.h"

SettingsDialog::SettingsDialog(QWidget *parent)
    : QDialog(parent), ui(std::make_unique<Ui::SettingsDialog>()) {

  ui->setupUi(this);
  setWindowTitle("Settings");

  ui->goIntentSpinBox->setRange(0, directlink::MAX_GO_INTENT);
}

SettingsDialog::~SettingsDialog() = default;

void SettingsDialog::setConfig(const directlink::CoordinatorConfig &config) {
  config_ = config;
  ui->interfaceEdit->setText(QString::fromStdString(config.interface_name));
  ui->goIntentSpinBox->setValue(config.go_intent);
  ui->discoveryTimeoutSpinBox->setValue(
      static_cast<int>(config.discovery_timeout.count()));
}

directlink::CoordinatorConfig SettingsDialog::config() const {
  directlink::CoordinatorConfig config = config_;
  config.interface_name = ui->interfaceEdit->text().trimmed().toStdString();
  config.go_intent = ui->goIntentSpinBox->value();
  config.discovery_timeout =
      std::chrono::seconds(ui->discoveryTimeoutSpinBox->value());
  return config;
}
