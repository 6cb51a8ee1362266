/**
 * @file settingsdialog.h
 * @brief Settings dialog
 */

#ifndef SETTINGSDIALOG_H
#define SETTINGSDIALOG_H

#include <QDialog>
#include <directlink/config.h>
#include <memory>

QT_BEGIN_NAMESPACE
namespace Ui {
class SettingsDialog;
}
QT_END_NAMESPACE

class SettingsDialog : public QDialog {
  Q_OBJECT

public:
  explicit SettingsDialog(QWidget *parent = nullptr);
  ~SettingsDialog();

  void setConfig(const directlink::CoordinatorConfig &config);

  /// Dialog values applied on top of the config passed to setConfig()
  directlink::CoordinatorConfig config() const;

private:
  std::unique_ptr<Ui::SettingsDialog> ui;
  directlink::CoordinatorConfig config_;
};

#endif // SETTINGSDIALOG_H
