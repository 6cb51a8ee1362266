/**
 * @file devicemodel.h
 * @brief Qt Model for the peer list
 */

#ifndef DEVICEMODEL_H
#define DEVICEMODEL_H

#include "coordinatorbridge.h"
#include <QAbstractListModel>
#include <QList>

class DeviceModel : public QAbstractListModel {
  Q_OBJECT

public:
  enum DeviceRoles {
    AddressRole = Qt::UserRole + 1,
    NameRole,
    TypeRole,
    StatusRole,
    ConnectedRole
  };

  explicit DeviceModel(QObject *parent = nullptr);

  // QAbstractListModel interface
  int rowCount(const QModelIndex &parent = QModelIndex()) const override;
  QVariant data(const QModelIndex &index,
                int role = Qt::DisplayRole) const override;
  QHash<int, QByteArray> roleNames() const override;

  // Model operations

  /// Replace the list with a new peer snapshot
  void setDevices(const QList<DeviceInfo> &devices);
  void clear();

  QString addressAt(const QModelIndex &index) const;

private:
  QList<DeviceInfo> devices_;
};

#endif // DEVICEMODEL_H
