/**
 * @file devicemodel.cpp
 * @brief Device model implementation
 */

#include "devicemodel.h"

DeviceModel::DeviceModel(QObject *parent) : QAbstractListModel(parent) {}

int DeviceModel::rowCount(const QModelIndex &parent) const {
  if (parent.isValid())
    return 0;
  return devices_.size();
}

QVariant DeviceModel::data(const QModelIndex &index, int role) const {
  if (!index.isValid() || index.row() >= devices_.size()) {
    return QVariant();
  }

  const auto &device = devices_.at(index.row());

  switch (role) {
  case Qt::DisplayRole:
    return QString("%1 (%2) - %3")
        .arg(device.name, device.address, device.status);
  case NameRole:
    return device.name;
  case AddressRole:
    return device.address;
  case TypeRole:
    return device.primaryType;
  case StatusRole:
    return device.status;
  case ConnectedRole:
    return device.isConnected;
  case Qt::ToolTipRole:
    return QString("%1\nAddress: %2\nType: %3")
        .arg(device.name, device.address, device.primaryType);
  default:
    return QVariant();
  }
}

QHash<int, QByteArray> DeviceModel::roleNames() const {
  QHash<int, QByteArray> roles;
  roles[AddressRole] = "deviceAddress";
  roles[NameRole] = "deviceName";
  roles[TypeRole] = "primaryType";
  roles[StatusRole] = "status";
  roles[ConnectedRole] = "isConnected";
  return roles;
}

void DeviceModel::setDevices(const QList<DeviceInfo> &devices) {
  beginResetModel();
  devices_ = devices;
  endResetModel();
}

void DeviceModel::clear() {
  beginResetModel();
  devices_.clear();
  endResetModel();
}

QString DeviceModel::addressAt(const QModelIndex &index) const {
  if (!index.isValid() || index.row() >= devices_.size()) {
    return QString();
  }
  return devices_.at(index.row()).address;
}
