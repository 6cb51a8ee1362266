/**
 * @file wpa_supplicant.cpp
 * @brief wpa_supplicant WiFi Direct implementation
 *
 * Implements WiFi Direct P2P requests via wpa_supplicant D-Bus interface.
 */

#include "wpa_supplicant.h"
#include <cctype>
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <ifaddrs.h>
#include <net/if.h>

namespace directlink {
namespace platform {

// ============================================================================
// Interface Discovery
// ============================================================================

namespace {

Result<std::string> get_interface(DBusConnection *conn, const char *ifname,
                                  int timeout_ms) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      WPA_SERVICE, WPA_PATH, WPA_IFACE, "GetInterface"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &ifname,
                           DBUS_TYPE_INVALID);

  auto reply = send_and_wait(conn, msg.get(), timeout_ms);
  if (reply.is_error()) {
    return reply.error();
  }

  const char *path = nullptr;
  if (!dbus_message_get_args(reply.value().get(), nullptr,
                             DBUS_TYPE_OBJECT_PATH, &path,
                             DBUS_TYPE_INVALID)) {
    return Error(ErrorCode::PlatformError, "Failed to parse interface path");
  }

  return std::string(path);
}

/// Send a P2PDevice method call with no arguments
Result<void> call_p2p_method(DBusConnection *conn,
                             const std::string &iface_path,
                             const char *method, int timeout_ms) {
  auto reply = call_method(conn, WPA_SERVICE, iface_path.c_str(),
                           WPA_P2P_IFACE, method, timeout_ms);
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

std::string read_sysfs_address(const std::string &interface_name) {
  std::ifstream file("/sys/class/net/" + interface_name + "/address");
  std::string address;
  if (file) {
    std::getline(file, address);
  }
  return address;
}

} // namespace

Result<std::string> find_wifi_interface(DBusConnection *conn,
                                        const std::string &preferred,
                                        int timeout_ms) {
  if (!preferred.empty()) {
    auto result = get_interface(conn, preferred.c_str(), timeout_ms);
    if (result.is_error()) {
      return Error(ErrorCode::PlatformUnsupported,
                   "wpa_supplicant does not manage " + preferred,
                   result.error().message);
    }
    return result;
  }

  // Try common interface names
  const char *names[] = {"wlan0", "wlp2s0", "wlp3s0", "wlan1", nullptr};

  for (int i = 0; names[i] != nullptr; i++) {
    auto result = get_interface(conn, names[i], timeout_ms);
    if (result.is_ok()) {
      return result;
    }
  }

  // Fall back to the first interface wpa_supplicant knows about
  auto reply = get_property(conn, WPA_SERVICE, WPA_PATH, WPA_IFACE,
                            "Interfaces", timeout_ms);
  if (reply.is_ok()) {
    DBusMessageIter iter, variant_iter;
    std::vector<std::string> paths;
    if (dbus_message_iter_init(reply.value().get(), &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
      dbus_message_iter_recurse(&iter, &variant_iter);
      if (read_object_paths(&variant_iter, paths) && !paths.empty()) {
        return paths.front();
      }
    }
  }

  return Error(ErrorCode::PlatformUnsupported, "No WiFi interface found");
}

Result<void> check_p2p_support(DBusConnection *conn,
                               const std::string &iface_path,
                               int timeout_ms) {
  auto reply = get_property(conn, WPA_SERVICE, iface_path.c_str(),
                            WPA_P2P_IFACE, "P2PDeviceConfig", timeout_ms);
  if (reply.is_error()) {
    return Error(ErrorCode::PlatformUnsupported,
                 "Interface has no P2P device support",
                 reply.error().message);
  }
  return Result<void>::ok();
}

Result<std::string> get_interface_name(DBusConnection *conn,
                                       const std::string &iface_path) {
  return get_string_property(conn, WPA_SERVICE, iface_path.c_str(),
                             WPA_IFACE_IFACE, "Ifname");
}

Result<PeerDevice> get_local_device(DBusConnection *conn,
                                    const std::string &iface_path,
                                    const std::string &interface_name) {
  auto reply = get_property(conn, WPA_SERVICE, iface_path.c_str(),
                            WPA_P2P_IFACE, "P2PDeviceConfig");
  if (reply.is_error()) {
    return reply.error();
  }

  PeerDevice device;
  device.status = DeviceStatus::Available;
  device.address = read_sysfs_address(interface_name);

  DBusMessageIter iter, variant_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }
  dbus_message_iter_recurse(&iter, &variant_iter);

  for_each_dict_entry(&variant_iter, [&](const std::string &key,
                                         DBusMessageIter *value) {
    if (key == "DeviceName") {
      read_string(value, device.name);
    } else if (key == "PrimaryDeviceType") {
      std::vector<uint8_t> bytes;
      if (read_bytes(value, bytes)) {
        device.primary_type = format_device_type(bytes);
      }
    }
  });

  return device;
}

// ============================================================================
// P2P Operations
// ============================================================================

Result<void> p2p_find(DBusConnection *conn, const std::string &iface_path,
                      int timeout_seconds, int timeout_ms) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      WPA_SERVICE, iface_path.c_str(), WPA_P2P_IFACE, "Find"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, dict_iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict_iter);

  if (timeout_seconds > 0) {
    dbus_int32_t timeout = timeout_seconds;
    append_dict_entry(&dict_iter, "Timeout", DBUS_TYPE_INT32, &timeout);
  }

  dbus_message_iter_close_container(&iter, &dict_iter);

  auto reply = send_and_wait(conn, msg.get(), timeout_ms);
  if (reply.is_error()) {
    return reply.error();
  }

  return Result<void>::ok();
}

Result<void> p2p_stop_find(DBusConnection *conn, const std::string &iface_path,
                           int timeout_ms) {
  return call_p2p_method(conn, iface_path, "StopFind", timeout_ms);
}

Result<void> p2p_connect(DBusConnection *conn, const std::string &iface_path,
                         const PeerConfig &config, int timeout_ms) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      WPA_SERVICE, iface_path.c_str(), WPA_P2P_IFACE, "Connect"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, dict_iter;
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict_iter);

  // peer - object path of the peer to connect to
  std::string peer_path = peer_object_path(iface_path, config.device_address);
  const char *peer = peer_path.c_str();
  append_dict_entry(&dict_iter, "peer", DBUS_TYPE_OBJECT_PATH, &peer);

  // wps_method - "pbc" needs no PIN
  const char *method = wps_method_name(config.wps_method);
  append_dict_entry(&dict_iter, "wps_method", DBUS_TYPE_STRING, &method);

  dbus_int32_t intent = config.go_intent;
  append_dict_entry(&dict_iter, "go_intent", DBUS_TYPE_INT32, &intent);

  dbus_message_iter_close_container(&iter, &dict_iter);

  auto reply = send_and_wait(conn, msg.get(), timeout_ms);
  if (reply.is_error()) {
    return reply.error();
  }

  return Result<void>::ok();
}

Result<void> p2p_disconnect(DBusConnection *conn,
                            const std::string &iface_path, int timeout_ms) {
  return call_p2p_method(conn, iface_path, "Disconnect", timeout_ms);
}

Result<void> p2p_cancel(DBusConnection *conn, const std::string &iface_path,
                        int timeout_ms) {
  return call_p2p_method(conn, iface_path, "Cancel", timeout_ms);
}

// ============================================================================
// Peers and Groups
// ============================================================================

Result<std::vector<std::string>> get_peer_paths(DBusConnection *conn,
                                                const std::string &iface_path) {
  auto reply = get_property(conn, WPA_SERVICE, iface_path.c_str(),
                            WPA_P2P_IFACE, "Peers");
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, variant_iter;
  std::vector<std::string> paths;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }

  dbus_message_iter_recurse(&iter, &variant_iter);
  if (!read_object_paths(&variant_iter, paths)) {
    return Error(ErrorCode::PlatformError, "Expected object path array");
  }

  return paths;
}

Result<PeerDevice> get_peer(DBusConnection *conn,
                            const std::string &peer_path) {
  auto reply =
      get_all_properties(conn, WPA_SERVICE, peer_path.c_str(), WPA_PEER_IFACE);
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter)) {
    return Error(ErrorCode::PlatformError, "Empty peer properties");
  }

  PeerDevice device;
  device.status = DeviceStatus::Available;

  for_each_dict_entry(&iter, [&](const std::string &key,
                                 DBusMessageIter *value) {
    std::vector<uint8_t> bytes;
    if (key == "DeviceName") {
      read_string(value, device.name);
    } else if (key == "DeviceAddress" && read_bytes(value, bytes)) {
      device.address = format_mac_address(bytes);
    } else if (key == "PrimaryDeviceType" && read_bytes(value, bytes)) {
      device.primary_type = format_device_type(bytes);
    }
  });

  if (device.address.empty()) {
    return Error(ErrorCode::PlatformError, "Peer has no device address",
                 peer_path);
  }

  return device;
}

Result<P2PGroup> get_current_group(DBusConnection *conn,
                                   const std::string &iface_path) {
  auto group_path = get_string_property(conn, WPA_SERVICE, iface_path.c_str(),
                                        WPA_P2P_IFACE, "Group");
  if (group_path.is_error()) {
    return group_path.error();
  }

  P2PGroup group;
  if (group_path.value().empty() || group_path.value() == "/") {
    return group;
  }
  group.object_path = group_path.value();

  auto role = get_string_property(conn, WPA_SERVICE, iface_path.c_str(),
                                  WPA_P2P_IFACE, "Role");
  if (role.is_ok()) {
    if (role.value() == "GO") {
      group.role = P2PGroupRole::GroupOwner;
    } else if (role.value() == "client") {
      group.role = P2PGroupRole::Client;
    }
  }

  return group;
}

std::vector<std::string> get_group_peer_paths(DBusConnection *conn,
                                              const std::string &iface_path,
                                              const P2PGroup &group) {
  std::vector<std::string> paths;
  if (!group.formed()) {
    return paths;
  }

  if (group.role == P2PGroupRole::Client) {
    auto peer_go = get_string_property(conn, WPA_SERVICE, iface_path.c_str(),
                                       WPA_P2P_IFACE, "PeerGO");
    if (peer_go.is_ok() && peer_go.value() != "/") {
      paths.push_back(peer_go.value());
    }
    return paths;
  }

  auto reply = get_property(conn, WPA_SERVICE, group.object_path.c_str(),
                            WPA_GROUP_IFACE, "Members");
  if (reply.is_error()) {
    return paths;
  }

  DBusMessageIter iter, variant_iter;
  if (dbus_message_iter_init(reply.value().get(), &iter) &&
      dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
    dbus_message_iter_recurse(&iter, &variant_iter);
    read_object_paths(&variant_iter, paths);
  }

  return paths;
}

// ============================================================================
// Formatting
// ============================================================================

std::string peer_object_path(const std::string &iface_path,
                             const std::string &device_address) {
  std::string hex;
  hex.reserve(12);
  for (char c : device_address) {
    if (c != ':') {
      hex.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return iface_path + "/Peers/" + hex;
}

std::string format_mac_address(const std::vector<uint8_t> &bytes) {
  std::string result;
  char buf[4];
  for (size_t i = 0; i < bytes.size(); ++i) {
    snprintf(buf, sizeof(buf), i == 0 ? "%02x" : ":%02x", bytes[i]);
    result += buf;
  }
  return result;
}

std::string format_device_type(const std::vector<uint8_t> &bytes) {
  if (bytes.size() != 8) {
    return "";
  }

  unsigned category = (bytes[0] << 8) | bytes[1];
  unsigned subcategory = (bytes[6] << 8) | bytes[7];

  char buf[32];
  snprintf(buf, sizeof(buf), "%u-%02X%02X%02X%02X-%u", category, bytes[2],
           bytes[3], bytes[4], bytes[5], subcategory);
  return buf;
}

int failure_reason_from_dbus(const std::string &error_name) {
  const char *unsupported[] = {"ServiceUnknown", "UnknownMethod",
                               "UnknownInterface", "UnknownObject",
                               "NotSupported"};
  for (const char *token : unsupported) {
    if (error_name.find(token) != std::string::npos) {
      return static_cast<int>(FailureReason::P2pUnsupported);
    }
  }

  if (error_name.find("Busy") != std::string::npos ||
      error_name.find("InProgress") != std::string::npos) {
    return static_cast<int>(FailureReason::Busy);
  }

  return static_cast<int>(FailureReason::Error);
}

// ============================================================================
// IP Address Retrieval
// ============================================================================

Result<std::string> get_p2p_ip_address(const std::string &interface_name) {
  struct ifaddrs *ifaddr = nullptr;

  if (getifaddrs(&ifaddr) == -1) {
    return Error(ErrorCode::PlatformError, "Failed to get interface addresses");
  }

  std::string result;

  for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr) {
      continue;
    }

    if (interface_name != ifa->ifa_name) {
      continue;
    }

    if (ifa->ifa_addr->sa_family == AF_INET) {
      char addr_buf[INET_ADDRSTRLEN];
      struct sockaddr_in *sin =
          reinterpret_cast<struct sockaddr_in *>(ifa->ifa_addr);

      if (inet_ntop(AF_INET, &sin->sin_addr, addr_buf, sizeof(addr_buf))) {
        result = addr_buf;
        break;
      }
    }
  }

  freeifaddrs(ifaddr);

  if (result.empty()) {
    return Error(ErrorCode::NotConnected, "No IP address found for interface");
  }

  return result;
}

} // namespace platform
} // namespace directlink
