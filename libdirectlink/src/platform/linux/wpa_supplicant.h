/**
 * @file wpa_supplicant.h
 * @brief wpa_supplicant WiFi Direct types and internal declarations
 *
 * Internal types for WiFi Direct P2P via wpa_supplicant's D-Bus API.
 */

#ifndef DIRECTLINK_PLATFORM_LINUX_WPA_SUPPLICANT_H
#define DIRECTLINK_PLATFORM_LINUX_WPA_SUPPLICANT_H

#include "dbus_helpers.h"
#include "request_queue.h"
#include "directlink/types.h"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace directlink {
namespace platform {

// wpa_supplicant D-Bus constants
constexpr const char *WPA_SERVICE = "fi.w1.wpa_supplicant1";
constexpr const char *WPA_PATH = "/fi/w1/wpa_supplicant1";
constexpr const char *WPA_IFACE = "fi.w1.wpa_supplicant1";
constexpr const char *WPA_IFACE_IFACE = "fi.w1.wpa_supplicant1.Interface";
constexpr const char *WPA_P2P_IFACE =
    "fi.w1.wpa_supplicant1.Interface.P2PDevice";
constexpr const char *WPA_PEER_IFACE = "fi.w1.wpa_supplicant1.Peer";
constexpr const char *WPA_GROUP_IFACE = "fi.w1.wpa_supplicant1.Group";

/**
 * @brief P2P Group role
 */
enum class P2PGroupRole {
  Unknown,
  GroupOwner, // GO - acts as access point
  Client      // P2P client
};

/**
 * @brief WiFi Direct group information
 */
struct P2PGroup {
  std::string object_path;    // Group object path, empty when no group
  std::string interface_path; // Group interface object path
  std::string interface_name; // Network interface (e.g., "p2p-wlan0-0")
  P2PGroupRole role = P2PGroupRole::Unknown;
  std::string go_address; // Group owner IPv4, if known

  bool formed() const { return !object_path.empty(); }
};

/**
 * @brief wpa_supplicant platform context
 *
 * Everything except the task queue is touched only by the worker thread
 * once it has started.
 */
struct WpaSupplicantContext {
  DBusConnectionWrapper conn; // System D-Bus connection
  std::string interface_path; // Primary WiFi interface object path
  std::string interface_name; // Interface name (e.g., "wlan0")
  P2PGroup current_group;     // Current P2P group
  std::string pending_peer;   // Address of an outstanding connect
  std::optional<PeerDevice> local_device;

  RequestQueue requests; // Requests waiting for the worker

  std::atomic<bool> stop_requested{false};
  std::thread worker; // Runs requests and D-Bus signal processing
};

/**
 * @brief Find the WiFi interface managed by wpa_supplicant
 * @param preferred Interface name to use; empty tries common names
 * @return Interface object path
 */
Result<std::string> find_wifi_interface(DBusConnection *conn,
                                        const std::string &preferred,
                                        int timeout_ms);

/**
 * @brief Check that the interface exposes the P2PDevice interface
 */
Result<void> check_p2p_support(DBusConnection *conn,
                               const std::string &iface_path, int timeout_ms);

/**
 * @brief Get the kernel name of an interface object (e.g. "wlan0")
 */
Result<std::string> get_interface_name(DBusConnection *conn,
                                       const std::string &iface_path);

/**
 * @brief Read the local P2P device record
 */
Result<PeerDevice> get_local_device(DBusConnection *conn,
                                    const std::string &iface_path,
                                    const std::string &interface_name);

/**
 * @brief Start P2P discovery (find peers)
 */
Result<void> p2p_find(DBusConnection *conn, const std::string &iface_path,
                      int timeout_seconds, int timeout_ms);

/**
 * @brief Stop P2P discovery
 */
Result<void> p2p_stop_find(DBusConnection *conn, const std::string &iface_path,
                           int timeout_ms);

/**
 * @brief Connect to a P2P peer
 */
Result<void> p2p_connect(DBusConnection *conn, const std::string &iface_path,
                         const PeerConfig &config, int timeout_ms);

/**
 * @brief Leave or tear down the current P2P group
 */
Result<void> p2p_disconnect(DBusConnection *conn,
                            const std::string &iface_path, int timeout_ms);

/**
 * @brief Cancel an ongoing group formation
 */
Result<void> p2p_cancel(DBusConnection *conn, const std::string &iface_path,
                        int timeout_ms);

/**
 * @brief List the object paths of the currently known peers
 */
Result<std::vector<std::string>> get_peer_paths(DBusConnection *conn,
                                                const std::string &iface_path);

/**
 * @brief Read a peer object; status is left Available
 */
Result<PeerDevice> get_peer(DBusConnection *conn,
                            const std::string &peer_path);

/**
 * @brief Read the current group of the P2P device
 *
 * A result with formed() == false means no group exists.
 */
Result<P2PGroup> get_current_group(DBusConnection *conn,
                                   const std::string &iface_path);

/**
 * @brief Object paths of the peers that are members of the group
 */
std::vector<std::string> get_group_peer_paths(DBusConnection *conn,
                                              const std::string &iface_path,
                                              const P2PGroup &group);

/**
 * @brief Object path wpa_supplicant uses for a peer address
 */
std::string peer_object_path(const std::string &iface_path,
                             const std::string &device_address);

/**
 * @brief Format a 6 byte address as aa:bb:cc:dd:ee:ff
 */
std::string format_mac_address(const std::vector<uint8_t> &bytes);

/**
 * @brief Format an 8 byte WPS device type as "category-OUI-subcategory"
 */
std::string format_device_type(const std::vector<uint8_t> &bytes);

/**
 * @brief Map a D-Bus error name to a FailureReason code
 */
int failure_reason_from_dbus(const std::string &error_name);

/**
 * @brief Get assigned IP address after group formation
 */
Result<std::string> get_p2p_ip_address(const std::string &interface_name);

} // namespace platform
} // namespace directlink

#endif // DIRECTLINK_PLATFORM_LINUX_WPA_SUPPLICANT_H
