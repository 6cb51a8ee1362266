/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the Linux platform layer
 *
 * RAII wrappers and small helpers around libdbus used by the
 * wpa_supplicant P2P backend.
 */

#ifndef DIRECTLINK_PLATFORM_LINUX_DBUS_HELPERS_H
#define DIRECTLINK_PLATFORM_LINUX_DBUS_HELPERS_H

#include "directlink/error.h"
#include <cstdint>
#include <dbus/dbus.h>
#include <string>
#include <vector>

namespace directlink {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool add_ref = false)
      : conn_(conn) {
    if (conn_ && add_ref) {
      dbus_connection_ref(conn_);
    }
  }

  ~DBusConnectionWrapper() {
    if (conn_) {
      dbus_connection_unref(conn_);
    }
  }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      if (conn_) {
        dbus_connection_unref(conn_);
      }
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

private:
  DBusConnection *conn_ = nullptr;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to a DirectLink Error
 *
 * The D-Bus error name is kept in Error::details so callers can map it to
 * a P2P failure reason.
 */
inline Error dbus_error_to_directlink(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error(ErrorCode::PlatformError, "D-Bus call failed");
  }

  std::string name = err.name ? std::string(err.name) : "";
  std::string message = name.empty() ? "D-Bus error" : name;
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  return Error(ErrorCode::PlatformError, message, name);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_directlink(err_); }

  const char *name() const { return err_.name; }

private:
  DBusError err_;
};

// ============================================================================
// D-Bus Helper Functions
// ============================================================================

/**
 * @brief Get system D-Bus connection
 */
inline Result<DBusConnectionWrapper> get_system_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    return error.to_error();
  }

  // The shared bus connection must never exit the process
  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn);
}

/**
 * @brief Send a prepared method call and wait for the reply
 */
inline Result<DBusMessageWrapper> send_and_wait(DBusConnection *conn,
                                                DBusMessage *msg,
                                                int timeout_ms) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a D-Bus method without arguments and get the reply
 * @param timeout_ms Timeout in milliseconds (-1 for default)
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method, int timeout_ms = -1) {

  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  return send_and_wait(conn, msg.get(), timeout_ms);
}

/**
 * @brief Fetch a property; the reply's first argument is the variant
 */
inline Result<DBusMessageWrapper>
get_property(DBusConnection *conn, const char *dest, const char *path,
             const char *iface, const char *property, int timeout_ms = -1) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, "org.freedesktop.DBus.Properties", "Get"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                           DBUS_TYPE_STRING, &property, DBUS_TYPE_INVALID);

  return send_and_wait(conn, msg.get(), timeout_ms);
}

/**
 * @brief Fetch every property of an interface as an a{sv} reply
 */
inline Result<DBusMessageWrapper>
get_all_properties(DBusConnection *conn, const char *dest, const char *path,
                   const char *iface, int timeout_ms = -1) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      dest, path, "org.freedesktop.DBus.Properties", "GetAll"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                           DBUS_TYPE_INVALID);

  return send_and_wait(conn, msg.get(), timeout_ms);
}

// ============================================================================
// Variant Readers
// ============================================================================

/**
 * @brief Read a string or object path from an iterator positioned on it
 */
inline bool read_string(DBusMessageIter *iter, std::string &out) {
  int type = dbus_message_iter_get_arg_type(iter);
  if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) {
    return false;
  }

  const char *value = nullptr;
  dbus_message_iter_get_basic(iter, &value);
  out = value ? value : "";
  return true;
}

/**
 * @brief Read an array of bytes (ay) from an iterator positioned on it
 */
inline bool read_bytes(DBusMessageIter *iter, std::vector<uint8_t> &out) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
      dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
    return false;
  }

  DBusMessageIter array_iter;
  dbus_message_iter_recurse(iter, &array_iter);

  const uint8_t *data = nullptr;
  int length = 0;
  dbus_message_iter_get_fixed_array(&array_iter, &data, &length);

  out.assign(data, data + length);
  return true;
}

/**
 * @brief Read an array of object paths (ao) from an iterator positioned on it
 */
inline bool read_object_paths(DBusMessageIter *iter,
                              std::vector<std::string> &out) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return false;
  }

  DBusMessageIter array_iter;
  dbus_message_iter_recurse(iter, &array_iter);

  out.clear();
  while (dbus_message_iter_get_arg_type(&array_iter) ==
         DBUS_TYPE_OBJECT_PATH) {
    const char *path = nullptr;
    dbus_message_iter_get_basic(&array_iter, &path);
    if (path) {
      out.emplace_back(path);
    }
    dbus_message_iter_next(&array_iter);
  }
  return true;
}

/**
 * @brief Walk an a{sv} dictionary
 * @param visit Called with each key and an iterator inside its variant
 */
template <typename Visitor>
inline bool for_each_dict_entry(DBusMessageIter *iter, Visitor visit) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return false;
  }

  DBusMessageIter dict_iter;
  dbus_message_iter_recurse(iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter, variant_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *key = nullptr;
    if (dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_STRING) {
      dbus_message_iter_get_basic(&entry_iter, &key);
      dbus_message_iter_next(&entry_iter);

      if (key &&
          dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&entry_iter, &variant_iter);
        visit(std::string(key), &variant_iter);
      }
    }

    dbus_message_iter_next(&dict_iter);
  }
  return true;
}

/**
 * @brief Get a string (or object path) property from a D-Bus object
 */
inline Result<std::string>
get_string_property(DBusConnection *conn, const char *dest, const char *path,
                    const char *iface, const char *property) {
  auto reply = get_property(conn, dest, path, iface, property);
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, variant_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }

  dbus_message_iter_recurse(&iter, &variant_iter);

  std::string value;
  if (!read_string(&variant_iter, value)) {
    return Error(ErrorCode::PlatformError, "Expected string in variant");
  }

  return value;
}

// ============================================================================
// Dictionary Builders
// ============================================================================

/**
 * @brief Append a {sv} entry holding a basic value to an open a{sv} array
 */
inline void append_dict_entry(DBusMessageIter *dict_iter, const char *key,
                              int type, const void *value) {
  DBusMessageIter entry_iter, variant_iter;
  dbus_message_iter_open_container(dict_iter, DBUS_TYPE_DICT_ENTRY, nullptr,
                                   &entry_iter);
  dbus_message_iter_append_basic(&entry_iter, DBUS_TYPE_STRING, &key);

  char type_sig[2] = {static_cast<char>(type), '\0'};
  dbus_message_iter_open_container(&entry_iter, DBUS_TYPE_VARIANT, type_sig,
                                   &variant_iter);
  dbus_message_iter_append_basic(&variant_iter, type, value);
  dbus_message_iter_close_container(&entry_iter, &variant_iter);

  dbus_message_iter_close_container(dict_iter, &entry_iter);
}

} // namespace platform
} // namespace directlink

#endif // DIRECTLINK_PLATFORM_LINUX_DBUS_HELPERS_H
