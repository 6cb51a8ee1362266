/**
 * @file config.cpp
 * @brief Configuration implementation
 */

#include "directlink/config.h"

namespace directlink {

void CoordinatorConfig::load_defaults() {
  interface_name.clear();
  request_timeout = std::chrono::milliseconds(5000);
  connect_timeout = std::chrono::milliseconds(30000);
  go_intent = 0;
  discovery_timeout = std::chrono::seconds(30);
}

Result<void> CoordinatorConfig::validate() const {
  if (go_intent < 0 || go_intent > MAX_GO_INTENT) {
    return Error(ErrorCode::InvalidArgument,
                 "Group Owner intent must be between 0 and 15");
  }

  if (request_timeout.count() < 0 || connect_timeout.count() < 0) {
    return Error(ErrorCode::InvalidArgument, "Timeouts must not be negative");
  }

  if (discovery_timeout.count() < 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Discovery timeout must not be negative");
  }

  if (interface_name.length() > 15) {
    // IFNAMSIZ - 1
    return Error(ErrorCode::InvalidArgument, "Interface name too long");
  }

  return Result<void>::ok();
}

} // namespace directlink
