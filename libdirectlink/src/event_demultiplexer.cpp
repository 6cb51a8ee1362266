/**
 * @file event_demultiplexer.cpp
 * @brief Platform event routing
 */

#include "directlink/event_demultiplexer.h"
#include "directlink/connection_coordinator.h"

namespace directlink {

// ============================================================================
// Event Names
// ============================================================================

namespace {

struct EventNameVisitor {
  const char *operator()(const P2pStateChanged &) const {
    return "P2pStateChanged";
  }
  const char *operator()(const PeersChanged &) const { return "PeersChanged"; }
  const char *operator()(const ConnectionChanged &) const {
    return "ConnectionChanged";
  }
  const char *operator()(const ThisDeviceChanged &) const {
    return "ThisDeviceChanged";
  }
};

} // namespace

const char *p2p_event_name(const P2pEvent &event) {
  return std::visit(EventNameVisitor{}, event);
}

// ============================================================================
// EventDemultiplexer
// ============================================================================

EventDemultiplexer::EventDemultiplexer(ConnectionCoordinator &coordinator)
    : coordinator_(coordinator) {}

void EventDemultiplexer::on_p2p_event(const P2pEvent &event) {
  std::visit([this](const auto &e) { handle(e); }, event);
}

void EventDemultiplexer::handle(const P2pStateChanged &event) {
  coordinator_.handle_wifi_p2p_state(event.enabled);
}

void EventDemultiplexer::handle(const PeersChanged &) {
  coordinator_.log("[event] peer list changed, fetching the latest list...");
  coordinator_.request_peers();
}

void EventDemultiplexer::handle(const ConnectionChanged &event) {
  if (event.connected) {
    coordinator_.log(
        "[event] WiFi Direct connected, fetching connection info...");
    coordinator_.request_connection_info();
  } else {
    coordinator_.log("[event] WiFi Direct connection lost");
    coordinator_.handle_disconnected();
  }
}

void EventDemultiplexer::handle(const ThisDeviceChanged &event) {
  if (!event.device) {
    return;
  }
  coordinator_.handle_this_device_changed(*event.device);
}

} // namespace directlink
