/**
 * @file event_demultiplexer.h
 * @brief Routes platform P2P events to the connection coordinator
 *
 * Each event kind maps to exactly one coordinator operation:
 *
 *   P2pStateChanged    -> handle_wifi_p2p_state(enabled)
 *   PeersChanged       -> request_peers()
 *   ConnectionChanged  -> request_connection_info() when connected,
 *                         handle_disconnected() otherwise
 *   ThisDeviceChanged  -> handle_this_device_changed(device)
 *
 * The demultiplexer keeps no state, so duplicate or reordered events are
 * handled the same way as any other event.
 */

#ifndef DIRECTLINK_EVENT_DEMULTIPLEXER_H
#define DIRECTLINK_EVENT_DEMULTIPLEXER_H

#include "p2p_service.h"
#include "platform.h"

namespace directlink {

class ConnectionCoordinator;

class DIRECTLINK_API EventDemultiplexer : public P2pEventSink {
public:
  explicit EventDemultiplexer(ConnectionCoordinator &coordinator);

  EventDemultiplexer(const EventDemultiplexer &) = delete;
  EventDemultiplexer &operator=(const EventDemultiplexer &) = delete;

  void on_p2p_event(const P2pEvent &event) override;

private:
  void handle(const P2pStateChanged &event);
  void handle(const PeersChanged &event);
  void handle(const ConnectionChanged &event);
  void handle(const ThisDeviceChanged &event);

  ConnectionCoordinator &coordinator_;
};

} // namespace directlink

#endif // DIRECTLINK_EVENT_DEMULTIPLEXER_H
