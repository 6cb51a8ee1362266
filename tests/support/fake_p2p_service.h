/**
 * @file fake_p2p_service.h
 * @brief Scripted P2pService for coordinator tests
 *
 * Every request is recorded and its callback parked until the test
 * completes it. Completions can be delivered in any order, which lets the
 * tests exercise superseded requests.
 */

#ifndef DIRECTLINK_TESTS_FAKE_P2P_SERVICE_H
#define DIRECTLINK_TESTS_FAKE_P2P_SERVICE_H

#include <deque>
#include <directlink/p2p_service.h>
#include <string>
#include <utility>
#include <vector>

namespace directlink {
namespace test {

class FakeP2pService : public P2pService {
public:
  // ========================================================================
  // Scripting
  // ========================================================================

  /// Result returned by the next init()
  Result<void> init_result = Result<void>::ok();

  /// Names of every platform call, in order
  std::vector<std::string> calls;

  /// Peer configs passed to connect(), in order
  std::vector<PeerConfig> connect_requests;

  P2pEventSink *sink = nullptr;
  std::function<void()> channel_lost;

  size_t count(const std::string &call) const {
    size_t n = 0;
    for (const auto &c : calls) {
      if (c == call) {
        ++n;
      }
    }
    return n;
  }

  /// Deliver an event the way the platform would
  void emit(const P2pEvent &event) {
    if (sink) {
      sink->on_p2p_event(event);
    }
  }

  // Completion of the oldest pending request of each kind.
  // Each returns false when nothing is pending.

  bool complete_discover(Result<void> result = Result<void>::ok()) {
    return complete(pending_discover, std::move(result));
  }

  bool complete_stop_discovery(Result<void> result = Result<void>::ok()) {
    return complete(pending_stop, std::move(result));
  }

  bool complete_connect(Result<void> result = Result<void>::ok()) {
    return complete(pending_connect, std::move(result));
  }

  bool complete_remove_group(Result<void> result = Result<void>::ok()) {
    return complete(pending_remove, std::move(result));
  }

  bool complete_cancel_connect(Result<void> result = Result<void>::ok()) {
    return complete(pending_cancel, std::move(result));
  }

  bool complete_peers(const PeerList &peers) {
    if (pending_peers.empty()) {
      return false;
    }
    auto callback = std::move(pending_peers.front());
    pending_peers.pop_front();
    callback(peers);
    return true;
  }

  bool complete_connection_info(const std::optional<ConnectionInfo> &info) {
    if (pending_info.empty()) {
      return false;
    }
    auto callback = std::move(pending_info.front());
    pending_info.pop_front();
    callback(info);
    return true;
  }

  /// Complete the newest discovery request, leaving older ones parked
  bool complete_latest_discover(Result<void> result = Result<void>::ok()) {
    if (pending_discover.empty()) {
      return false;
    }
    auto callback = std::move(pending_discover.back());
    pending_discover.pop_back();
    callback(std::move(result));
    return true;
  }

  std::deque<ActionCallback> pending_discover;
  std::deque<ActionCallback> pending_stop;
  std::deque<ActionCallback> pending_connect;
  std::deque<ActionCallback> pending_remove;
  std::deque<ActionCallback> pending_cancel;
  std::deque<PeersCallback> pending_peers;
  std::deque<ConnectionInfoCallback> pending_info;

  // ========================================================================
  // P2pService
  // ========================================================================

  Result<void> init(std::function<void()> on_channel_lost) override {
    calls.push_back("init");
    channel_lost = std::move(on_channel_lost);
    return init_result;
  }

  void shutdown() override { calls.push_back("shutdown"); }

  void set_event_sink(P2pEventSink *event_sink) override {
    calls.push_back(event_sink ? "register" : "unregister");
    sink = event_sink;
  }

  void discover_peers(ActionCallback callback) override {
    calls.push_back("discover");
    pending_discover.push_back(std::move(callback));
  }

  void stop_peer_discovery(ActionCallback callback) override {
    calls.push_back("stop_discovery");
    pending_stop.push_back(std::move(callback));
  }

  void request_peers(PeersCallback callback) override {
    calls.push_back("request_peers");
    pending_peers.push_back(std::move(callback));
  }

  void connect(const PeerConfig &config, ActionCallback callback) override {
    calls.push_back("connect");
    connect_requests.push_back(config);
    pending_connect.push_back(std::move(callback));
  }

  void remove_group(ActionCallback callback) override {
    calls.push_back("remove_group");
    pending_remove.push_back(std::move(callback));
  }

  void cancel_connect(ActionCallback callback) override {
    calls.push_back("cancel_connect");
    pending_cancel.push_back(std::move(callback));
  }

  void request_connection_info(ConnectionInfoCallback callback) override {
    calls.push_back("request_connection_info");
    pending_info.push_back(std::move(callback));
  }

private:
  static bool complete(std::deque<ActionCallback> &queue,
                       Result<void> result) {
    if (queue.empty()) {
      return false;
    }
    auto callback = std::move(queue.front());
    queue.pop_front();
    callback(std::move(result));
    return true;
  }
};

/// Build a peer record
inline PeerDevice make_peer(const std::string &name, DeviceStatus status,
                            const std::string &address = "02:00:00:00:00:01") {
  PeerDevice peer;
  peer.name = name;
  peer.address = address;
  peer.primary_type = "1-0050F204-1";
  peer.status = status;
  return peer;
}

} // namespace test
} // namespace directlink

#endif // DIRECTLINK_TESTS_FAKE_P2P_SERVICE_H
