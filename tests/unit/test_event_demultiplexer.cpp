/**
 * @file test_event_demultiplexer.cpp
 * @brief Unit tests for platform event routing
 */

#include "fake_p2p_service.h"
#include <directlink/connection_coordinator.h>
#include <directlink/event_demultiplexer.h>
#include <gtest/gtest.h>

using namespace directlink;
using directlink::test::FakeP2pService;
using directlink::test::make_peer;

class EventDemultiplexerTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto service = std::make_unique<FakeP2pService>();
    fake = service.get();
    coordinator = std::make_unique<ConnectionCoordinator>(std::move(service));

    coordinator->on_status_changed(
        [this](const std::string &status) { statuses.push_back(status); });
    coordinator->on_connection_changed(
        [this](bool connected, const std::optional<ConnectionInfo> &) {
          connection_events.push_back(connected);
        });
    coordinator->on_this_device_changed(
        [this](const std::optional<PeerDevice> &device) {
          this_devices.push_back(device);
        });

    ASSERT_TRUE(coordinator->initialize().is_ok());
    fake->calls.clear();

    demux = std::make_unique<EventDemultiplexer>(*coordinator);
  }

  void TearDown() override {
    demux.reset();
    coordinator.reset();
  }

  FakeP2pService *fake = nullptr;
  std::unique_ptr<ConnectionCoordinator> coordinator;
  std::unique_ptr<EventDemultiplexer> demux;

  std::vector<std::string> statuses;
  std::vector<bool> connection_events;
  std::vector<std::optional<PeerDevice>> this_devices;
};

// ============================================================================
// Routing
// ============================================================================

TEST_F(EventDemultiplexerTest, PeersChangedRequestsPeers) {
  demux->on_p2p_event(PeersChanged{});

  EXPECT_EQ(fake->calls, (std::vector<std::string>{"request_peers"}));
}

TEST_F(EventDemultiplexerTest, ConnectedRequestsConnectionInfo) {
  demux->on_p2p_event(ConnectionChanged{true});

  EXPECT_EQ(fake->calls,
            (std::vector<std::string>{"request_connection_info"}));
  EXPECT_TRUE(connection_events.empty());
}

TEST_F(EventDemultiplexerTest, DisconnectedGoesToCoordinator) {
  demux->on_p2p_event(ConnectionChanged{false});

  EXPECT_TRUE(fake->calls.empty());
  ASSERT_EQ(connection_events.size(), 1u);
  EXPECT_FALSE(connection_events[0]);
  EXPECT_EQ(statuses.back(), "Disconnected");
}

TEST_F(EventDemultiplexerTest, P2pStateGoesToCoordinator) {
  demux->on_p2p_event(P2pStateChanged{false});

  EXPECT_TRUE(fake->calls.empty());
  ASSERT_FALSE(statuses.empty());
  EXPECT_EQ(statuses.back(), "WiFi Direct is disabled");
}

TEST_F(EventDemultiplexerTest, ThisDeviceIsForwarded) {
  auto self = make_peer("My Laptop", DeviceStatus::Connected);
  demux->on_p2p_event(ThisDeviceChanged{self});

  ASSERT_EQ(this_devices.size(), 1u);
  EXPECT_EQ(this_devices[0], std::optional<PeerDevice>(self));
}

TEST_F(EventDemultiplexerTest, EmptyThisDeviceIsDropped) {
  demux->on_p2p_event(ThisDeviceChanged{std::nullopt});

  EXPECT_TRUE(this_devices.empty());
}

TEST_F(EventDemultiplexerTest, DuplicateEventsAreRoutedEachTime) {
  demux->on_p2p_event(PeersChanged{});
  demux->on_p2p_event(PeersChanged{});
  demux->on_p2p_event(ConnectionChanged{false});
  demux->on_p2p_event(ConnectionChanged{false});

  EXPECT_EQ(fake->count("request_peers"), 2u);
  EXPECT_EQ(connection_events.size(), 2u);
}

// ============================================================================
// Event Names
// ============================================================================

TEST(P2pEventNameTest, Names) {
  EXPECT_STREQ(p2p_event_name(P2pStateChanged{true}), "P2pStateChanged");
  EXPECT_STREQ(p2p_event_name(PeersChanged{}), "PeersChanged");
  EXPECT_STREQ(p2p_event_name(ConnectionChanged{false}), "ConnectionChanged");
  EXPECT_STREQ(p2p_event_name(ThisDeviceChanged{}), "ThisDeviceChanged");
}
