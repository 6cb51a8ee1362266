/**
 * @file test_auto_connect_flow.cpp
 * @brief Integration test for the complete auto connect flow
 */

#include "fake_p2p_service.h"
#include <deque>
#include <directlink/directlink.h>
#include <gtest/gtest.h>
#include <mutex>

using namespace directlink;
using directlink::test::FakeP2pService;
using directlink::test::make_peer;

namespace {

/// Parks dispatched tasks; nothing here runs them
class TaskQueue {
public:
  Dispatcher dispatcher() {
    return [this](std::function<void()> task) {
      std::lock_guard<std::mutex> lock(mutex_);
      tasks_.push_back(std::move(task));
    };
  }

private:
  std::mutex mutex_;
  std::deque<std::function<void()>> tasks_;
};

} // namespace

class AutoConnectFlowTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto service = std::make_unique<FakeP2pService>();
    fake = service.get();
    coordinator = std::make_unique<ConnectionCoordinator>(std::move(service));

    coordinator->on_log(
        [this](const std::string &line) { logs.push_back(line); });
    coordinator->on_status_changed(
        [this](const std::string &status) { statuses.push_back(status); });
    coordinator->on_connection_changed(
        [this](bool connected, const std::optional<ConnectionInfo> &info) {
          connected_events.push_back(connected);
          last_info = info;
        });
  }

  void TearDown() override { coordinator.reset(); }

  FakeP2pService *fake = nullptr;
  std::unique_ptr<ConnectionCoordinator> coordinator;

  std::vector<std::string> logs;
  std::vector<std::string> statuses;
  std::vector<bool> connected_events;
  std::optional<ConnectionInfo> last_info;
};

// ============================================================================
// Full Flow
// ============================================================================

TEST_F(AutoConnectFlowTest, DiscoverConnectAndDisconnect) {
  ASSERT_TRUE(coordinator->initialize().is_ok());

  // Sticky state delivered on registration
  fake->emit(P2pStateChanged{true});
  fake->emit(ThisDeviceChanged{make_peer("Laptop", DeviceStatus::Available)});

  // 1. One-step auto connect starts discovery
  coordinator->auto_discover_and_connect();
  ASSERT_TRUE(fake->complete_discover());
  EXPECT_TRUE(coordinator->is_discovering());

  // 2. The platform finds nothing at first
  fake->emit(PeersChanged{});
  ASSERT_TRUE(fake->complete_peers({}));
  EXPECT_TRUE(coordinator->state().auto_connect_pending);

  // 3. A phone shows up next to a busy printer
  auto printer =
      make_peer("Printer", DeviceStatus::Unavailable, "02:00:00:00:00:01");
  auto phone = make_peer("Phone", DeviceStatus::Available, "02:00:00:00:00:02");
  fake->emit(PeersChanged{});
  ASSERT_TRUE(fake->complete_peers({printer, phone}));

  ASSERT_EQ(fake->connect_requests.size(), 1u);
  EXPECT_EQ(fake->connect_requests[0].device_address, phone.address);
  EXPECT_FALSE(coordinator->state().auto_connect_pending);

  // 4. The connect request is accepted; the peer is invited
  ASSERT_TRUE(fake->complete_connect());
  ASSERT_TRUE(coordinator->state().connected_device.has_value());
  EXPECT_EQ(coordinator->state().connected_device->name, "Phone");
  EXPECT_FALSE(coordinator->is_connected());

  // 5. The group forms
  fake->emit(ConnectionChanged{true});
  ConnectionInfo info;
  info.group_formed = true;
  info.is_group_owner = false;
  info.group_owner_address = "192.168.49.1";
  ASSERT_TRUE(fake->complete_connection_info(info));

  EXPECT_TRUE(coordinator->is_connected());
  EXPECT_EQ(statuses.back(), "Connected");
  ASSERT_EQ(connected_events.size(), 1u);
  EXPECT_TRUE(connected_events[0]);
  ASSERT_TRUE(last_info.has_value());
  EXPECT_EQ(last_info->group_owner_address, "192.168.49.1");

  // 6. The peer list refreshes after formation; no second connect
  fake->emit(PeersChanged{});
  phone.status = DeviceStatus::Connected;
  ASSERT_TRUE(fake->complete_peers({printer, phone}));
  EXPECT_EQ(fake->count("connect"), 1u);

  // 7. The user disconnects
  coordinator->disconnect();
  ASSERT_TRUE(fake->complete_remove_group());
  EXPECT_FALSE(coordinator->is_connected());
  EXPECT_FALSE(coordinator->state().connected_device.has_value());

  // 8. The platform confirms the group is gone
  fake->emit(ConnectionChanged{false});
  EXPECT_FALSE(coordinator->is_connected());
  ASSERT_EQ(connected_events.size(), 3u);
  EXPECT_FALSE(connected_events[1]);
  EXPECT_FALSE(connected_events[2]);

  coordinator->shutdown();
  EXPECT_EQ(fake->count("shutdown"), 1u);
}

TEST_F(AutoConnectFlowTest, ReconnectReplacesExistingGroup) {
  ASSERT_TRUE(coordinator->initialize().is_ok());

  fake->emit(ConnectionChanged{true});
  ConnectionInfo info;
  info.group_formed = true;
  info.is_group_owner = true;
  ASSERT_TRUE(fake->complete_connection_info(info));
  ASSERT_TRUE(coordinator->is_connected());

  coordinator->auto_discover_and_connect();
  ASSERT_TRUE(fake->complete_remove_group());
  ASSERT_TRUE(fake->complete_discover());
  EXPECT_FALSE(coordinator->is_connected());

  fake->emit(PeersChanged{});
  ASSERT_TRUE(fake->complete_peers(
      {make_peer("Tablet", DeviceStatus::Available, "02:00:00:00:00:03")}));

  ASSERT_EQ(fake->connect_requests.size(), 1u);
  EXPECT_EQ(fake->connect_requests[0].device_address, "02:00:00:00:00:03");
}

// ============================================================================
// Platform Service
// ============================================================================

TEST(PlatformServiceTest, InitializeDegradesWithoutWifiDirect) {
  TaskQueue queue;
  CoordinatorConfig config;
  config.interface_name = "dltest0";

  ConnectionCoordinator coordinator(
      create_platform_p2p_service(config, queue.dispatcher()), config);

  std::vector<std::string> lines;
  coordinator.on_log([&](const std::string &line) { lines.push_back(line); });

  auto result = coordinator.initialize();
  if (result.is_error()) {
    // No system bus, no wpa_supplicant or no P2P capable interface
    EXPECT_FALSE(coordinator.is_initialized());
    coordinator.discover_peers();
    EXPECT_FALSE(coordinator.is_discovering());
  } else {
    EXPECT_TRUE(coordinator.is_initialized());
  }

  coordinator.shutdown();
  EXPECT_FALSE(coordinator.is_initialized());
  EXPECT_FALSE(lines.empty());
}
