/**
 * @file test_config.cpp
 * @brief Unit tests for coordinator configuration
 */

#include <directlink/config.h>
#include <gtest/gtest.h>

using namespace directlink;

TEST(CoordinatorConfigTest, Defaults) {
  CoordinatorConfig config;

  EXPECT_TRUE(config.interface_name.empty());
  EXPECT_EQ(config.go_intent, 0);
  EXPECT_EQ(config.discovery_timeout.count(), 30);
  EXPECT_EQ(config.request_timeout.count(), 5000);
  EXPECT_EQ(config.connect_timeout.count(), 30000);
  EXPECT_TRUE(config.validate().is_ok());
}

TEST(CoordinatorConfigTest, LoadDefaultsResetsFields) {
  CoordinatorConfig config;
  config.interface_name = "wlp3s0";
  config.go_intent = 15;
  config.discovery_timeout = std::chrono::seconds(120);

  config.load_defaults();

  EXPECT_TRUE(config.interface_name.empty());
  EXPECT_EQ(config.go_intent, 0);
  EXPECT_EQ(config.discovery_timeout.count(), 30);
}

TEST(CoordinatorConfigTest, GoIntentRange) {
  CoordinatorConfig config;

  config.go_intent = MAX_GO_INTENT;
  EXPECT_TRUE(config.validate().is_ok());

  config.go_intent = MAX_GO_INTENT + 1;
  auto result = config.validate();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

  config.go_intent = -1;
  EXPECT_TRUE(config.validate().is_error());
}

TEST(CoordinatorConfigTest, NegativeTimeoutsRejected) {
  CoordinatorConfig config;
  config.request_timeout = std::chrono::milliseconds(-1);
  EXPECT_TRUE(config.validate().is_error());

  config.load_defaults();
  config.discovery_timeout = std::chrono::seconds(-5);
  EXPECT_TRUE(config.validate().is_error());

  // Zero lets the platform pick its own discovery timeout
  config.discovery_timeout = std::chrono::seconds(0);
  EXPECT_TRUE(config.validate().is_ok());
}

TEST(CoordinatorConfigTest, InterfaceNameLength) {
  CoordinatorConfig config;
  config.interface_name = "wlan0";
  EXPECT_TRUE(config.validate().is_ok());

  config.interface_name = std::string(16, 'w');
  auto result = config.validate();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}
