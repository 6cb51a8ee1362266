/**
 * @file test_types.cpp
 * @brief Unit tests for core types and error handling
 */

#include <directlink/error.h>
#include <directlink/types.h>
#include <gtest/gtest.h>

using namespace directlink;

// ============================================================================
// Failure Reasons
// ============================================================================

TEST(FailureReasonTest, KnownCodes) {
  EXPECT_EQ(failure_reason_string(0), "internal error");
  EXPECT_EQ(failure_reason_string(1), "P2P unsupported");
  EXPECT_EQ(failure_reason_string(2), "system busy");
}

TEST(FailureReasonTest, UnknownCodes) {
  EXPECT_EQ(failure_reason_string(3), "unknown error (3)");
  EXPECT_EQ(failure_reason_string(-1), "unknown error (-1)");
}

// ============================================================================
// Device Status
// ============================================================================

TEST(DeviceStatusTest, Names) {
  EXPECT_EQ(device_status_name(DeviceStatus::Connected), "connected");
  EXPECT_EQ(device_status_name(DeviceStatus::Invited), "invited");
  EXPECT_EQ(device_status_name(DeviceStatus::Failed), "failed");
  EXPECT_EQ(device_status_name(DeviceStatus::Available), "available");
  EXPECT_EQ(device_status_name(DeviceStatus::Unavailable), "unavailable");
  EXPECT_EQ(device_status_name(static_cast<DeviceStatus>(9)), "unknown (9)");
}

TEST(DeviceStatusTest, WireValues) {
  EXPECT_EQ(static_cast<int>(DeviceStatus::Connected), 0);
  EXPECT_EQ(static_cast<int>(DeviceStatus::Available), 3);
  EXPECT_EQ(static_cast<int>(DeviceStatus::Unavailable), 4);
}

TEST(PeerDeviceTest, Equality) {
  PeerDevice a;
  a.name = "PC-A";
  a.address = "02:00:00:00:00:0a";
  a.status = DeviceStatus::Available;

  PeerDevice b = a;
  EXPECT_EQ(a, b);

  b.status = DeviceStatus::Invited;
  EXPECT_NE(a, b);
}

TEST(PeerConfigTest, DefaultsToPushButton) {
  PeerConfig config;
  EXPECT_EQ(config.wps_method, WpsMethod::Pbc);
  EXPECT_EQ(config.go_intent, 0);
  EXPECT_STREQ(wps_method_name(config.wps_method), "pbc");
}

// ============================================================================
// Error
// ============================================================================

TEST(ErrorTest, DefaultIsSuccess) {
  Error err;
  EXPECT_TRUE(err.is_ok());
  EXPECT_FALSE(err.is_error());
}

TEST(ErrorTest, Rejected) {
  Error err = Error::rejected(2, "Find failed");
  EXPECT_TRUE(err.is_error());
  EXPECT_EQ(err.code, ErrorCode::RequestRejected);
  EXPECT_EQ(err.reason, 2);
  EXPECT_EQ(err.to_string(), "RequestRejected(2): Find failed");
}

TEST(ErrorTest, ToStringIncludesDetails) {
  Error err(ErrorCode::PlatformError, "D-Bus error",
            "fi.w1.wpa_supplicant1.UnknownError");
  EXPECT_EQ(err.to_string(),
            "PlatformError: D-Bus error (fi.w1.wpa_supplicant1.UnknownError)");
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::PlatformUnsupported),
               "PlatformUnsupported");
  EXPECT_STREQ(error_code_name(ErrorCode::AlreadyInitialized),
               "AlreadyInitialized");
  EXPECT_STRNE(error_code_description(ErrorCode::RequestRejected), "");
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, Value) {
  Result<int> result(42);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value(), 42);
  EXPECT_EQ(result.value_or(0), 42);
}

TEST(ResultTest, Error) {
  Result<int> result(ErrorCode::NotConnected, "no group");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NotConnected);
  EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, Void) {
  Result<void> ok = Result<void>::ok();
  EXPECT_TRUE(ok.is_ok());
  EXPECT_TRUE(static_cast<bool>(ok));

  Result<void> failed = Error::rejected(1);
  EXPECT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().reason, 1);
}
