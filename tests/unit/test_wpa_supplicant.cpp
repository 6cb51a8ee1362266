/**
 * @file test_wpa_supplicant.cpp
 * @brief Unit tests for the wpa_supplicant D-Bus helpers that need no bus
 */

#include "platform/linux/wpa_supplicant.h"
#include <gtest/gtest.h>

using namespace directlink;
using namespace directlink::platform;

TEST(WpaSupplicantTest, PeerObjectPath) {
  EXPECT_EQ(peer_object_path("/fi/w1/wpa_supplicant1/Interfaces/1",
                             "AA:bb:0C:dd:EE:01"),
            "/fi/w1/wpa_supplicant1/Interfaces/1/Peers/aabb0cddee01");
}

TEST(WpaSupplicantTest, FormatMacAddress) {
  EXPECT_EQ(format_mac_address({0x02, 0x00, 0xab, 0xcd, 0xef, 0x01}),
            "02:00:ab:cd:ef:01");
  EXPECT_EQ(format_mac_address({}), "");
}

TEST(WpaSupplicantTest, FormatDeviceType) {
  // Computer / PC, WFA OUI
  EXPECT_EQ(format_device_type({0x00, 0x01, 0x00, 0x50, 0xF2, 0x04, 0x00,
                                0x01}),
            "1-0050F204-1");
  // Telephone / smartphone
  EXPECT_EQ(format_device_type({0x00, 0x0A, 0x00, 0x50, 0xF2, 0x04, 0x00,
                                0x05}),
            "10-0050F204-5");
  EXPECT_EQ(format_device_type({0x00, 0x01}), "");
}

TEST(WpaSupplicantTest, FailureReasonFromDbus) {
  EXPECT_EQ(failure_reason_from_dbus("org.freedesktop.DBus.Error.ServiceUnknown"),
            static_cast<int>(FailureReason::P2pUnsupported));
  EXPECT_EQ(failure_reason_from_dbus("org.freedesktop.DBus.Error.UnknownMethod"),
            static_cast<int>(FailureReason::P2pUnsupported));
  EXPECT_EQ(failure_reason_from_dbus("fi.w1.wpa_supplicant1.NotSupported"),
            static_cast<int>(FailureReason::P2pUnsupported));

  EXPECT_EQ(failure_reason_from_dbus("fi.w1.wpa_supplicant1.DeviceBusy"),
            static_cast<int>(FailureReason::Busy));
  EXPECT_EQ(failure_reason_from_dbus("fi.w1.wpa_supplicant1.InProgress"),
            static_cast<int>(FailureReason::Busy));

  EXPECT_EQ(failure_reason_from_dbus("fi.w1.wpa_supplicant1.UnknownError"),
            static_cast<int>(FailureReason::Error));
  EXPECT_EQ(failure_reason_from_dbus(""),
            static_cast<int>(FailureReason::Error));
}

TEST(WpaSupplicantTest, GroupFormed) {
  P2PGroup group;
  EXPECT_FALSE(group.formed());

  group.object_path = "/fi/w1/wpa_supplicant1/Interfaces/2/Groups/1";
  EXPECT_TRUE(group.formed());
}

TEST(WpaSupplicantTest, NoAddressForMissingInterface) {
  auto result = get_p2p_ip_address("directlink-none0");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NotConnected);
}
