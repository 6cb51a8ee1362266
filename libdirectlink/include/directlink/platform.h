/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for DirectLink
 *
 * DirectLink drives the WiFi Direct stack of the host. Only Linux
 * (wpa_supplicant) is supported.
 */

#ifndef DIRECTLINK_PLATFORM_H
#define DIRECTLINK_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define DIRECTLINK_PLATFORM_LINUX 1
#else
#error "Unsupported platform. DirectLink only supports Linux."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef DIRECTLINK_BUILDING_SHARED
#define DIRECTLINK_API __attribute__((visibility("default")))
#else
#define DIRECTLINK_API
#endif

#endif // DIRECTLINK_PLATFORM_H
