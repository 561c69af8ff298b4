// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file network_config.h
 * @brief WiFi and REST API defaults
 */

#pragma once

#include <cstdint>

namespace wakelight {
namespace network {

constexpr uint16_t DEFAULT_API_PORT = 80;

constexpr const char* AP_SSID = "WakeLight-AP";
constexpr const char* AP_PASSWORD = "wakelight";
constexpr uint32_t WIFI_CONNECT_TIMEOUT_MS = 15000;

constexpr uint8_t MAX_SSID_LEN = 32;
constexpr uint8_t MAX_PASSWORD_LEN = 64;

} // namespace network
} // namespace wakelight
