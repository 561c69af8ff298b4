// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceConfig.h
 * @brief Immutable device configuration record
 *
 * Built once at boot (ConfigLoader) and handed by const reference to the
 * controller, the wake-word pipeline and the web server.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "led_config.h"
#include "audio_config.h"
#include "network_config.h"

namespace wakelight {
namespace config {

constexpr size_t MAX_MODEL_PATH = 64;

struct LedSettings {
    uint16_t count = led::DEFAULT_LED_COUNT;
    uint8_t gpioPin = led::LED_DATA_PIN;
    uint8_t brightness = led::DEFAULT_BRIGHTNESS;
};

struct AudioSettings {
    uint32_t sampleRate = audio::DEFAULT_SAMPLE_RATE;   ///< Rate the scorer expects
    uint32_t chunkSize = audio::DEFAULT_CHUNK_SIZE;     ///< Samples per chunk at sampleRate
    int32_t deviceIndex = audio::DEFAULT_DEVICE_INDEX;
};

struct WakeWordSettings {
    char modelPath[MAX_MODEL_PATH] = "model";
    float threshold = audio::DEFAULT_THRESHOLD;
    float cooldownSeconds = audio::DEFAULT_COOLDOWN_SECONDS;
    bool sharedCooldown = false;    ///< One timestamp for all models
};

struct ApiSettings {
    uint16_t port = network::DEFAULT_API_PORT;
};

struct WifiSettings {
    char ssid[network::MAX_SSID_LEN + 1] = "";
    char password[network::MAX_PASSWORD_LEN + 1] = "";

    bool hasCredentials() const { return ssid[0] != '\0'; }
};

struct DeviceConfig {
    LedSettings led;
    AudioSettings audio;
    WakeWordSettings wakeWord;
    ApiSettings api;
    WifiSettings wifi;
    uint8_t debugLevel = 2;
};

void logDeviceConfig(const DeviceConfig& cfg);

} // namespace config
} // namespace wakelight
