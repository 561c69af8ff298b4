// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigLoader.h
 * @brief JSON configuration loading
 *
 * Reads /config.json from LittleFS:
 *
 *   {
 *     "led":       {"count": 60, "gpio_pin": 6, "brightness": 128},
 *     "audio":     {"sample_rate": 16000, "chunk_size": 1280, "device_index": null},
 *     "wake_word": {"model_path": "model", "threshold": 0.5,
 *                   "cooldown_seconds": 3.0, "shared_cooldown": false},
 *     "api":       {"port": 80},
 *     "wifi":      {"ssid": "", "password": ""},
 *     "debug":     {"level": 2}
 *   }
 *
 * Missing sections and keys keep their defaults. Out-of-range values are
 * rejected with a warning and keep their defaults.
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>

#include "DeviceConfig.h"

namespace wakelight {
namespace config {

constexpr const char* CONFIG_FILE_PATH = "/config.json";
constexpr size_t MAX_CONFIG_FILE_SIZE = 4096;

struct ConfigLoadResult {
    bool success;           ///< false = parse failure, config holds defaults
    uint8_t rejectedKeys;   ///< Keys present but out of range
    DeviceConfig config;
    char errorMsg[64];

    ConfigLoadResult() : success(false), rejectedKeys(0), config(), errorMsg{} {}
};

class ConfigLoader {
public:
    /**
     * @brief Parse a JSON document into a DeviceConfig
     */
    static ConfigLoadResult parse(const char* json, size_t length);

    /**
     * @brief Apply a parsed document on top of defaults
     */
    static ConfigLoadResult fromJson(JsonObjectConst root);

#ifndef NATIVE_BUILD
    /**
     * @brief Load from LittleFS
     *
     * A missing file yields defaults with success=true.
     */
    static ConfigLoadResult loadFromFile(const char* path = CONFIG_FILE_PATH);
#endif
};

} // namespace config
} // namespace wakelight
