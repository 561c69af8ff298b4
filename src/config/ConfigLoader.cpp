// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConfigLoader.cpp
 * @brief JSON configuration loading implementation
 */

#define WL_LOG_TAG "Config"
#include "ConfigLoader.h"
#include "../utils/Log.h"

#include <cstdio>
#include <cstring>

#ifndef NATIVE_BUILD
#include <LittleFS.h>
#endif

namespace wakelight {
namespace config {

namespace {

bool readInt(JsonObjectConst section, const char* key, long minValue, long maxValue,
             long& out, uint8_t& rejected) {
    JsonVariantConst v = section[key];
    if (v.isNull()) {
        return false;
    }
    if (!v.is<long>()) {
        WL_SYS_LOGW("'%s' must be an integer, keeping default", key);
        rejected++;
        return false;
    }
    long value = v.as<long>();
    if (value < minValue || value > maxValue) {
        WL_SYS_LOGW("'%s' out of range (%ld-%ld): %ld, keeping default",
                    key, minValue, maxValue, value);
        rejected++;
        return false;
    }
    out = value;
    return true;
}

bool readFloat(JsonObjectConst section, const char* key, float minValue, float maxValue,
               float& out, uint8_t& rejected) {
    JsonVariantConst v = section[key];
    if (v.isNull()) {
        return false;
    }
    if (!v.is<float>()) {
        WL_SYS_LOGW("'%s' must be a number, keeping default", key);
        rejected++;
        return false;
    }
    float value = v.as<float>();
    if (value < minValue || value > maxValue) {
        WL_SYS_LOGW("'%s' out of range (%.2f-%.2f): %.2f, keeping default",
                    key, minValue, maxValue, value);
        rejected++;
        return false;
    }
    out = value;
    return true;
}

bool readString(JsonObjectConst section, const char* key, char* out, size_t outSize,
                uint8_t& rejected) {
    JsonVariantConst v = section[key];
    if (v.isNull()) {
        return false;
    }
    const char* value = v.as<const char*>();
    if (value == nullptr || strlen(value) >= outSize) {
        WL_SYS_LOGW("'%s' must be a string shorter than %u chars, keeping default",
                    key, (unsigned)outSize);
        rejected++;
        return false;
    }
    strncpy(out, value, outSize - 1);
    out[outSize - 1] = '\0';
    return true;
}

} // namespace

ConfigLoadResult ConfigLoader::fromJson(JsonObjectConst root) {
    ConfigLoadResult result;
    DeviceConfig& cfg = result.config;
    long iv = 0;

    JsonObjectConst ledSection = root["led"];
    if (!ledSection.isNull()) {
        if (readInt(ledSection, "count", 1, led::MAX_LED_COUNT, iv, result.rejectedKeys)) {
            cfg.led.count = static_cast<uint16_t>(iv);
        }
        if (readInt(ledSection, "gpio_pin", 0, 48, iv, result.rejectedKeys)) {
            cfg.led.gpioPin = static_cast<uint8_t>(iv);
        }
        if (readInt(ledSection, "brightness", 0, 255, iv, result.rejectedKeys)) {
            cfg.led.brightness = static_cast<uint8_t>(iv);
        }
    }

    JsonObjectConst audioSection = root["audio"];
    if (!audioSection.isNull()) {
        if (readInt(audioSection, "sample_rate", 1, 192000, iv, result.rejectedKeys)) {
            cfg.audio.sampleRate = static_cast<uint32_t>(iv);
        }
        if (readInt(audioSection, "chunk_size", 1, 16384, iv, result.rejectedKeys)) {
            cfg.audio.chunkSize = static_cast<uint32_t>(iv);
        }
        // null means auto select
        if (readInt(audioSection, "device_index", -1, 255, iv, result.rejectedKeys)) {
            cfg.audio.deviceIndex = static_cast<int32_t>(iv);
        }
    }

    JsonObjectConst wake = root["wake_word"];
    if (!wake.isNull()) {
        readString(wake, "model_path", cfg.wakeWord.modelPath,
                   sizeof(cfg.wakeWord.modelPath), result.rejectedKeys);
        readFloat(wake, "threshold", 0.0f, 1.0f, cfg.wakeWord.threshold, result.rejectedKeys);
        readFloat(wake, "cooldown_seconds", 0.0f, 3600.0f,
                  cfg.wakeWord.cooldownSeconds, result.rejectedKeys);
        if (wake["shared_cooldown"].is<bool>()) {
            cfg.wakeWord.sharedCooldown = wake["shared_cooldown"].as<bool>();
        }
    }

    JsonObjectConst api = root["api"];
    if (!api.isNull()) {
        if (readInt(api, "port", 1, 65535, iv, result.rejectedKeys)) {
            cfg.api.port = static_cast<uint16_t>(iv);
        }
    }

    JsonObjectConst wifi = root["wifi"];
    if (!wifi.isNull()) {
        readString(wifi, "ssid", cfg.wifi.ssid, sizeof(cfg.wifi.ssid), result.rejectedKeys);
        readString(wifi, "password", cfg.wifi.password, sizeof(cfg.wifi.password),
                   result.rejectedKeys);
    }

    JsonObjectConst debug = root["debug"];
    if (!debug.isNull()) {
        if (readInt(debug, "level", 0, 5, iv, result.rejectedKeys)) {
            cfg.debugLevel = static_cast<uint8_t>(iv);
        }
    }

    result.success = true;
    return result;
}

ConfigLoadResult ConfigLoader::parse(const char* json, size_t length) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json, length);
    if (err) {
        ConfigLoadResult result;
        snprintf(result.errorMsg, sizeof(result.errorMsg), "JSON parse error: %s", err.c_str());
        WL_LOGE("%s", result.errorMsg);
        return result;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        ConfigLoadResult result;
        snprintf(result.errorMsg, sizeof(result.errorMsg), "Root must be an object");
        WL_LOGE("%s", result.errorMsg);
        return result;
    }
    return fromJson(root);
}

#ifndef NATIVE_BUILD
ConfigLoadResult ConfigLoader::loadFromFile(const char* path) {
    if (!LittleFS.exists(path)) {
        WL_LOGI("%s not found, using defaults", path);
        ConfigLoadResult result;
        result.success = true;
        return result;
    }

    File file = LittleFS.open(path, "r");
    if (!file) {
        ConfigLoadResult result;
        snprintf(result.errorMsg, sizeof(result.errorMsg), "Failed to open %s", path);
        WL_LOGE("%s", result.errorMsg);
        return result;
    }

    size_t fileSize = file.size();
    if (fileSize > MAX_CONFIG_FILE_SIZE) {
        file.close();
        ConfigLoadResult result;
        snprintf(result.errorMsg, sizeof(result.errorMsg), "File too large (%u > %u)",
                 (unsigned)fileSize, (unsigned)MAX_CONFIG_FILE_SIZE);
        WL_LOGE("%s", result.errorMsg);
        return result;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, file);
    file.close();

    if (err) {
        ConfigLoadResult result;
        snprintf(result.errorMsg, sizeof(result.errorMsg), "JSON parse error: %s", err.c_str());
        WL_LOGE("%s", result.errorMsg);
        return result;
    }

    ConfigLoadResult result = fromJson(doc.as<JsonObjectConst>());
    if (result.rejectedKeys > 0) {
        WL_LOGW("%u config value(s) rejected", result.rejectedKeys);
    }
    return result;
}
#endif

} // namespace config
} // namespace wakelight
