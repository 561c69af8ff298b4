// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HttpLedCodec.cpp
 * @brief HTTP LED codec implementation
 */

#include "HttpLedCodec.h"
#include "network/ApiErrors.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace wakelight {
namespace codec {

using network::ErrorCodes::INVALID_JSON;
using network::ErrorCodes::INVALID_VALUE;
using network::ErrorCodes::MISSING_FIELD;
using network::ErrorCodes::OUT_OF_RANGE;

// ============================================================================
// Decode Functions
// ============================================================================

bool HttpLedCodec::parseBody(const uint8_t* data, size_t len, JsonDocument& doc,
                             char* errorMsg, size_t errorMsgSize) {
    if (data == nullptr || len == 0) {
        snprintf(errorMsg, errorMsgSize, "JSON body required");
        return false;
    }

    DeserializationError err = deserializeJson(doc, data, len);
    if (err) {
        snprintf(errorMsg, errorMsgSize, "Invalid JSON: %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        snprintf(errorMsg, errorMsgSize, "Body must be a JSON object");
        return false;
    }
    return true;
}

HttpColorDecodeResult HttpLedCodec::decodeColor(JsonObjectConst root) {
    HttpColorDecodeResult result;

    if (root.isNull()) {
        result.errorCode = INVALID_JSON;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "JSON body required");
        return result;
    }

    // Hex form takes precedence
    if (!root["hex"].isNull()) {
        const char* hex = root["hex"].as<const char*>();
        if (hex == nullptr) {
            result.errorCode = INVALID_VALUE;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'hex' must be a string");
            return result;
        }
        if (!led::Color::fromHex(hex, result.request.color)) {
            result.errorCode = INVALID_VALUE;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid hex color '%.16s' (expected #RRGGBB)", hex);
            return result;
        }
        result.request.fromHex = true;
        result.success = true;
        return result;
    }

    static const char* const CHANNELS[] = {"r", "g", "b"};
    int32_t values[3] = {0, 0, 0};
    for (int i = 0; i < 3; i++) {
        JsonVariantConst v = root[CHANNELS[i]];
        if (v.isNull()) {
            result.errorCode = MISSING_FIELD;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field '%s' (or 'hex')", CHANNELS[i]);
            return result;
        }
        if (!v.is<int32_t>()) {
            result.errorCode = INVALID_VALUE;
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Field '%s' must be an integer", CHANNELS[i]);
            return result;
        }
        values[i] = v.as<int32_t>();
    }

    if (!led::Color::fromComponents(values[0], values[1], values[2], result.request.color)) {
        result.errorCode = OUT_OF_RANGE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "RGB values must be 0-255, got (%ld, %ld, %ld)",
                 (long)values[0], (long)values[1], (long)values[2]);
        return result;
    }

    result.success = true;
    return result;
}

HttpBrightnessDecodeResult HttpLedCodec::decodeBrightness(JsonObjectConst root) {
    HttpBrightnessDecodeResult result;

    if (root.isNull()) {
        result.errorCode = INVALID_JSON;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "JSON body required");
        return result;
    }
    if (root["brightness"].isNull()) {
        result.errorCode = MISSING_FIELD;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'brightness'");
        return result;
    }
    if (!root["brightness"].is<int32_t>()) {
        result.errorCode = INVALID_VALUE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Field 'brightness' must be an integer");
        return result;
    }

    int32_t brightness = root["brightness"].as<int32_t>();
    if (brightness < 0 || brightness > 255) {
        result.errorCode = OUT_OF_RANGE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Brightness must be 0-255, got %ld", (long)brightness);
        return result;
    }

    result.request.brightness = static_cast<uint8_t>(brightness);
    result.success = true;
    return result;
}

HttpLedIndexDecodeResult HttpLedCodec::decodeLedIndex(const char* text, uint16_t ledCount) {
    HttpLedIndexDecodeResult result;

    if (text == nullptr || *text == '\0') {
        result.errorCode = INVALID_VALUE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "LED index required");
        return result;
    }

    char* end = nullptr;
    errno = 0;
    long parsed = strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        result.errorCode = INVALID_VALUE;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "LED index '%.32s' is not an integer", text);
        return result;
    }
    if (errno == ERANGE || parsed < 0 || parsed >= static_cast<long>(ledCount)) {
        result.errorCode = OUT_OF_RANGE;
        if (ledCount == 0) {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "LED index %.32s out of range (strip is empty)", text);
        } else {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "LED index %.32s out of range (0-%u)",
                     text, static_cast<unsigned>(ledCount - 1));
        }
        return result;
    }

    result.index = static_cast<uint16_t>(parsed);
    result.success = true;
    return result;
}

// ============================================================================
// Encode Functions
// ============================================================================

void HttpLedCodec::encodeHealth(const HttpHealthData& data, JsonObject& obj) {
    obj["status"] = "ok";
    obj["service"] = "wakelight";
    obj["led_count"] = data.ledCount;
    obj["simulation_mode"] = data.simulationMode;
    obj["wake_word_running"] = data.wakeWordRunning;
    obj["uptime_ms"] = data.uptimeMs;
}

void HttpLedCodec::encodeLed(uint16_t index, const led::Color& color, JsonObject& obj) {
    char hex[led::Color::HEX_STRING_SIZE];
    color.toHex(hex, sizeof(hex));

    obj["index"] = index;
    obj["r"] = color.r;
    obj["g"] = color.g;
    obj["b"] = color.b;
    obj["hex"] = hex;
}

void HttpLedCodec::encodeState(const led::StripSnapshot& snapshot, JsonObject& obj) {
    obj["led_count"] = snapshot.ledCount;
    obj["brightness"] = snapshot.brightness;
    if (snapshot.activeSceneName != nullptr) {
        obj["current_scene"] = snapshot.activeSceneName;
    } else {
        obj["current_scene"] = nullptr;
    }
    obj["animation_active"] = snapshot.animationActive;

    JsonArray leds = obj["leds"].to<JsonArray>();
    for (size_t i = 0; i < snapshot.colors.size(); ++i) {
        JsonObject entry = leds.add<JsonObject>();
        encodeLed(static_cast<uint16_t>(i), snapshot.colors[i], entry);
    }
}

void HttpLedCodec::encodeSceneNames(const char* const* names, size_t count, JsonArray& arr) {
    for (size_t i = 0; i < count; ++i) {
        arr.add(names[i]);
    }
}

void HttpLedCodec::encodeSceneList(const HttpSceneListData& data, JsonObject& obj) {
    JsonArray scenes = obj["scenes"].to<JsonArray>();
    encodeSceneNames(data.names, data.count, scenes);
    if (data.currentScene != nullptr) {
        obj["current_scene"] = data.currentScene;
    } else {
        obj["current_scene"] = nullptr;
    }
    obj["animated"] = data.animated;
}

void HttpLedCodec::encodeSceneApplied(const char* name, bool animated, JsonObject& obj) {
    obj["scene"] = name;
    obj["animated"] = animated;
}

void HttpLedCodec::encodeBrightness(uint8_t brightness, JsonObject& obj) {
    obj["brightness"] = brightness;
}

void HttpLedCodec::encodeWakeStatus(const HttpWakeStatusData& data, JsonObject& obj) {
    obj["enabled"] = data.enabled;
    obj["state"] = data.state;
    obj["threshold"] = data.threshold;
    obj["cooldown_ms"] = data.cooldownMs;
    obj["shared_cooldown"] = data.sharedCooldown;

    JsonObject device = obj["device"].to<JsonObject>();
    device["index"] = data.deviceIndex;
    device["sample_rate"] = data.deviceRate;
    device["resampling"] = data.resampling;

    JsonObject stats = obj["stats"].to<JsonObject>();
    stats["chunks"] = data.chunksProcessed;
    stats["detections"] = data.detections;
    stats["suppressed"] = data.suppressed;
    stats["read_errors"] = data.readErrors;
    stats["predict_errors"] = data.predictErrors;
    stats["callback_failures"] = data.callbackFailures;
}

} // namespace codec
} // namespace wakelight
