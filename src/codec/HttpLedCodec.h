// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file HttpLedCodec.h
 * @brief JSON codec for the LED REST endpoints
 *
 * Only this module reads JSON keys from request bodies. Handlers consume the
 * typed request structs; responses are built by the encode functions into
 * the "data" object of the API envelope.
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "led/Color.h"
#include "led/StripState.h"

namespace wakelight {
namespace codec {

static constexpr size_t MAX_ERROR_MSG = 96;

// ============================================================================
// Decode Request Structs
// ============================================================================

struct HttpColorRequest {
    led::Color color;
    bool fromHex;

    HttpColorRequest() : color(), fromHex(false) {}
};

struct HttpColorDecodeResult {
    bool success;
    HttpColorRequest request;
    const char* errorCode;          ///< ErrorCodes value when !success
    char errorMsg[MAX_ERROR_MSG];

    HttpColorDecodeResult() : success(false), errorCode(nullptr) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct HttpBrightnessRequest {
    uint8_t brightness;

    HttpBrightnessRequest() : brightness(0) {}
};

struct HttpBrightnessDecodeResult {
    bool success;
    HttpBrightnessRequest request;
    const char* errorCode;
    char errorMsg[MAX_ERROR_MSG];

    HttpBrightnessDecodeResult() : success(false), errorCode(nullptr) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct HttpLedIndexDecodeResult {
    bool success;
    uint16_t index;
    const char* errorCode;
    char errorMsg[MAX_ERROR_MSG];

    HttpLedIndexDecodeResult() : success(false), index(0), errorCode(nullptr) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

// ============================================================================
// Encoder Input Structs
// ============================================================================

struct HttpHealthData {
    uint16_t ledCount;
    bool simulationMode;
    bool wakeWordRunning;
    uint32_t uptimeMs;

    HttpHealthData() : ledCount(0), simulationMode(true), wakeWordRunning(false), uptimeMs(0) {}
};

struct HttpSceneListData {
    const char* const* names;
    size_t count;
    const char* currentScene;       ///< nullptr encodes as JSON null
    bool animated;

    HttpSceneListData() : names(nullptr), count(0), currentScene(nullptr), animated(false) {}
};

struct HttpWakeStatusData {
    bool enabled;
    const char* state;
    float threshold;
    uint32_t cooldownMs;
    bool sharedCooldown;
    uint8_t deviceIndex;
    uint32_t deviceRate;
    bool resampling;
    uint32_t chunksProcessed;
    uint32_t detections;
    uint32_t suppressed;
    uint32_t readErrors;
    uint32_t predictErrors;
    uint32_t callbackFailures;

    HttpWakeStatusData()
        : enabled(false), state("stopped"), threshold(0.0f), cooldownMs(0), sharedCooldown(false),
          deviceIndex(0), deviceRate(0), resampling(false), chunksProcessed(0), detections(0),
          suppressed(0), readErrors(0), predictErrors(0), callbackFailures(0) {}
};

// ============================================================================
// HttpLedCodec
// ============================================================================

class HttpLedCodec {
public:
    /**
     * @brief Parse a raw request body into @p doc
     * @return false with @p errorMsg filled on empty or malformed JSON
     */
    static bool parseBody(const uint8_t* data, size_t len, JsonDocument& doc,
                          char* errorMsg, size_t errorMsgSize);

    /**
     * @brief {"r","g","b"} integers, or {"hex":"#RRGGBB"}
     *
     * hex wins when both are present. Components outside 0-255 are
     * OUT_OF_RANGE; anything else malformed is INVALID_VALUE / MISSING_FIELD.
     */
    static HttpColorDecodeResult decodeColor(JsonObjectConst root);

    static HttpBrightnessDecodeResult decodeBrightness(JsonObjectConst root);

    /**
     * @brief Path segment of /api/leds/<n> as an index below @p ledCount
     *
     * Non-numeric text is INVALID_VALUE; negative or too large is OUT_OF_RANGE.
     */
    static HttpLedIndexDecodeResult decodeLedIndex(const char* text, uint16_t ledCount);

    static void encodeHealth(const HttpHealthData& data, JsonObject& obj);
    static void encodeLed(uint16_t index, const led::Color& color, JsonObject& obj);
    static void encodeState(const led::StripSnapshot& snapshot, JsonObject& obj);
    static void encodeSceneList(const HttpSceneListData& data, JsonObject& obj);
    static void encodeSceneApplied(const char* name, bool animated, JsonObject& obj);
    static void encodeSceneNames(const char* const* names, size_t count, JsonArray& arr);
    static void encodeBrightness(uint8_t brightness, JsonObject& obj);
    static void encodeWakeStatus(const HttpWakeStatusData& data, JsonObject& obj);
};

} // namespace codec
} // namespace wakelight
