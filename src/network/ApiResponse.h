// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ApiResponse.h
 * @brief Standardized REST response envelope
 *
 * Success: {"success": true, "data": {...}, "timestamp": ms, "version": "1.0"}
 * Error:   {"success": false, "error": {"code": "...", "message": "..."}, ...}
 */

#pragma once

#include <ArduinoJson.h>
#include <ESPAsyncWebServer.h>
#include <functional>

#include "ApiErrors.h"
#include "config/version.h"

namespace wakelight {
namespace network {

inline void sendJson(AsyncWebServerRequest* request, uint16_t httpCode, JsonDocument& response) {
    response["timestamp"] = millis();
    response["version"] = API_VERSION;

    String output;
    serializeJson(response, output);
    request->send(httpCode, "application/json", output);
}

/**
 * @brief Send a success response, @p builder fills "data"
 */
inline void sendSuccessResponse(AsyncWebServerRequest* request,
                                std::function<void(JsonObject&)> builder) {
    JsonDocument response;
    response["success"] = true;
    JsonObject data = response["data"].to<JsonObject>();
    builder(data);
    sendJson(request, HttpStatus::OK, response);
}

/**
 * @brief Send an error response
 * @param extra Optional builder for additional fields inside "error"
 */
inline void sendErrorResponse(AsyncWebServerRequest* request,
                              uint16_t httpCode,
                              const char* errorCode,
                              const char* message,
                              std::function<void(JsonObject&)> extra = nullptr) {
    JsonDocument response;
    response["success"] = false;

    JsonObject error = response["error"].to<JsonObject>();
    error["code"] = errorCode;
    error["message"] = message;
    if (extra) {
        extra(error);
    }
    sendJson(request, httpCode, response);
}

} // namespace network
} // namespace wakelight
