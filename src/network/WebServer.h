// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WebServer.h
 * @brief REST API for the LED strip and wake-word status
 *
 * Endpoints:
 *   GET  /api/health
 *   GET  /api/leds             PUT /api/leds            (set all)
 *   GET  /api/leds/{i}         PUT /api/leds/{i}
 *   GET  /api/scenes           POST /api/scenes/{name}
 *   GET  /api/brightness       PUT /api/brightness
 *   GET  /api/wake
 *
 * Handlers run on the AsyncTCP task and call StripController directly; the
 * controller's own locking makes that safe. Bodies are decoded only through
 * HttpLedCodec.
 *
 * WiFi: STA with the configured credentials, AP mode when none are set or
 * the connection times out.
 */

#pragma once

#include "config/features.h"

#if FEATURE_WEB_SERVER

#include <cstdint>

#include "config/DeviceConfig.h"

class AsyncWebServer;
class AsyncWebServerRequest;

namespace wakelight {

namespace led {
    class StripController;
}
namespace audio {
    class WakeWordPipeline;
}

namespace network {

class WebServer {
public:
    /**
     * @param strip Controller to expose; must outlive the server
     * @param pipeline Wake-word pipeline for /api/wake, or nullptr when disabled
     */
    WebServer(led::StripController& strip,
              audio::WakeWordPipeline* pipeline,
              const config::DeviceConfig& config);
    ~WebServer();

    WebServer(const WebServer&) = delete;
    WebServer& operator=(const WebServer&) = delete;

    bool begin();
    void stop();

    bool isRunning() const { return m_running; }
    bool isAPMode() const { return m_apMode; }

private:
    bool initWiFi();
    void setupCORS();
    void setupRoutes();

    void handleHealth(AsyncWebServerRequest* request);
    void handleGetLeds(AsyncWebServerRequest* request);
    void handleSetAll(AsyncWebServerRequest* request, uint8_t* data, size_t len);
    void handleGetLed(AsyncWebServerRequest* request);
    void handleSetLed(AsyncWebServerRequest* request, uint8_t* data, size_t len);
    void handleListScenes(AsyncWebServerRequest* request);
    void handleApplyScene(AsyncWebServerRequest* request);
    void handleGetBrightness(AsyncWebServerRequest* request);
    void handleSetBrightness(AsyncWebServerRequest* request, uint8_t* data, size_t len);
    void handleWakeStatus(AsyncWebServerRequest* request);

    /// Parses the {i} path argument; sends 404 and returns false if invalid
    bool parseLedIndex(AsyncWebServerRequest* request, int32_t& index);

    led::StripController& m_strip;
    audio::WakeWordPipeline* m_pipeline;
    const config::DeviceConfig& m_config;

    AsyncWebServer* m_server;
    bool m_running;
    bool m_apMode;
    uint32_t m_startTime;
};

} // namespace network
} // namespace wakelight

#endif // FEATURE_WEB_SERVER
