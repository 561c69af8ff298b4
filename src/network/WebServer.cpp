// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WebServer.cpp
 * @brief REST API implementation
 */

#define WL_LOG_TAG "WebServer"
#include "WebServer.h"

#if FEATURE_WEB_SERVER

#include <ESPAsyncWebServer.h>
#include <WiFi.h>

#include <vector>

#include "ApiResponse.h"
#include "codec/HttpLedCodec.h"
#include "config/network_config.h"
#include "led/StripController.h"
#include "utils/Log.h"

#if FEATURE_WAKE_WORD
#include "audio/WakeWordPipeline.h"
#endif

namespace wakelight {
namespace network {

using codec::HttpLedCodec;

namespace {

std::vector<const char*> collectSceneNames() {
    const uint8_t count = led::StripController::getSceneCount();
    std::vector<const char*> names;
    names.reserve(count);
    for (uint8_t i = 0; i < count; i++) {
        names.push_back(led::StripController::getSceneName(i));
    }
    return names;
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

WebServer::WebServer(led::StripController& strip,
                     audio::WakeWordPipeline* pipeline,
                     const config::DeviceConfig& config)
    : m_strip(strip)
    , m_pipeline(pipeline)
    , m_config(config)
    , m_server(nullptr)
    , m_running(false)
    , m_apMode(false)
    , m_startTime(0)
{
}

WebServer::~WebServer()
{
    stop();
    delete m_server;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool WebServer::begin()
{
    if (m_running) {
        return true;
    }

    WL_NET_LOGI("Starting WebServer...");

    if (!initWiFi()) {
        WL_NET_LOGE("WiFi unavailable, REST API not started");
        return false;
    }

    // Routes are registered once; a restart after stop() reuses them
    if (m_server == nullptr) {
        m_server = new AsyncWebServer(m_config.api.port);
        setupCORS();
        setupRoutes();
    }

    m_startTime = millis();
    m_server->begin();
    m_running = true;

    IPAddress ip = m_apMode ? WiFi.softAPIP() : WiFi.localIP();
    WL_NET_LOGI("Server running on http://%s:%u%s", ip.toString().c_str(),
                m_config.api.port, m_apMode ? " (AP mode)" : "");
    return true;
}

void WebServer::stop()
{
    if (!m_running) {
        return;
    }
    m_server->end();
    m_running = false;
    WL_NET_LOGI("Server stopped");
}

bool WebServer::initWiFi()
{
    if (m_config.wifi.hasCredentials()) {
        WL_NET_LOGI("Connecting to '%s'...", m_config.wifi.ssid);
        WiFi.mode(WIFI_STA);
        WiFi.begin(m_config.wifi.ssid, m_config.wifi.password);

        uint32_t started = millis();
        while (WiFi.status() != WL_CONNECTED && millis() - started < WIFI_CONNECT_TIMEOUT_MS) {
            delay(250);
        }
        if (WiFi.status() == WL_CONNECTED) {
            m_apMode = false;
            return true;
        }
        WL_NET_LOGW("Connection to '%s' timed out after %lu ms, falling back to AP",
                    m_config.wifi.ssid, (unsigned long)WIFI_CONNECT_TIMEOUT_MS);
        WiFi.disconnect(true);
    }

    WiFi.mode(WIFI_AP);
    if (!WiFi.softAP(AP_SSID, AP_PASSWORD)) {
        WL_NET_LOGE("softAP('%s') failed", AP_SSID);
        return false;
    }
    m_apMode = true;
    WL_NET_LOGI("AP '%s' up", AP_SSID);
    return true;
}

void WebServer::setupCORS()
{
    DefaultHeaders::Instance().addHeader("Access-Control-Allow-Origin", "*");
    DefaultHeaders::Instance().addHeader("Access-Control-Allow-Methods",
                                         "GET, POST, PUT, OPTIONS");
    DefaultHeaders::Instance().addHeader("Access-Control-Allow-Headers", "Content-Type");
}

// ============================================================================
// Routes
// ============================================================================

void WebServer::setupRoutes()
{
    m_server->on("/api/health", HTTP_GET, [this](AsyncWebServerRequest* request) {
        handleHealth(request);
    });

    m_server->on("/api/leds", HTTP_GET, [this](AsyncWebServerRequest* request) {
        handleGetLeds(request);
    });

    m_server->on("/api/leds", HTTP_PUT,
        [](AsyncWebServerRequest* request) {},
        nullptr,
        [this](AsyncWebServerRequest* request, uint8_t* data, size_t len, size_t, size_t) {
            handleSetAll(request, data, len);
        }
    );

    m_server->on("^\\/api\\/leds\\/([0-9]+)$", HTTP_GET, [this](AsyncWebServerRequest* request) {
        handleGetLed(request);
    });

    m_server->on("^\\/api\\/leds\\/([0-9]+)$", HTTP_PUT,
        [](AsyncWebServerRequest* request) {},
        nullptr,
        [this](AsyncWebServerRequest* request, uint8_t* data, size_t len, size_t, size_t) {
            handleSetLed(request, data, len);
        }
    );

    m_server->on("/api/scenes", HTTP_GET, [this](AsyncWebServerRequest* request) {
        handleListScenes(request);
    });

    m_server->on("^\\/api\\/scenes\\/([A-Za-z0-9_]+)$", HTTP_POST, [this](AsyncWebServerRequest* request) {
        handleApplyScene(request);
    });

    m_server->on("/api/brightness", HTTP_GET, [this](AsyncWebServerRequest* request) {
        handleGetBrightness(request);
    });

    m_server->on("/api/brightness", HTTP_PUT,
        [](AsyncWebServerRequest* request) {},
        nullptr,
        [this](AsyncWebServerRequest* request, uint8_t* data, size_t len, size_t, size_t) {
            handleSetBrightness(request, data, len);
        }
    );

    m_server->on("/api/wake", HTTP_GET, [this](AsyncWebServerRequest* request) {
        handleWakeStatus(request);
    });

    m_server->onNotFound([](AsyncWebServerRequest* request) {
        if (request->method() == HTTP_OPTIONS) {
            request->send(204);
            return;
        }
        sendErrorResponse(request, HttpStatus::NOT_FOUND, ErrorCodes::NOT_FOUND, "Endpoint not found");
    });
}

// ============================================================================
// Handlers
// ============================================================================

void WebServer::handleHealth(AsyncWebServerRequest* request)
{
    codec::HttpHealthData data;
    data.ledCount = m_strip.getLedCount();
    data.simulationMode = m_strip.isSimulated();
#if FEATURE_WAKE_WORD
    data.wakeWordRunning = (m_pipeline != nullptr) && m_pipeline->isRunning();
#endif
    data.uptimeMs = millis() - m_startTime;

    sendSuccessResponse(request, [&data](JsonObject& obj) {
        HttpLedCodec::encodeHealth(data, obj);
    });
}

void WebServer::handleGetLeds(AsyncWebServerRequest* request)
{
    led::StripSnapshot snapshot = m_strip.getState();
    sendSuccessResponse(request, [&snapshot](JsonObject& obj) {
        HttpLedCodec::encodeState(snapshot, obj);
    });
}

void WebServer::handleSetAll(AsyncWebServerRequest* request, uint8_t* data, size_t len)
{
    JsonDocument doc;
    char parseError[codec::MAX_ERROR_MSG];
    if (!HttpLedCodec::parseBody(data, len, doc, parseError, sizeof(parseError))) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, ErrorCodes::INVALID_JSON, parseError);
        return;
    }

    codec::HttpColorDecodeResult decoded = HttpLedCodec::decodeColor(doc.as<JsonObjectConst>());
    if (!decoded.success) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, decoded.errorCode, decoded.errorMsg);
        return;
    }

    const led::Color color = decoded.request.color;
    led::StripResult result = m_strip.setAll(color);
    if (result != led::StripResult::OK) {
        sendErrorResponse(request, HttpStatus::INTERNAL_ERROR, ErrorCodes::OPERATION_FAILED,
                          led::stripResultName(result));
        return;
    }
    WL_NET_LOGD("PUT /api/leds -> (%u,%u,%u)", color.r, color.g, color.b);

    sendSuccessResponse(request, [&color](JsonObject& obj) {
        obj["r"] = color.r;
        obj["g"] = color.g;
        obj["b"] = color.b;
        obj["message"] = "All LEDs updated";
    });
}

bool WebServer::parseLedIndex(AsyncWebServerRequest* request, int32_t& index)
{
    const String& arg = request->pathArg(0);
    codec::HttpLedIndexDecodeResult decoded =
        HttpLedCodec::decodeLedIndex(arg.c_str(), m_strip.getLedCount());
    if (!decoded.success) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, decoded.errorCode, decoded.errorMsg);
        return false;
    }
    index = decoded.index;
    return true;
}

void WebServer::handleGetLed(AsyncWebServerRequest* request)
{
    int32_t index = 0;
    if (!parseLedIndex(request, index)) {
        return;
    }

    led::Color color;
    if (m_strip.getPixel(index, color) != led::StripResult::OK) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, ErrorCodes::OUT_OF_RANGE, "LED index out of range");
        return;
    }

    sendSuccessResponse(request, [index, &color](JsonObject& obj) {
        HttpLedCodec::encodeLed(static_cast<uint16_t>(index), color, obj);
    });
}

void WebServer::handleSetLed(AsyncWebServerRequest* request, uint8_t* data, size_t len)
{
    int32_t index = 0;
    if (!parseLedIndex(request, index)) {
        return;
    }

    JsonDocument doc;
    char parseError[codec::MAX_ERROR_MSG];
    if (!HttpLedCodec::parseBody(data, len, doc, parseError, sizeof(parseError))) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, ErrorCodes::INVALID_JSON, parseError);
        return;
    }

    codec::HttpColorDecodeResult decoded = HttpLedCodec::decodeColor(doc.as<JsonObjectConst>());
    if (!decoded.success) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, decoded.errorCode, decoded.errorMsg);
        return;
    }

    const led::Color color = decoded.request.color;
    led::StripResult result = m_strip.setPixel(index, color);
    if (result != led::StripResult::OK) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, ErrorCodes::OUT_OF_RANGE,
                          led::stripResultName(result));
        return;
    }

    sendSuccessResponse(request, [index, &color](JsonObject& obj) {
        HttpLedCodec::encodeLed(static_cast<uint16_t>(index), color, obj);
    });
}

void WebServer::handleListScenes(AsyncWebServerRequest* request)
{
    std::vector<const char*> names = collectSceneNames();
    led::StripSnapshot snapshot = m_strip.getState();

    codec::HttpSceneListData data;
    data.names = names.data();
    data.count = names.size();
    data.currentScene = snapshot.activeSceneName;
    data.animated = snapshot.animationActive;

    sendSuccessResponse(request, [&data](JsonObject& obj) {
        HttpLedCodec::encodeSceneList(data, obj);
    });
}

void WebServer::handleApplyScene(AsyncWebServerRequest* request)
{
    const String& name = request->pathArg(0);
    led::StripResult result = m_strip.applyScene(name.c_str());

    if (result == led::StripResult::NOT_FOUND) {
        char msg[codec::MAX_ERROR_MSG];
        snprintf(msg, sizeof(msg), "Scene '%s' not found", name.c_str());
        sendErrorResponse(request, HttpStatus::NOT_FOUND, ErrorCodes::NOT_FOUND, msg,
            [](JsonObject& error) {
                std::vector<const char*> names = collectSceneNames();
                JsonArray available = error["available_scenes"].to<JsonArray>();
                HttpLedCodec::encodeSceneNames(names.data(), names.size(), available);
            });
        return;
    }
    if (result != led::StripResult::OK) {
        sendErrorResponse(request, HttpStatus::SERVICE_UNAVAILABLE, ErrorCodes::OPERATION_FAILED,
                          "Animation could not be started");
        return;
    }

    const bool animated = m_strip.isAnimationRunning();
    WL_NET_LOGI("Scene '%s' activated%s", name.c_str(), animated ? " (animated)" : "");
    sendSuccessResponse(request, [&name, animated](JsonObject& obj) {
        HttpLedCodec::encodeSceneApplied(name.c_str(), animated, obj);
    });
}

void WebServer::handleGetBrightness(AsyncWebServerRequest* request)
{
    const uint8_t brightness = m_strip.getBrightness();
    sendSuccessResponse(request, [brightness](JsonObject& obj) {
        HttpLedCodec::encodeBrightness(brightness, obj);
    });
}

void WebServer::handleSetBrightness(AsyncWebServerRequest* request, uint8_t* data, size_t len)
{
    JsonDocument doc;
    char parseError[codec::MAX_ERROR_MSG];
    if (!HttpLedCodec::parseBody(data, len, doc, parseError, sizeof(parseError))) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, ErrorCodes::INVALID_JSON, parseError);
        return;
    }

    codec::HttpBrightnessDecodeResult decoded = HttpLedCodec::decodeBrightness(doc.as<JsonObjectConst>());
    if (!decoded.success) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, decoded.errorCode, decoded.errorMsg);
        return;
    }

    const uint8_t brightness = decoded.request.brightness;
    if (m_strip.setBrightness(brightness) != led::StripResult::OK) {
        sendErrorResponse(request, HttpStatus::BAD_REQUEST, ErrorCodes::OUT_OF_RANGE,
                          "Brightness must be 0-255");
        return;
    }

    sendSuccessResponse(request, [brightness](JsonObject& obj) {
        HttpLedCodec::encodeBrightness(brightness, obj);
    });
}

void WebServer::handleWakeStatus(AsyncWebServerRequest* request)
{
    codec::HttpWakeStatusData data;
    data.sharedCooldown = m_config.wakeWord.sharedCooldown;
    data.threshold = m_config.wakeWord.threshold;
    data.cooldownMs = static_cast<uint32_t>(m_config.wakeWord.cooldownSeconds * 1000.0f + 0.5f);

#if FEATURE_WAKE_WORD
    if (m_pipeline != nullptr) {
        audio::PipelineStats stats = m_pipeline->getStats();
        data.enabled = true;
        data.state = audio::pipelineStateName(m_pipeline->getState());
        data.threshold = m_pipeline->getThreshold();
        data.cooldownMs = m_pipeline->getCooldownMs();
        data.deviceIndex = m_pipeline->getDeviceIndex();
        data.deviceRate = m_pipeline->getDeviceRate();
        data.resampling = m_pipeline->isResampling();
        data.chunksProcessed = stats.chunksProcessed;
        data.detections = stats.detections;
        data.suppressed = stats.suppressed;
        data.readErrors = stats.readErrors;
        data.predictErrors = stats.predictErrors;
        data.callbackFailures = stats.callbackFailures;
    }
#endif

    sendSuccessResponse(request, [&data](JsonObject& obj) {
        HttpLedCodec::encodeWakeStatus(data, obj);
    });
}

} // namespace network
} // namespace wakelight

#endif // FEATURE_WEB_SERVER
