// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * WakeLight - Main Entry Point
 *
 * Addressable LED strip with an always-on wake word:
 * - StripController owns the strip state, scenes and animations (Core 1)
 * - WakeWordPipeline listens on the I2S microphone (Core 0)
 * - REST API on ESPAsyncWebServer
 *
 * A wake-word detection turns the whole strip yellow.
 */

#include <Arduino.h>
#include <LittleFS.h>

#define WL_LOG_TAG "Main"
#include "utils/Log.h"

#include "config/ConfigLoader.h"
#include "config/DebugConfig.h"
#include "config/DeviceConfig.h"
#include "config/features.h"
#include "config/version.h"
#include "led/StripController.h"

#if FEATURE_LED_OUTPUT
#include "hal/esp32s3/FastLedSink.h"
#endif

#if FEATURE_WAKE_WORD
#include "audio/WakeWordPipeline.h"
#include "hal/esp32s3/I2sAudioSource.h"
#include "hal/esp32s3/WakeNetScorer.h"
#endif

#if FEATURE_WEB_SERVER
#include "network/WebServer.h"
#endif

using namespace wakelight;

// ============================================================================
// Globals
// ============================================================================

static config::DeviceConfig g_config;
static led::StripController* g_strip = nullptr;

#if FEATURE_LED_OUTPUT
static hal::FastLedSink g_ledSink;
#endif

#if FEATURE_WAKE_WORD
static hal::I2sAudioSource g_audioSource;
static hal::WakeNetScorer g_scorer;
static audio::WakeWordPipeline* g_pipeline = nullptr;
#endif

#if FEATURE_WEB_SERVER
static network::WebServer* g_webServer = nullptr;
#endif

// ============================================================================
// Setup helpers
// ============================================================================

static void loadConfiguration()
{
#if FEATURE_CONFIG_FILE
    if (!LittleFS.begin(true)) {
        WL_LOGW("LittleFS mount failed, using defaults");
        return;
    }

    config::ConfigLoadResult loaded = config::ConfigLoader::loadFromFile();
    if (!loaded.success) {
        WL_LOGE("Config load failed: %s (using defaults)", loaded.errorMsg);
        return;
    }
    if (loaded.rejectedKeys > 0) {
        WL_LOGW("%u config value(s) rejected, defaults kept", loaded.rejectedKeys);
    }
    g_config = loaded.config;
#endif
}

static hal::IHardwareSink* initLedSink()
{
#if FEATURE_LED_OUTPUT
    if (g_ledSink.init(g_config.led)) {
        return &g_ledSink;
    }
    WL_LED_LOGW("LED hardware unavailable, running in simulation mode");
#endif
    return nullptr;
}

#if FEATURE_WAKE_WORD
static void startWakeWord()
{
    g_pipeline = new audio::WakeWordPipeline(g_config.audio, g_config.wakeWord,
                                             g_audioSource, g_scorer);

    g_pipeline->setCallback([](const audio::DetectionEvent& event) {
        WL_WAKE_LOGI("'%s' -> lights yellow", event.modelName);
        return g_strip->setAll(led::colors::YELLOW) == led::StripResult::OK;
    });

    if (!g_pipeline->start()) {
        WL_WAKE_LOGE("Wake word pipeline failed to start, continuing without it");
    }
}
#endif

static void printStatus()
{
    led::StripSnapshot state = g_strip->getState();
    Serial.printf("\n=== WakeLight %s ===\n", WAKELIGHT_VERSION_STRING);
    Serial.printf("LEDs: %u  brightness: %u  scene: %s%s  %s\n",
                  state.ledCount, state.brightness,
                  state.activeSceneName ? state.activeSceneName : "(manual)",
                  state.animationActive ? " (animated)" : "",
                  g_strip->isSimulated() ? "[simulated]" : "");
#if FEATURE_WAKE_WORD
    if (g_pipeline != nullptr) {
        audio::PipelineStats stats = g_pipeline->getStats();
        Serial.printf("Wake: %s  chunks=%lu detections=%lu suppressed=%lu readErr=%lu predictErr=%lu cbFail=%lu\n",
                      audio::pipelineStateName(g_pipeline->getState()),
                      (unsigned long)stats.chunksProcessed, (unsigned long)stats.detections,
                      (unsigned long)stats.suppressed, (unsigned long)stats.readErrors,
                      (unsigned long)stats.predictErrors, (unsigned long)stats.callbackFailures);
    }
#endif
    Serial.printf("Heap: %lu free\n", (unsigned long)ESP.getFreeHeap());
}

// ============================================================================
// Serial commands
// ============================================================================

static void handleSerialCommand(String& cmd)
{
    cmd.trim();
    if (cmd.length() == 0) {
        return;
    }

    if (cmd == "s" || cmd == "status") {
        printStatus();
    } else if (cmd == "off") {
        Serial.printf("off: %s\n", led::stripResultName(g_strip->clear()));
    } else if (cmd.startsWith("scene ")) {
        String name = cmd.substring(6);
        led::StripResult result = g_strip->applyScene(name.c_str());
        Serial.printf("scene %s: %s\n", name.c_str(), led::stripResultName(result));
    } else if (cmd.startsWith("bright ")) {
        led::StripResult result = g_strip->setBrightness(cmd.substring(7).toInt());
        Serial.printf("brightness: %s\n", led::stripResultName(result));
    } else if (cmd == "dbg" || cmd.startsWith("dbg ")) {
        if (cmd.length() > 4 &&
            !config::applyDebugCommand(config::getDebugConfig(), cmd.substring(4).c_str())) {
            Serial.println("dbg: invalid arguments");
        }
        config::printDebugConfig();
    } else if (cmd == "scenes") {
        for (uint8_t i = 0; i < led::StripController::getSceneCount(); i++) {
            Serial.printf("  %s\n", led::StripController::getSceneName(i));
        }
    } else {
        Serial.println("Commands: status | scenes | scene <name> | off | bright <0-255> | dbg [domain] <0-5>");
    }
}

// ============================================================================
// Arduino entry points
// ============================================================================

void setup()
{
    Serial.begin(115200);
    delay(1000);

    WL_LOGI("==========================================");
    WL_LOGI("WakeLight %s", WAKELIGHT_VERSION_STRING);
    WL_LOGI("==========================================");

    loadConfiguration();
    config::getDebugConfig().globalLevel = g_config.debugLevel;
    config::logDeviceConfig(g_config);

    g_strip = new led::StripController(g_config.led, initLedSink());
    if (g_strip->clear() != led::StripResult::OK) {
        WL_LED_LOGW("Initial clear failed");
    }
    WL_LED_LOGI("Strip ready: %u LEDs%s", g_strip->getLedCount(),
                g_strip->isSimulated() ? " (simulation)" : "");

#if FEATURE_WAKE_WORD
    startWakeWord();
#endif

#if FEATURE_WEB_SERVER
    audio::WakeWordPipeline* pipeline = nullptr;
#if FEATURE_WAKE_WORD
    pipeline = g_pipeline;
#endif
    g_webServer = new network::WebServer(*g_strip, pipeline, g_config);
    if (!g_webServer->begin()) {
        WL_NET_LOGE("REST API unavailable");
    }
#endif

    WL_LOGI("Setup complete. Type 'status' for state.");
}

void loop()
{
    static String s_command;
    static uint32_t s_lastStatus = 0;

    while (Serial.available()) {
        char c = static_cast<char>(Serial.read());
        if (c == '\n' || c == '\r') {
            handleSerialCommand(s_command);
            s_command = "";
        } else if (s_command.length() < 64) {
            s_command += c;
        }
    }

    uint32_t now = millis();
    if (now - s_lastStatus >= 30000) {
        s_lastStatus = now;
        if (config::getDebugConfig().globalLevel >= static_cast<uint8_t>(config::DebugLevel::VERBOSE)) {
            printStatus();
        }
    }

    delay(10);
}
