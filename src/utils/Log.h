// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging for WakeLight
 *
 * Colored logging with automatic timestamps and component tags.
 *
 * Usage:
 *   #define WL_LOG_TAG "Strip"
 *   #include "utils/Log.h"
 *
 *   WL_LOGI("Initialized with %d LEDs", count);
 *   WL_LOGE("Failed: %s (code=%d)", msg, err);
 *
 * Output format:
 *   [12345][INFO][Strip] Initialized with 60 LEDs
 */

#pragma once

#include <cstdio>
#include <cstdint>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define WL_ANSI_RESET      "\033[0m"

#define WL_CLR_GREEN       "\033[1;32m"   // Scene changes
#define WL_CLR_YELLOW      "\033[1;33m"   // Wake detections, hardware diagnostics
#define WL_CLR_CYAN        "\033[1;36m"   // Audio
#define WL_CLR_RED         "\033[1;31m"   // Errors
#define WL_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define WL_CLR_GRAY        "\033[0;37m"   // Debug
#define WL_CLR_BLUE        "\033[1;34m"   // Network

#define WL_CLR_ERROR       WL_CLR_RED
#define WL_CLR_WARN        WL_CLR_MAGENTA
#define WL_CLR_INFO        WL_CLR_GREEN
#define WL_CLR_DEBUG       WL_CLR_GRAY
#define WL_CLR_VERBOSE     WL_CLR_GRAY
#define WL_CLR_TRACE       WL_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via build flags:
//   -D WL_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)

#ifndef WL_LOG_LEVEL
    #ifdef NDEBUG
        #define WL_LOG_LEVEL 2
    #else
        #define WL_LOG_LEVEL 3
    #endif
#endif

#define WL_LOG_LEVEL_NONE  0
#define WL_LOG_LEVEL_ERROR 1
#define WL_LOG_LEVEL_WARN  2
#define WL_LOG_LEVEL_INFO  3
#define WL_LOG_LEVEL_DEBUG 4

// ============================================================================
// Platform Detection
// ============================================================================

#ifdef ARDUINO
    #include <Arduino.h>
    #define WL_LOG_MILLIS()    millis()
    #define WL_LOG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
    #include <chrono>
    static inline uint32_t _wl_native_millis() {
        static const auto start = std::chrono::steady_clock::now();
        return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    }
    #define WL_LOG_MILLIS()    _wl_native_millis()
    #define WL_LOG_PRINTF(...) printf(__VA_ARGS__)
#endif

// ============================================================================
// Core Logging Macros
// ============================================================================

#ifndef WL_LOG_TAG
    #define WL_LOG_TAG "WL"
#endif

#define WL_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" WL_ANSI_RESET "[" WL_LOG_TAG "] " fmt "\n"

#if WL_LOG_LEVEL >= WL_LOG_LEVEL_ERROR
    #define WL_LOGE(fmt, ...) \
        WL_LOG_PRINTF(WL_LOG_FORMAT("ERROR", WL_CLR_ERROR, fmt), \
                      (unsigned long)WL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define WL_LOGE(fmt, ...) ((void)0)
#endif

#if WL_LOG_LEVEL >= WL_LOG_LEVEL_WARN
    #define WL_LOGW(fmt, ...) \
        WL_LOG_PRINTF(WL_LOG_FORMAT("WARN", WL_CLR_WARN, fmt), \
                      (unsigned long)WL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define WL_LOGW(fmt, ...) ((void)0)
#endif

#if WL_LOG_LEVEL >= WL_LOG_LEVEL_INFO
    #define WL_LOGI(fmt, ...) \
        WL_LOG_PRINTF(WL_LOG_FORMAT("INFO", WL_CLR_INFO, fmt), \
                      (unsigned long)WL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define WL_LOGI(fmt, ...) ((void)0)
#endif

#if WL_LOG_LEVEL >= WL_LOG_LEVEL_DEBUG
    #define WL_LOGD(fmt, ...) \
        WL_LOG_PRINTF(WL_LOG_FORMAT("DEBUG", WL_CLR_DEBUG, fmt), \
                      (unsigned long)WL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define WL_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Conditional Logging (Throttled)
// ============================================================================
// Usage:
//   static uint32_t lastLog = 0;
//   WL_LOG_THROTTLE(lastLog, 1000, WL_LOGW("Read timeout"));

#define WL_LOG_THROTTLE(last_var, interval_ms, log_statement) \
    do { \
        uint32_t _now = WL_LOG_MILLIS(); \
        if (_now - (last_var) >= (interval_ms)) { \
            (last_var) = _now; \
            log_statement; \
        } \
    } while(0)

#ifdef ARDUINO
    #define WL_HEAP_FREE() ESP.getFreeHeap()
#else
    #define WL_HEAP_FREE() 0UL
#endif

#define WL_LOGE_CTX(fmt, ...) \
    WL_LOGE(fmt " (heap=%lu, fn=%s)", ##__VA_ARGS__, (unsigned long)WL_HEAP_FREE(), __func__)

// ============================================================================
// Domain-Aware Logging Macros
// ============================================================================
// Checked against the runtime DebugConfig.
//
// Levels:
//   E = ERROR   (1)
//   W = WARN    (2)
//   I = INFO    (3)
//   D = VERBOSE (4)
//   T = TRACE   (5) - per-frame, per-chunk

#include "config/DebugConfig.h"

#define WL_DOMAIN_LOG(domain, level, fmt, ...) \
    do { \
        if (wakelight::config::getDebugConfig().shouldLog( \
                wakelight::config::DebugDomain::domain, \
                wakelight::config::DebugLevel::level)) { \
            WL_LOG_PRINTF(WL_LOG_FORMAT(#level, WL_CLR_##level, fmt), \
                          (unsigned long)WL_LOG_MILLIS(), ##__VA_ARGS__); \
        } \
    } while(0)

// LED domain: controller, scenes, animation, FastLED sink
#define WL_LED_LOGE(fmt, ...) WL_DOMAIN_LOG(LED, ERROR, fmt, ##__VA_ARGS__)
#define WL_LED_LOGW(fmt, ...) WL_DOMAIN_LOG(LED, WARN, fmt, ##__VA_ARGS__)
#define WL_LED_LOGI(fmt, ...) WL_DOMAIN_LOG(LED, INFO, fmt, ##__VA_ARGS__)
#define WL_LED_LOGD(fmt, ...) WL_DOMAIN_LOG(LED, VERBOSE, fmt, ##__VA_ARGS__)
#define WL_LED_LOGT(fmt, ...) WL_DOMAIN_LOG(LED, TRACE, fmt, ##__VA_ARGS__)

// Audio domain: I2S capture, resampling
#define WL_AUDIO_LOGE(fmt, ...) WL_DOMAIN_LOG(AUDIO, ERROR, fmt, ##__VA_ARGS__)
#define WL_AUDIO_LOGW(fmt, ...) WL_DOMAIN_LOG(AUDIO, WARN, fmt, ##__VA_ARGS__)
#define WL_AUDIO_LOGI(fmt, ...) WL_DOMAIN_LOG(AUDIO, INFO, fmt, ##__VA_ARGS__)
#define WL_AUDIO_LOGD(fmt, ...) WL_DOMAIN_LOG(AUDIO, VERBOSE, fmt, ##__VA_ARGS__)
#define WL_AUDIO_LOGT(fmt, ...) WL_DOMAIN_LOG(AUDIO, TRACE, fmt, ##__VA_ARGS__)

// Wake domain: scoring, gating, detection dispatch
#define WL_WAKE_LOGE(fmt, ...) WL_DOMAIN_LOG(WAKE, ERROR, fmt, ##__VA_ARGS__)
#define WL_WAKE_LOGW(fmt, ...) WL_DOMAIN_LOG(WAKE, WARN, fmt, ##__VA_ARGS__)
#define WL_WAKE_LOGI(fmt, ...) WL_DOMAIN_LOG(WAKE, INFO, fmt, ##__VA_ARGS__)
#define WL_WAKE_LOGD(fmt, ...) WL_DOMAIN_LOG(WAKE, VERBOSE, fmt, ##__VA_ARGS__)
#define WL_WAKE_LOGT(fmt, ...) WL_DOMAIN_LOG(WAKE, TRACE, fmt, ##__VA_ARGS__)

// Network domain: WiFi, REST API
#define WL_NET_LOGE(fmt, ...) WL_DOMAIN_LOG(NETWORK, ERROR, fmt, ##__VA_ARGS__)
#define WL_NET_LOGW(fmt, ...) WL_DOMAIN_LOG(NETWORK, WARN, fmt, ##__VA_ARGS__)
#define WL_NET_LOGI(fmt, ...) WL_DOMAIN_LOG(NETWORK, INFO, fmt, ##__VA_ARGS__)
#define WL_NET_LOGD(fmt, ...) WL_DOMAIN_LOG(NETWORK, VERBOSE, fmt, ##__VA_ARGS__)
#define WL_NET_LOGT(fmt, ...) WL_DOMAIN_LOG(NETWORK, TRACE, fmt, ##__VA_ARGS__)

// System domain: boot, config, tasks
#define WL_SYS_LOGE(fmt, ...) WL_DOMAIN_LOG(SYSTEM, ERROR, fmt, ##__VA_ARGS__)
#define WL_SYS_LOGW(fmt, ...) WL_DOMAIN_LOG(SYSTEM, WARN, fmt, ##__VA_ARGS__)
#define WL_SYS_LOGI(fmt, ...) WL_DOMAIN_LOG(SYSTEM, INFO, fmt, ##__VA_ARGS__)
#define WL_SYS_LOGD(fmt, ...) WL_DOMAIN_LOG(SYSTEM, VERBOSE, fmt, ##__VA_ARGS__)
#define WL_SYS_LOGT(fmt, ...) WL_DOMAIN_LOG(SYSTEM, TRACE, fmt, ##__VA_ARGS__)
