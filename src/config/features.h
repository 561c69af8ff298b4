// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file features.h
 * @brief Compile-time feature flags for WakeLight
 *
 * Flags can be overridden via build flags (-D FEATURE_X=0).
 */

#pragma once

// ============================================================================
// Core Features
// ============================================================================

// FastLED strip output (0 = controller always runs in simulation mode)
#ifndef FEATURE_LED_OUTPUT
#define FEATURE_LED_OUTPUT 1
#endif

// Wake-word pipeline (I2S microphone + esp-sr WakeNet)
#ifndef FEATURE_WAKE_WORD
#define FEATURE_WAKE_WORD 1
#endif

// ============================================================================
// Network Features
// ============================================================================

// REST API over ESPAsyncWebServer
#ifndef FEATURE_WEB_SERVER
#define FEATURE_WEB_SERVER 1
#endif

// /config.json on LittleFS (0 = compile-time defaults only)
#ifndef FEATURE_CONFIG_FILE
#define FEATURE_CONFIG_FILE 1
#endif

// Native builds have no hardware
#ifdef NATIVE_BUILD
#undef FEATURE_LED_OUTPUT
#define FEATURE_LED_OUTPUT 0
#undef FEATURE_WEB_SERVER
#define FEATURE_WEB_SERVER 0
#endif
