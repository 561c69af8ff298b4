// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file led_config.h
 * @brief LED strip defaults
 */

#pragma once

#include <cstdint>

namespace wakelight {
namespace led {

constexpr uint16_t DEFAULT_LED_COUNT = 60;
constexpr uint16_t MAX_LED_COUNT = 1024;
constexpr uint8_t DEFAULT_BRIGHTNESS = 128;

// FastLED needs the data pin as a template argument. A different
// "led.gpio_pin" in /config.json is reported but not applied.
constexpr uint8_t LED_DATA_PIN = 6;

// Animation task
constexpr uint32_t ANIMATION_TASK_STACK = 4096;
constexpr uint8_t ANIMATION_TASK_PRIORITY = 3;
constexpr int8_t ANIMATION_TASK_CORE = 1;
constexpr uint32_t ANIMATION_STOP_TIMEOUT_MS = 1000;

} // namespace led
} // namespace wakelight
