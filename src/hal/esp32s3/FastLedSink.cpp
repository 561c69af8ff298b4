// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#define WL_LOG_TAG "FastLedSink"
#include "FastLedSink.h"
#include "utils/Log.h"

#include <cstring>
#include <esp_timer.h>

namespace wakelight {
namespace hal {

FastLedSink::FastLedSink()
    : m_ledCount(0)
    , m_initialized(false)
{
    memset(m_leds, 0, sizeof(m_leds));
}

bool FastLedSink::init(const config::LedSettings& settings) {
    if (m_initialized) {
        return true;
    }
    if (settings.count == 0 || settings.count > kMaxLeds) {
        WL_LOGE("LED count out of range (%u, max %u)", settings.count, kMaxLeds);
        return false;
    }

    constexpr uint8_t kStripPin = led::LED_DATA_PIN;
    if (settings.gpioPin != kStripPin) {
        WL_LOGW("Strip pin override ignored (cfg=%u, hw=%u)", settings.gpioPin, kStripPin);
    }

    m_ledCount = settings.count;
    FastLED.addLeds<WS2812, kStripPin, GRB>(m_leds, m_ledCount);
    FastLED.setCorrection(TypicalLEDStrip);
    FastLED.setDither(1);
    FastLED.setMaxPowerInVoltsAndMilliamps(5, 3000);
    FastLED.setBrightness(settings.brightness);
    FastLED.clear(true);

    m_initialized = true;
    WL_LOGI("FastLED init: %u LEDs on GPIO %u", m_ledCount, kStripPin);
    return true;
}

void FastLedSink::setPixel(uint16_t index, uint32_t packedColor) {
    if (index < m_ledCount) {
        m_leds[index] = CRGB(packedColor);
    }
}

void FastLedSink::show() {
    if (!m_initialized) {
        return;
    }
    uint32_t start = static_cast<uint32_t>(esp_timer_get_time());
    FastLED.show();
    uint32_t end = static_cast<uint32_t>(esp_timer_get_time());
    updateShowStats(end - start);
}

void FastLedSink::setBrightness(uint8_t level) {
    FastLED.setBrightness(level);
}

void FastLedSink::updateShowStats(uint32_t showUs) {
    m_stats.frameCount++;
    m_stats.lastShowUs = showUs;
    if (showUs > m_stats.maxShowUs) {
        m_stats.maxShowUs = showUs;
    }
    if (m_stats.frameCount == 1) {
        m_stats.avgShowUs = showUs;
    } else {
        m_stats.avgShowUs = (m_stats.avgShowUs * 7 + showUs) / 8;
    }
}

} // namespace hal
} // namespace wakelight
