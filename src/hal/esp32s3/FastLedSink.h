// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FastLedSink.h
 * @brief ESP32-S3 strip output via FastLED (WS2812, GRB)
 */

#pragma once

#include <FastLED.h>
#include <cstdint>

#include "config/DeviceConfig.h"
#include "hal/interface/IHardwareSink.h"

namespace wakelight {
namespace hal {

struct SinkStats {
    uint32_t frameCount = 0;
    uint32_t lastShowUs = 0;
    uint32_t avgShowUs = 0;
    uint32_t maxShowUs = 0;
};

class FastLedSink : public IHardwareSink {
public:
    static constexpr uint16_t kMaxLeds = led::MAX_LED_COUNT;

    FastLedSink();

    /**
     * @brief Register the strip with FastLED
     * @return false if the LED count exceeds kMaxLeds
     */
    bool init(const config::LedSettings& settings);

    void setPixel(uint16_t index, uint32_t packedColor) override;
    void show() override;
    void setBrightness(uint8_t level) override;

    const SinkStats& getStats() const { return m_stats; }

private:
    void updateShowStats(uint32_t showUs);

    CRGB m_leds[kMaxLeds];
    uint16_t m_ledCount;
    bool m_initialized;
    SinkStats m_stats;
};

} // namespace hal
} // namespace wakelight
