// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IHardwareSink.h
 * @brief Hardware abstraction interface for the LED strip output
 *
 * The controller pushes every state change through this interface while it
 * holds its state lock, so implementations see one writer at a time.
 *
 * Implementations:
 * - ESP32-S3: FastLedSink (FastLED WS2812)
 * - Tests: recording sink
 *
 * No sink at all means simulation mode.
 */

#pragma once

#include <cstdint>

namespace wakelight {
namespace hal {

class IHardwareSink {
public:
    virtual ~IHardwareSink() = default;

    /**
     * @brief Stage one pixel
     * @param index LED index (caller guarantees < LED count)
     * @param packedColor 0xRRGGBB
     */
    virtual void setPixel(uint16_t index, uint32_t packedColor) = 0;

    /**
     * @brief Flush staged pixels to the strip
     */
    virtual void show() = 0;

    /**
     * @brief Set global brightness register (0-255)
     */
    virtual void setBrightness(uint8_t level) = 0;
};

} // namespace hal
} // namespace wakelight
