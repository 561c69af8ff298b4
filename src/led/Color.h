// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Color.h
 * @brief RGB value type for the strip
 *
 * Components are always within 0-255. Construction from wider integers goes
 * through fromComponents(), which rejects out-of-range input instead of
 * wrapping or clamping.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace wakelight {
namespace led {

struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    constexpr Color() : r(0), g(0), b(0) {}
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    /// "#RRGGBB" plus terminator
    static constexpr size_t HEX_STRING_SIZE = 8;

    /**
     * @brief Validated construction
     * @return false (and @p out untouched) if any component is outside 0-255
     */
    static bool fromComponents(int32_t red, int32_t green, int32_t blue, Color& out);

    /**
     * @brief Parse "#RRGGBB" or "RRGGBB" (case-insensitive)
     * @return false (and @p out untouched) on any other input
     */
    static bool fromHex(const char* hex, Color& out);

    /**
     * @brief Linear blend, t clamped to [0,1], channels truncated toward zero
     */
    static Color lerp(const Color& from, const Color& to, float t);

    /**
     * @brief Write "#RRGGBB" (upper case)
     * @return Characters written (7), or 0 if @p size is too small
     */
    size_t toHex(char* out, size_t size) const;

    /// 0xRRGGBB, the format the hardware sink takes
    constexpr uint32_t packed() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    constexpr bool isOff() const { return r == 0 && g == 0 && b == 0; }

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    constexpr bool operator!=(const Color& other) const { return !(*this == other); }
};

/**
 * @brief Classic 0-255 color wheel (R->G->B->R)
 */
Color wheel(uint8_t pos);

namespace colors {
    constexpr Color OFF(0, 0, 0);
    constexpr Color RED(255, 0, 0);
    constexpr Color GREEN(0, 255, 0);
    constexpr Color BLUE(0, 0, 255);
    constexpr Color YELLOW(255, 255, 0);
    constexpr Color WHITE(255, 255, 255);
    constexpr Color WARM_WHITE(255, 244, 229);
    constexpr Color COOL_WHITE(255, 255, 255);
    constexpr Color DAYLIGHT(255, 250, 244);
    constexpr Color ORANGE(255, 165, 0);
    constexpr Color PURPLE(128, 0, 128);
    constexpr Color CYAN(0, 255, 255);
    constexpr Color MAGENTA(255, 0, 255);
} // namespace colors

} // namespace led
} // namespace wakelight
