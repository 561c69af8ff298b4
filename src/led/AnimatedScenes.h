// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AnimatedScenes.h
 * @brief Traveling-wave scene definitions
 *
 * An animated scene cycles through @c colors over @c cycleDurationSec.
 * @c waveSpread is the fraction of the full color cycle visible across the
 * strip at once (0 = whole strip shows one color).
 */

#pragma once

#include <cstdint>

#include "Color.h"

namespace wakelight {
namespace led {

constexpr uint8_t MAX_ANIMATION_COLORS = 8;

struct AnimatedSceneSpec {
    const char* name;
    const Color* colors;
    uint8_t colorCount;
    float cycleDurationSec;
    float waveSpread;
    uint8_t framesPerSecond;

    bool isValid() const {
        return colors != nullptr && colorCount >= 1 && colorCount <= MAX_ANIMATION_COLORS &&
               cycleDurationSec > 0.0f && waveSpread >= 0.0f && framesPerSecond > 0;
    }
};

class AnimatedScenes {
public:
    static const AnimatedSceneSpec* find(const char* name);
    static uint8_t count();
    static const AnimatedSceneSpec* at(uint8_t index);
};

} // namespace led
} // namespace wakelight
