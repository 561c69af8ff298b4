// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StripState.h
 * @brief Shared strip state and its read-only snapshot
 *
 * StripState is owned by StripController and only touched under its state
 * lock. Scene names point into the static scene tables, so they never dangle.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#include "Color.h"

namespace wakelight {
namespace led {

struct StripState {
    std::vector<Color> colors;
    uint8_t brightness = 0;
    const char* activeSceneName = nullptr;   ///< nullptr after a manual write
    bool animationActive = false;
};

/**
 * @brief Consistent copy of StripState taken under the state lock
 */
struct StripSnapshot {
    uint16_t ledCount = 0;
    uint8_t brightness = 0;
    const char* activeSceneName = nullptr;
    bool animationActive = false;
    std::vector<Color> colors;

    bool sameScene(const StripSnapshot& other) const {
        if (activeSceneName == nullptr || other.activeSceneName == nullptr) {
            return activeSceneName == other.activeSceneName;
        }
        return strcmp(activeSceneName, other.activeSceneName) == 0;
    }

    bool operator==(const StripSnapshot& other) const {
        return ledCount == other.ledCount && brightness == other.brightness &&
               animationActive == other.animationActive && sameScene(other) &&
               colors == other.colors;
    }
    bool operator!=(const StripSnapshot& other) const { return !(*this == other); }
};

} // namespace led
} // namespace wakelight
