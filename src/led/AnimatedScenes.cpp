// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "AnimatedScenes.h"

#include <cstring>

namespace wakelight {
namespace led {

namespace {

// Soft blue -> blue violet -> hot pink -> medium orchid
const Color DREAMY_COLORS[] = {
    Color(70, 130, 230),
    Color(138, 43, 226),
    Color(255, 105, 180),
    Color(186, 85, 211),
};

const Color OCEAN_COLORS[] = {
    Color(0, 40, 120),
    Color(0, 105, 148),
    Color(64, 224, 208),
};

const AnimatedSceneSpec ANIMATED_SCENES[] = {
    {"dreamy", DREAMY_COLORS, 4, 12.0f, 0.5f, 30},
    {"ocean",  OCEAN_COLORS,  3, 8.0f,  0.35f, 30},
};

constexpr uint8_t ANIMATED_COUNT = sizeof(ANIMATED_SCENES) / sizeof(ANIMATED_SCENES[0]);

} // namespace

const AnimatedSceneSpec* AnimatedScenes::find(const char* name) {
    if (name == nullptr) {
        return nullptr;
    }
    for (uint8_t i = 0; i < ANIMATED_COUNT; i++) {
        if (strcmp(ANIMATED_SCENES[i].name, name) == 0) {
            return &ANIMATED_SCENES[i];
        }
    }
    return nullptr;
}

uint8_t AnimatedScenes::count() {
    return ANIMATED_COUNT;
}

const AnimatedSceneSpec* AnimatedScenes::at(uint8_t index) {
    return (index < ANIMATED_COUNT) ? &ANIMATED_SCENES[index] : nullptr;
}

} // namespace led
} // namespace wakelight
