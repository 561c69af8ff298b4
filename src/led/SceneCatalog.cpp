// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "SceneCatalog.h"

#include <cstring>

namespace wakelight {
namespace led {

namespace {

void fillSolid(Color* out, uint16_t count, const Color& c) {
    for (uint16_t i = 0; i < count; i++) {
        out[i] = c;
    }
}

void renderOff(Color* out, uint16_t count)       { fillSolid(out, count, colors::OFF); }
void renderRed(Color* out, uint16_t count)       { fillSolid(out, count, colors::RED); }
void renderGreen(Color* out, uint16_t count)     { fillSolid(out, count, colors::GREEN); }
void renderBlue(Color* out, uint16_t count)      { fillSolid(out, count, colors::BLUE); }
void renderYellow(Color* out, uint16_t count)    { fillSolid(out, count, colors::YELLOW); }
void renderWhite(Color* out, uint16_t count)     { fillSolid(out, count, colors::WHITE); }
void renderWarmWhite(Color* out, uint16_t count) { fillSolid(out, count, colors::WARM_WHITE); }
void renderCoolWhite(Color* out, uint16_t count) { fillSolid(out, count, colors::COOL_WHITE); }

void renderRainbow(Color* out, uint16_t count) {
    for (uint16_t i = 0; i < count; i++) {
        out[i] = wheel(static_cast<uint8_t>((static_cast<uint32_t>(i) * 256) / count));
    }
}

// Lightbulb moment
void renderIdea(Color* out, uint16_t count) { fillSolid(out, count, colors::YELLOW); }

const SceneEntry SCENES[] = {
    {"off",        renderOff},
    {"all_red",    renderRed},
    {"all_green",  renderGreen},
    {"all_blue",   renderBlue},
    {"all_yellow", renderYellow},
    {"all_white",  renderWhite},
    {"warm_white", renderWarmWhite},
    {"cool_white", renderCoolWhite},
    {"rainbow",    renderRainbow},
    {"idea",       renderIdea},
};

constexpr uint8_t SCENE_COUNT = sizeof(SCENES) / sizeof(SCENES[0]);

} // namespace

const SceneEntry* SceneCatalog::find(const char* name) {
    if (name == nullptr) {
        return nullptr;
    }
    for (uint8_t i = 0; i < SCENE_COUNT; i++) {
        if (strcmp(SCENES[i].name, name) == 0) {
            return &SCENES[i];
        }
    }
    return nullptr;
}

uint8_t SceneCatalog::count() {
    return SCENE_COUNT;
}

const SceneEntry* SceneCatalog::at(uint8_t index) {
    return (index < SCENE_COUNT) ? &SCENES[index] : nullptr;
}

} // namespace led
} // namespace wakelight
