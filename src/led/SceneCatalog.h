// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SceneCatalog.h
 * @brief Static (non-animated) scenes
 *
 * Each scene is a pure function that fills exactly @c count colors. The
 * table is immutable, so lookups need no locking.
 */

#pragma once

#include <cstdint>

#include "Color.h"

namespace wakelight {
namespace led {

typedef void (*SceneRenderFn)(Color* out, uint16_t count);

struct SceneEntry {
    const char* name;
    SceneRenderFn render;
};

class SceneCatalog {
public:
    /**
     * @brief Look up a scene by exact name
     * @return Entry or nullptr
     */
    static const SceneEntry* find(const char* name);

    static uint8_t count();

    /// @return Entry or nullptr if @p index >= count()
    static const SceneEntry* at(uint8_t index);
};

} // namespace led
} // namespace wakelight
