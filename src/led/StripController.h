// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StripController.h
 * @brief Sole owner of the strip state and the hardware sink
 *
 * Manual commands (setPixel, setAll, static scenes) stop any running
 * animation before writing. The animation task writes through a private
 * frame path that neither stops the animation nor clears the scene name.
 *
 * Locking:
 *   m_commandLock - serializes public commands, including engine start/stop.
 *                   Never taken by the animation task.
 *   m_stateLock   - guards StripState and every push to the sink. Held for
 *                   one full write (never per pixel of a multi-pixel update).
 * Order is always command -> state. The engine is never stopped while the
 * state lock is held, so a frame write in progress can always finish.
 */

#pragma once

#include <cstdint>

#ifdef NATIVE_BUILD
#include "mocks/freertos_mock.h"
#else
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#endif

#include "AnimationEngine.h"
#include "Color.h"
#include "StripState.h"
#include "config/DeviceConfig.h"
#include "hal/interface/IHardwareSink.h"

namespace wakelight {
namespace led {

enum class StripResult : uint8_t {
    OK = 0,
    OUT_OF_RANGE,       ///< Index or brightness outside valid bounds, nothing changed
    NOT_FOUND,          ///< Unknown scene name, nothing changed
    UNAVAILABLE         ///< Animation task could not be started or the previous one has not exited
};

const char* stripResultName(StripResult result);

class StripController : private IAnimationTarget {
public:
    /**
     * @param settings LED count and initial brightness
     * @param sink Hardware output, or nullptr for simulation mode. Not owned;
     *             must outlive the controller.
     */
    StripController(const config::LedSettings& settings, hal::IHardwareSink* sink);
    ~StripController() override;

    StripController(const StripController&) = delete;
    StripController& operator=(const StripController&) = delete;

    // ========================================================================
    // Manual control
    // ========================================================================

    StripResult setPixel(int32_t index, const Color& color);
    StripResult setAll(const Color& color);
    StripResult getPixel(int32_t index, Color& out) const;

    /**
     * @brief Apply a static scene, else an animated scene of the same name
     */
    StripResult applyScene(const char* name);

    /// Same as applyScene("off")
    StripResult clear();

    StripResult setBrightness(int32_t level);
    uint8_t getBrightness() const;

    /**
     * @brief Consistent copy of the whole state
     */
    StripSnapshot getState() const;

    // ========================================================================
    // Introspection
    // ========================================================================

    uint16_t getLedCount() const override { return m_ledCount; }
    bool isSimulated() const { return m_sink == nullptr; }
    bool isAnimationRunning() const { return m_engine.isRunning(); }
    uint32_t getAnimationFrameCount() const { return m_engine.getFrameCount(); }

    /// Static scenes first, then animated
    static uint8_t getSceneCount();
    static const char* getSceneName(uint8_t index);

    /**
     * @brief Stop animation and drive the strip all-off. Idempotent.
     */
    void shutdown();

private:
    void writeAnimationFrame(const Color* frame, uint16_t count) override;

    // Caller holds m_commandLock. Returns false while the old task lingers;
    // manual writes may proceed since its frames are already dropped.
    bool stopAnimation();

    // Caller holds m_stateLock
    void pushToSink();
    void pushPixelToSink(uint16_t index);

    const uint16_t m_ledCount;
    hal::IHardwareSink* m_sink;

    StripState m_state;
    AnimationEngine m_engine;

    SemaphoreHandle_t m_commandLock;
    SemaphoreHandle_t m_stateLock;
    bool m_shutdown;
};

} // namespace led
} // namespace wakelight
