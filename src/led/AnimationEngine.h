// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AnimationEngine.h
 * @brief Traveling-wave animation task
 *
 * One FreeRTOS task renders frames of an AnimatedSceneSpec at the spec's
 * frame rate and hands each frame to an IAnimationTarget. The task sleeps on
 * a wake semaphore between frames, so stop() is observed within one frame
 * period.
 *
 * Lifecycle:
 *   start(spec, target)  - stops any running animation first, then spawns
 *   stop()               - signals, waits up to ANIMATION_STOP_TIMEOUT_MS,
 *                          returns false if the task has not exited yet
 *
 * A task stuck in its target is never killed. It keeps its handle and the
 * engine refuses start() until a later stop() observes the exit.
 *
 * Not thread-safe: start()/stop() must be serialized by the owner
 * (StripController holds its command lock around them).
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#ifdef NATIVE_BUILD
#include "mocks/freertos_mock.h"
#else
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#endif

#include "AnimatedScenes.h"
#include "Color.h"

namespace wakelight {
namespace led {

/**
 * @brief Receiver of rendered frames
 */
class IAnimationTarget {
public:
    virtual ~IAnimationTarget() = default;

    virtual uint16_t getLedCount() const = 0;

    /**
     * @brief Accept one complete frame (@p count == getLedCount())
     *
     * Called from the animation task.
     */
    virtual void writeAnimationFrame(const Color* frame, uint16_t count) = 0;
};

class AnimationEngine {
public:
    AnimationEngine();
    ~AnimationEngine();

    AnimationEngine(const AnimationEngine&) = delete;
    AnimationEngine& operator=(const AnimationEngine&) = delete;

    /**
     * @brief Replace any running animation with @p spec
     * @return false if the spec is invalid, the previous task is still
     *         running, or the task could not be created
     */
    bool start(const AnimatedSceneSpec& spec, IAnimationTarget& target);

    /**
     * @brief Cancel and join. Idempotent.
     * @return true once no task remains
     */
    bool stop();

    bool isRunning() const { return m_running.load(); }

    /// Name of the running scene, nullptr when stopped
    const char* getSceneName() const;

    /// Frames rendered since the last start()
    uint32_t getFrameCount() const { return m_frameCount.load(); }

    /**
     * @brief Render the frame for @p elapsedSec into @p out
     */
    static void computeFrame(const AnimatedSceneSpec& spec, float elapsedSec,
                             Color* out, uint16_t count);

private:
    static void taskFunction(void* param);
    void run();

    const AnimatedSceneSpec* m_spec;
    IAnimationTarget* m_target;
    std::vector<Color> m_frame;

    TaskHandle_t m_taskHandle;
    SemaphoreHandle_t m_wakeSignal;     ///< Given by stop() to cut the frame sleep short
    SemaphoreHandle_t m_exitSignal;     ///< Given by the task just before it exits
    TickType_t m_startTick;

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::atomic<uint32_t> m_frameCount;
};

} // namespace led
} // namespace wakelight
