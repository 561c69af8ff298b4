// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AnimationEngine.cpp
 * @brief Traveling-wave animation task implementation
 *
 * Frame math, for k colors and n LEDs at elapsed time e:
 *   base     = (e mod cycle) / cycle * k
 *   position = (base + (i / n) * spread * k) mod k
 *   color    = lerp(colors[floor(position)], colors[floor(position) + 1 mod k],
 *                   position - floor(position))
 */

#define WL_LOG_TAG "Anim"
#include "AnimationEngine.h"
#include "../config/led_config.h"
#include "../utils/Log.h"

#include <cmath>

namespace wakelight {
namespace led {

AnimationEngine::AnimationEngine()
    : m_spec(nullptr)
    , m_target(nullptr)
    , m_taskHandle(nullptr)
    , m_wakeSignal(nullptr)
    , m_exitSignal(nullptr)
    , m_startTick(0)
    , m_running(false)
    , m_stopRequested(false)
    , m_frameCount(0)
{
    m_wakeSignal = xSemaphoreCreateBinary();
    m_exitSignal = xSemaphoreCreateBinary();

    if (m_wakeSignal == nullptr || m_exitSignal == nullptr) {
        WL_LOGE("Failed to create animation semaphores");
    }
}

AnimationEngine::~AnimationEngine()
{
    // The task dereferences this engine and its target until it signals exit
    while (!stop()) {}

    if (m_wakeSignal != nullptr) {
        vSemaphoreDelete(m_wakeSignal);
        m_wakeSignal = nullptr;
    }
    if (m_exitSignal != nullptr) {
        vSemaphoreDelete(m_exitSignal);
        m_exitSignal = nullptr;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool AnimationEngine::start(const AnimatedSceneSpec& spec, IAnimationTarget& target)
{
    if (!stop()) {
        WL_LED_LOGE("Cannot start '%s' - previous animation task still running",
                    spec.name ? spec.name : "?");
        return false;
    }

    if (!spec.isValid()) {
        WL_LED_LOGE("Invalid animation spec '%s'", spec.name ? spec.name : "?");
        return false;
    }
    if (m_wakeSignal == nullptr || m_exitSignal == nullptr) {
        WL_LED_LOGE("Cannot start - semaphores not created");
        return false;
    }

    // Drain signals left over from a previous run
    while (xSemaphoreTake(m_wakeSignal, 0) == pdTRUE) {}
    while (xSemaphoreTake(m_exitSignal, 0) == pdTRUE) {}

    m_spec = &spec;
    m_target = &target;
    m_frame.assign(target.getLedCount(), colors::OFF);
    m_frameCount = 0;
    m_stopRequested = false;
    m_startTick = xTaskGetTickCount();
    m_running = true;

    BaseType_t result = xTaskCreatePinnedToCore(
        taskFunction,
        "Animation",
        ANIMATION_TASK_STACK,
        this,
        ANIMATION_TASK_PRIORITY,
        &m_taskHandle,
        ANIMATION_TASK_CORE
    );

    if (result != pdPASS) {
        WL_LED_LOGE("Failed to create animation task (result=%d)", result);
        m_taskHandle = nullptr;
        m_running = false;
        m_spec = nullptr;
        return false;
    }

    WL_LED_LOGI("Animation '%s' started (%u colors, %.1fs cycle, spread %.2f, %u fps)",
                spec.name, spec.colorCount, spec.cycleDurationSec, spec.waveSpread,
                spec.framesPerSecond);
    return true;
}

bool AnimationEngine::stop()
{
    if (m_taskHandle == nullptr) {
        return true;
    }

    m_stopRequested = true;
    xSemaphoreGive(m_wakeSignal);

    if (xSemaphoreTake(m_exitSignal, pdMS_TO_TICKS(ANIMATION_STOP_TIMEOUT_MS)) != pdTRUE) {
        // Handle and spec stay valid until a later stop() sees the exit
        WL_LED_LOGW("Animation task did not exit within %lu ms",
                    (unsigned long)ANIMATION_STOP_TIMEOUT_MS);
        return false;
    }

    WL_LED_LOGD("Animation '%s' stopped after %lu frames",
                m_spec ? m_spec->name : "?", (unsigned long)m_frameCount.load());

    m_taskHandle = nullptr;
    m_spec = nullptr;
    return true;
}

const char* AnimationEngine::getSceneName() const
{
    return m_running.load() && m_spec != nullptr ? m_spec->name : nullptr;
}

// ============================================================================
// Task
// ============================================================================

void AnimationEngine::taskFunction(void* param)
{
    AnimationEngine* engine = static_cast<AnimationEngine*>(param);
    if (engine != nullptr) {
        engine->run();
    }
    vTaskDelete(nullptr);
}

void AnimationEngine::run()
{
    const uint32_t periodMs = m_spec->framesPerSecond >= 1000 ? 1 : 1000 / m_spec->framesPerSecond;
    const uint16_t ledCount = static_cast<uint16_t>(m_frame.size());

    while (!m_stopRequested.load()) {
        TickType_t elapsedTicks = xTaskGetTickCount() - m_startTick;
        float elapsedSec = static_cast<float>(elapsedTicks * portTICK_PERIOD_MS) / 1000.0f;

        computeFrame(*m_spec, elapsedSec, m_frame.data(), ledCount);
        m_target->writeAnimationFrame(m_frame.data(), ledCount);
        m_frameCount++;

        // Frame sleep; stop() gives the semaphore to end it early
        (void)xSemaphoreTake(m_wakeSignal, pdMS_TO_TICKS(periodMs));
    }

    m_running = false;
    // Nothing may touch members after this give: the owner may be destroyed
    xSemaphoreGive(m_exitSignal);
}

void AnimationEngine::computeFrame(const AnimatedSceneSpec& spec, float elapsedSec,
                                   Color* out, uint16_t count)
{
    if (out == nullptr || count == 0 || !spec.isValid()) {
        return;
    }

    const float k = static_cast<float>(spec.colorCount);
    const float cycle = spec.cycleDurationSec;
    const float basePosition = fmodf(elapsedSec, cycle) / cycle * k;

    for (uint16_t i = 0; i < count; i++) {
        float offset = (static_cast<float>(i) / static_cast<float>(count)) * spec.waveSpread * k;
        float position = fmodf(basePosition + offset, k);
        if (position < 0.0f) {
            position += k;
        }

        uint8_t idx = static_cast<uint8_t>(floorf(position));
        if (idx >= spec.colorCount) {
            idx = 0;
            position = 0.0f;
        }
        uint8_t next = static_cast<uint8_t>((idx + 1) % spec.colorCount);
        float frac = position - static_cast<float>(idx);

        out[i] = Color::lerp(spec.colors[idx], spec.colors[next], frac);
    }
}

} // namespace led
} // namespace wakelight
