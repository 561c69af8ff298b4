// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StripController.cpp
 * @brief Strip state arbitration between manual commands and animation
 */

#define WL_LOG_TAG "Strip"
#include "StripController.h"
#include "AnimatedScenes.h"
#include "SceneCatalog.h"
#include "../utils/Log.h"

namespace wakelight {
namespace led {

const char* stripResultName(StripResult result) {
    switch (result) {
        case StripResult::OK:           return "OK";
        case StripResult::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case StripResult::NOT_FOUND:    return "NOT_FOUND";
        case StripResult::UNAVAILABLE:  return "UNAVAILABLE";
        default:                        return "UNKNOWN";
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

StripController::StripController(const config::LedSettings& settings, hal::IHardwareSink* sink)
    : m_ledCount(settings.count)
    , m_sink(sink)
    , m_commandLock(nullptr)
    , m_stateLock(nullptr)
    , m_shutdown(false)
{
    m_commandLock = xSemaphoreCreateMutex();
    m_stateLock = xSemaphoreCreateMutex();
    if (m_commandLock == nullptr || m_stateLock == nullptr) {
        WL_LOGE_CTX("Failed to create strip locks");
    }

    m_state.colors.assign(m_ledCount, colors::OFF);
    m_state.brightness = settings.brightness;

    if (m_sink != nullptr) {
        m_sink->setBrightness(m_state.brightness);
        pushToSink();
        WL_LOGI("Strip ready: %u LEDs, brightness %u", m_ledCount, m_state.brightness);
    } else {
        WL_LOGW("No hardware sink - running in simulation mode (%u LEDs)", m_ledCount);
    }
}

StripController::~StripController()
{
    shutdown();

    if (m_commandLock != nullptr) {
        vSemaphoreDelete(m_commandLock);
        m_commandLock = nullptr;
    }
    if (m_stateLock != nullptr) {
        vSemaphoreDelete(m_stateLock);
        m_stateLock = nullptr;
    }
}

// ============================================================================
// Manual control
// ============================================================================

StripResult StripController::setPixel(int32_t index, const Color& color)
{
    if (index < 0 || index >= static_cast<int32_t>(m_ledCount)) {
        WL_LED_LOGD("setPixel: index %ld out of range [0, %u)", (long)index, m_ledCount);
        return StripResult::OUT_OF_RANGE;
    }

    xSemaphoreTake(m_commandLock, portMAX_DELAY);
    stopAnimation();

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    m_state.colors[index] = color;
    m_state.activeSceneName = nullptr;
    m_state.animationActive = false;
    if (m_sink != nullptr) {
        pushPixelToSink(static_cast<uint16_t>(index));
        m_sink->show();
    }
    xSemaphoreGive(m_stateLock);

    xSemaphoreGive(m_commandLock);
    return StripResult::OK;
}

StripResult StripController::setAll(const Color& color)
{
    xSemaphoreTake(m_commandLock, portMAX_DELAY);
    stopAnimation();

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    for (Color& c : m_state.colors) {
        c = color;
    }
    m_state.activeSceneName = nullptr;
    m_state.animationActive = false;
    pushToSink();
    xSemaphoreGive(m_stateLock);

    xSemaphoreGive(m_commandLock);
    return StripResult::OK;
}

StripResult StripController::getPixel(int32_t index, Color& out) const
{
    if (index < 0 || index >= static_cast<int32_t>(m_ledCount)) {
        return StripResult::OUT_OF_RANGE;
    }

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    out = m_state.colors[index];
    xSemaphoreGive(m_stateLock);
    return StripResult::OK;
}

StripResult StripController::applyScene(const char* name)
{
    const SceneEntry* scene = SceneCatalog::find(name);
    if (scene != nullptr) {
        std::vector<Color> rendered(m_ledCount, colors::OFF);
        if (m_ledCount > 0) {
            scene->render(rendered.data(), m_ledCount);
        }

        xSemaphoreTake(m_commandLock, portMAX_DELAY);
        stopAnimation();

        xSemaphoreTake(m_stateLock, portMAX_DELAY);
        m_state.colors.swap(rendered);
        m_state.activeSceneName = scene->name;
        m_state.animationActive = false;
        pushToSink();
        xSemaphoreGive(m_stateLock);

        xSemaphoreGive(m_commandLock);
        WL_LED_LOGI("Scene: " WL_CLR_GREEN "%s" WL_ANSI_RESET, scene->name);
        return StripResult::OK;
    }

    const AnimatedSceneSpec* spec = AnimatedScenes::find(name);
    if (spec == nullptr) {
        WL_LED_LOGW("Unknown scene '%s'", name ? name : "(null)");
        return StripResult::NOT_FOUND;
    }

    xSemaphoreTake(m_commandLock, portMAX_DELAY);
    if (!stopAnimation()) {
        xSemaphoreGive(m_commandLock);
        WL_LED_LOGE("Animated scene '%s' unavailable until the previous animation exits", spec->name);
        return StripResult::UNAVAILABLE;
    }

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    m_state.activeSceneName = spec->name;
    m_state.animationActive = true;
    xSemaphoreGive(m_stateLock);

    bool started = m_engine.start(*spec, *this);
    if (!started) {
        xSemaphoreTake(m_stateLock, portMAX_DELAY);
        m_state.activeSceneName = nullptr;
        m_state.animationActive = false;
        xSemaphoreGive(m_stateLock);
    }

    xSemaphoreGive(m_commandLock);

    if (!started) {
        WL_LED_LOGE("Animated scene '%s' failed to start", spec->name);
        return StripResult::UNAVAILABLE;
    }
    WL_LED_LOGI("Scene: " WL_CLR_GREEN "%s" WL_ANSI_RESET " (animated)", spec->name);
    return StripResult::OK;
}

StripResult StripController::clear()
{
    return applyScene("off");
}

StripResult StripController::setBrightness(int32_t level)
{
    if (level < 0 || level > 255) {
        WL_LED_LOGD("setBrightness: %ld out of range [0, 255]", (long)level);
        return StripResult::OUT_OF_RANGE;
    }

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    m_state.brightness = static_cast<uint8_t>(level);
    if (m_sink != nullptr) {
        m_sink->setBrightness(m_state.brightness);
        m_sink->show();
    }
    xSemaphoreGive(m_stateLock);

    WL_LED_LOGD("Brightness: %ld", (long)level);
    return StripResult::OK;
}

uint8_t StripController::getBrightness() const
{
    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    uint8_t level = m_state.brightness;
    xSemaphoreGive(m_stateLock);
    return level;
}

StripSnapshot StripController::getState() const
{
    StripSnapshot snapshot;
    snapshot.ledCount = m_ledCount;

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    snapshot.brightness = m_state.brightness;
    snapshot.activeSceneName = m_state.activeSceneName;
    snapshot.animationActive = m_state.animationActive;
    snapshot.colors = m_state.colors;
    xSemaphoreGive(m_stateLock);

    return snapshot;
}

// ============================================================================
// Introspection
// ============================================================================

uint8_t StripController::getSceneCount()
{
    return static_cast<uint8_t>(SceneCatalog::count() + AnimatedScenes::count());
}

const char* StripController::getSceneName(uint8_t index)
{
    if (index < SceneCatalog::count()) {
        return SceneCatalog::at(index)->name;
    }
    const AnimatedSceneSpec* spec = AnimatedScenes::at(static_cast<uint8_t>(index - SceneCatalog::count()));
    return spec != nullptr ? spec->name : nullptr;
}

void StripController::shutdown()
{
    xSemaphoreTake(m_commandLock, portMAX_DELAY);
    if (m_shutdown) {
        xSemaphoreGive(m_commandLock);
        return;
    }

    stopAnimation();

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    for (Color& c : m_state.colors) {
        c = colors::OFF;
    }
    m_state.activeSceneName = SceneCatalog::find("off")->name;
    m_state.animationActive = false;
    pushToSink();
    xSemaphoreGive(m_stateLock);

    m_shutdown = true;
    xSemaphoreGive(m_commandLock);
    WL_LOGI("Strip shut down");
}

// ============================================================================
// Internal
// ============================================================================

void StripController::writeAnimationFrame(const Color* frame, uint16_t count)
{
    if (frame == nullptr) {
        return;
    }

    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    // A frame racing a manual command that already took over is dropped
    if (m_state.animationActive) {
        uint16_t n = (count < m_ledCount) ? count : m_ledCount;
        for (uint16_t i = 0; i < n; i++) {
            m_state.colors[i] = frame[i];
        }
        pushToSink();
    }
    xSemaphoreGive(m_stateLock);
}

bool StripController::stopAnimation()
{
    if (m_engine.isRunning()) {
        WL_LED_LOGD("Stopping animation for manual command");
    }

    // Frames from a task that outlives stop() are dropped from here on
    xSemaphoreTake(m_stateLock, portMAX_DELAY);
    m_state.animationActive = false;
    xSemaphoreGive(m_stateLock);

    if (!m_engine.stop()) {
        WL_LED_LOGW("Animation task still running, its frames are ignored");
        return false;
    }
    return true;
}

void StripController::pushToSink()
{
    if (m_sink == nullptr) {
        return;
    }
    for (uint16_t i = 0; i < m_ledCount; i++) {
        pushPixelToSink(i);
    }
    m_sink->show();
}

void StripController::pushPixelToSink(uint16_t index)
{
    m_sink->setPixel(index, m_state.colors[index].packed());
}

} // namespace led
} // namespace wakelight
