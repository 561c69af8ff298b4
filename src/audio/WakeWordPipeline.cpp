// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WakeWordPipeline.cpp
 * @brief Wake-word detection loop implementation
 */

#define WL_LOG_TAG "Wake"
#include "WakeWordPipeline.h"
#include "../utils/Log.h"

#include <cctype>
#include <cstring>
#include <exception>

namespace wakelight {
namespace audio {

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Stopped:  return "stopped";
        case PipelineState::Starting: return "starting";
        case PipelineState::Running:  return "running";
        case PipelineState::Stopping: return "stopping";
        default:                      return "unknown";
    }
}

namespace {

bool containsIgnoreCase(const char* haystack, const char* needle) {
    const size_t needleLen = strlen(needle);
    for (const char* p = haystack; *p != '\0'; p++) {
        size_t i = 0;
        while (i < needleLen && p[i] != '\0' &&
               tolower(static_cast<unsigned char>(p[i])) == needle[i]) {
            i++;
        }
        if (i == needleLen) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

WakeWordPipeline::WakeWordPipeline(const config::AudioSettings& audioSettings,
                                   const config::WakeWordSettings& wakeSettings,
                                   hal::IAudioSource& source,
                                   hal::IWakeWordScorer& scorer)
    : m_source(source)
    , m_scorer(scorer)
    , m_targetRate(audioSettings.sampleRate)
    , m_targetChunk(audioSettings.chunkSize)
    , m_requestedDevice(audioSettings.deviceIndex)
    , m_gate(wakeSettings.threshold,
             static_cast<uint32_t>(wakeSettings.cooldownSeconds * 1000.0f + 0.5f),
             wakeSettings.sharedCooldown)
    , m_deviceIndex(0)
    , m_deviceRate(audioSettings.sampleRate)
    , m_deviceChunk(audioSettings.chunkSize)
    , m_handle(hal::INVALID_AUDIO_HANDLE)
    , m_modelLoaded(false)
    , m_taskHandle(nullptr)
    , m_callbackLock(nullptr)
    , m_resourceLock(nullptr)
    , m_wakeSignal(nullptr)
    , m_exitSignal(nullptr)
    , m_state(static_cast<uint8_t>(PipelineState::Stopped))
    , m_setupResult(SETUP_PENDING)
    , m_stopRequested(false)
    , m_chunksProcessed(0)
    , m_detections(0)
    , m_suppressed(0)
    , m_readErrors(0)
    , m_predictErrors(0)
    , m_callbackFailures(0)
{
    strncpy(m_modelPath, wakeSettings.modelPath, sizeof(m_modelPath) - 1);
    m_modelPath[sizeof(m_modelPath) - 1] = '\0';

    m_callbackLock = xSemaphoreCreateMutex();
    m_resourceLock = xSemaphoreCreateMutex();
    m_wakeSignal = xSemaphoreCreateBinary();
    m_exitSignal = xSemaphoreCreateBinary();

    if (m_callbackLock == nullptr || m_resourceLock == nullptr ||
        m_wakeSignal == nullptr || m_exitSignal == nullptr) {
        WL_LOGE_CTX("Failed to create pipeline semaphores");
    }
}

WakeWordPipeline::~WakeWordPipeline()
{
    // The task dereferences this object until it signals exit
    while (!stop()) {}

    SemaphoreHandle_t* handles[] = {&m_callbackLock, &m_resourceLock, &m_wakeSignal, &m_exitSignal};
    for (SemaphoreHandle_t* h : handles) {
        if (*h != nullptr) {
            vSemaphoreDelete(*h);
            *h = nullptr;
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool WakeWordPipeline::start()
{
    if (getState() == PipelineState::Stopping && !stop()) {
        WL_WAKE_LOGE("Cannot start - previous pipeline task still running");
        return false;
    }
    if (getState() != PipelineState::Stopped) {
        WL_WAKE_LOGW("Already %s", pipelineStateName(getState()));
        return getState() == PipelineState::Running;
    }
    if (m_wakeSignal == nullptr || m_exitSignal == nullptr ||
        m_resourceLock == nullptr || m_callbackLock == nullptr) {
        WL_WAKE_LOGE("Cannot start - semaphores not created");
        return false;
    }

    while (xSemaphoreTake(m_wakeSignal, 0) == pdTRUE) {}
    while (xSemaphoreTake(m_exitSignal, 0) == pdTRUE) {}

    m_stopRequested = false;
    m_setupResult = SETUP_PENDING;
    m_state = static_cast<uint8_t>(PipelineState::Starting);

    BaseType_t result = xTaskCreatePinnedToCore(
        taskFunction,
        "WakeWord",
        PIPELINE_TASK_STACK,
        this,
        PIPELINE_TASK_PRIORITY,
        &m_taskHandle,
        PIPELINE_TASK_CORE
    );

    if (result != pdPASS) {
        WL_WAKE_LOGE("Failed to create pipeline task (result=%d)", result);
        m_taskHandle = nullptr;
        m_state = static_cast<uint8_t>(PipelineState::Stopped);
        return false;
    }

    for (uint32_t attempt = 0; attempt < START_POLL_ATTEMPTS; attempt++) {
        if (m_setupResult.load() != SETUP_PENDING) {
            break;
        }
        vTaskDelay(pdMS_TO_TICKS(START_POLL_INTERVAL_MS));
    }

    uint8_t setup = m_setupResult.load();
    if (setup == SETUP_OK) {
        m_state = static_cast<uint8_t>(PipelineState::Running);
        WL_WAKE_LOGI("Listening on device %u at %lu Hz%s (threshold %.2f, cooldown %lu ms)",
                     m_deviceIndex, (unsigned long)m_deviceRate,
                     isResampling() ? " (resampling)" : "",
                     m_gate.getThreshold(), (unsigned long)m_gate.getCooldownMs());
        return true;
    }

    if (setup == SETUP_PENDING) {
        WL_WAKE_LOGE("Pipeline setup timed out after %lu ms",
                     (unsigned long)(START_POLL_ATTEMPTS * START_POLL_INTERVAL_MS));
    } else {
        WL_WAKE_LOGE("Pipeline setup failed");
    }
    stop();
    return false;
}

bool WakeWordPipeline::stop()
{
    if (m_taskHandle != nullptr) {
        m_stopRequested = true;
        xSemaphoreGive(m_wakeSignal);

        if (xSemaphoreTake(m_exitSignal, pdMS_TO_TICKS(STOP_TIMEOUT_MS)) != pdTRUE) {
            // Still blocked in a read or score; it exits and releases the stream on its own
            WL_WAKE_LOGW("Pipeline task did not exit within %lu ms",
                         (unsigned long)STOP_TIMEOUT_MS);
            m_state = static_cast<uint8_t>(PipelineState::Stopping);
            return false;
        }
        m_taskHandle = nullptr;
        WL_WAKE_LOGI("Pipeline stopped");
    }

    releaseResources();
    m_state = static_cast<uint8_t>(PipelineState::Stopped);
    return true;
}

void WakeWordPipeline::setCallback(DetectionCallback callback)
{
    xSemaphoreTake(m_callbackLock, portMAX_DELAY);
    m_callback = std::move(callback);
    xSemaphoreGive(m_callbackLock);
}

PipelineStats WakeWordPipeline::getStats() const
{
    PipelineStats stats;
    stats.chunksProcessed = m_chunksProcessed.load();
    stats.detections = m_detections.load();
    stats.suppressed = m_suppressed.load();
    stats.readErrors = m_readErrors.load();
    stats.predictErrors = m_predictErrors.load();
    stats.callbackFailures = m_callbackFailures.load();
    return stats;
}

// ============================================================================
// Task
// ============================================================================

void WakeWordPipeline::taskFunction(void* param)
{
    WakeWordPipeline* pipeline = static_cast<WakeWordPipeline*>(param);
    if (pipeline != nullptr) {
        pipeline->run();
    }
    vTaskDelete(nullptr);
}

void WakeWordPipeline::run()
{
    if (!setup()) {
        m_setupResult = SETUP_FAILED;
        releaseResources();
        xSemaphoreGive(m_exitSignal);
        return;
    }
    m_setupResult = SETUP_OK;

    uint32_t backoffMs = ERROR_BACKOFF_MIN_MS;

    while (!m_stopRequested.load()) {
        hal::CaptureResult captured =
            m_source.read(m_handle, m_captureBuffer.data(), m_deviceChunk);

        if (captured != hal::CaptureResult::Success) {
            m_readErrors++;
            static uint32_t s_lastReadLog = 0;
            WL_LOG_THROTTLE(s_lastReadLog, 1000,
                WL_AUDIO_LOGW("Audio read failed (%u), retry in %lu ms",
                              static_cast<unsigned>(captured), (unsigned long)backoffMs));
            if (backoff(backoffMs)) {
                break;
            }
            backoffMs = (backoffMs * 2 > ERROR_BACKOFF_MAX_MS) ? ERROR_BACKOFF_MAX_MS : backoffMs * 2;
            continue;
        }

        const int16_t* window = m_captureBuffer.data();
        size_t windowLen = m_deviceChunk;
        if (isResampling()) {
            windowLen = m_resampler.process(m_captureBuffer.data(), m_deviceChunk,
                                            m_resampleBuffer.data(), m_resampleBuffer.size());
            window = m_resampleBuffer.data();
        }

        m_scores.clear();
        if (windowLen == 0 || !m_scorer.predict(window, windowLen, m_scores)) {
            m_predictErrors++;
            WL_WAKE_LOGW("Scoring failed, retry in %lu ms", (unsigned long)backoffMs);
            if (backoff(backoffMs)) {
                break;
            }
            backoffMs = (backoffMs * 2 > ERROR_BACKOFF_MAX_MS) ? ERROR_BACKOFF_MAX_MS : backoffMs * 2;
            continue;
        }

        backoffMs = ERROR_BACKOFF_MIN_MS;
        processChunk();
    }

    releaseResources();
    // Nothing may touch members after this give: the owner may be destroyed
    xSemaphoreGive(m_exitSignal);
}

bool WakeWordPipeline::setup()
{
    const uint8_t deviceCount = m_source.getDeviceCount();
    if (deviceCount == 0) {
        WL_AUDIO_LOGE("No audio input devices found");
        return false;
    }

    uint8_t index = 0;
    if (!selectDevice(deviceCount, index)) {
        return false;
    }

    hal::AudioDeviceInfo info;
    if (!m_source.getDeviceInfo(index, info)) {
        WL_AUDIO_LOGE("Device %u info unavailable", index);
        return false;
    }
    m_deviceIndex = index;

    if (m_source.isSampleRateSupported(index, m_targetRate)) {
        m_deviceRate = m_targetRate;
        m_deviceChunk = m_targetChunk;
    } else {
        if (info.defaultSampleRate == 0) {
            WL_AUDIO_LOGE("Device '%s' supports neither %lu Hz nor reports a native rate",
                          info.name, (unsigned long)m_targetRate);
            return false;
        }
        m_deviceRate = info.defaultSampleRate;
        // Same wall-clock duration per chunk at the native rate
        m_deviceChunk = static_cast<uint32_t>(
            (static_cast<uint64_t>(m_targetChunk) * m_deviceRate) / m_targetRate);
        WL_AUDIO_LOGW("Device '%s' does not support %lu Hz, capturing at %lu Hz and resampling",
                      info.name, (unsigned long)m_targetRate, (unsigned long)m_deviceRate);
    }

    if (!m_resampler.configure(m_deviceRate, m_targetRate, m_deviceChunk)) {
        return false;
    }
    m_captureBuffer.assign(m_deviceChunk, 0);
    m_resampleBuffer.assign(m_resampler.outputLength(m_deviceChunk), 0);

    if (!m_scorer.load(m_modelPath)) {
        WL_WAKE_LOGE("Failed to load wake-word model '%s'", m_modelPath);
        return false;
    }
    xSemaphoreTake(m_resourceLock, portMAX_DELAY);
    m_modelLoaded = true;
    xSemaphoreGive(m_resourceLock);

    hal::AudioStreamConfig stream;
    stream.deviceIndex = index;
    stream.sampleRate = m_deviceRate;
    stream.channels = 1;
    stream.chunkFrames = m_deviceChunk;

    hal::AudioHandle handle = m_source.open(stream);
    if (handle == hal::INVALID_AUDIO_HANDLE) {
        WL_AUDIO_LOGE("Failed to open '%s' at %lu Hz", info.name, (unsigned long)m_deviceRate);
        return false;
    }
    xSemaphoreTake(m_resourceLock, portMAX_DELAY);
    m_handle = handle;
    xSemaphoreGive(m_resourceLock);

    WL_AUDIO_LOGI("Opened '%s' (%lu frames per chunk)", info.name, (unsigned long)m_deviceChunk);
    return true;
}

bool WakeWordPipeline::selectDevice(uint8_t deviceCount, uint8_t& index)
{
    if (m_requestedDevice >= 0) {
        if (m_requestedDevice >= deviceCount) {
            WL_AUDIO_LOGE("Configured device %ld not present (%u devices)",
                          (long)m_requestedDevice, deviceCount);
            return false;
        }
        index = static_cast<uint8_t>(m_requestedDevice);
        return true;
    }

    hal::AudioDeviceInfo info;
    for (uint8_t i = 0; i < deviceCount; i++) {
        if (!m_source.getDeviceInfo(i, info) || info.maxInputChannels == 0) {
            continue;
        }
        if (containsIgnoreCase(info.name, "usb") || containsIgnoreCase(info.name, "mic") ||
            containsIgnoreCase(info.name, "audio")) {
            index = i;
            return true;
        }
    }

    index = 0;
    return true;
}

void WakeWordPipeline::processChunk()
{
    m_chunksProcessed++;
    const uint32_t now = nowMs();

    for (uint8_t i = 0; i < m_scores.count; i++) {
        const hal::ModelScore& entry = m_scores.entries[i];

        if (entry.score > SCORE_LOG_FLOOR) {
            WL_WAKE_LOGD("Score %s: %.3f", entry.modelName, entry.score);
        }

        DetectionEvent event;
        GateDecision decision = m_gate.evaluate(entry.modelName, entry.score, now, event);
        if (decision == GateDecision::Suppressed) {
            m_suppressed++;
        } else if (decision == GateDecision::Fired) {
            m_detections++;
            WL_WAKE_LOGI(WL_CLR_YELLOW "Wake word detected:" WL_ANSI_RESET " %s (%.3f)",
                         event.modelName, event.score);
            dispatch(event);
        }
    }
}

void WakeWordPipeline::dispatch(const DetectionEvent& event)
{
    xSemaphoreTake(m_callbackLock, portMAX_DELAY);
    DetectionCallback callback = m_callback;
    xSemaphoreGive(m_callbackLock);

    if (!callback) {
        return;
    }
    bool delivered = false;
    try {
        delivered = callback(event);
    } catch (const std::exception& e) {
        WL_WAKE_LOGE("Detection callback threw for '%s': %s", event.modelName, e.what());
    } catch (...) {
        WL_WAKE_LOGE("Detection callback threw for '%s': unknown exception", event.modelName);
    }
    if (!delivered) {
        m_callbackFailures++;
        WL_WAKE_LOGW("Detection callback failed for '%s'", event.modelName);
    }
}

void WakeWordPipeline::releaseResources()
{
    if (m_resourceLock == nullptr) {
        return;
    }

    xSemaphoreTake(m_resourceLock, portMAX_DELAY);
    if (m_handle != hal::INVALID_AUDIO_HANDLE) {
        m_source.close(m_handle);
        m_handle = hal::INVALID_AUDIO_HANDLE;
        WL_AUDIO_LOGD("Audio stream closed");
    }
    if (m_modelLoaded) {
        m_scorer.unload();
        m_modelLoaded = false;
        WL_WAKE_LOGD("Model unloaded");
    }
    xSemaphoreGive(m_resourceLock);
}

bool WakeWordPipeline::backoff(uint32_t ms)
{
    if (m_stopRequested.load()) {
        return true;
    }
    (void)xSemaphoreTake(m_wakeSignal, pdMS_TO_TICKS(ms));
    return m_stopRequested.load();
}

uint32_t WakeWordPipeline::nowMs()
{
    return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
}

} // namespace audio
} // namespace wakelight
