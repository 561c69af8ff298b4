// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WakeWordPipeline.h
 * @brief Background wake-word detection loop
 *
 * capture (device rate) -> resample (target rate) -> score -> gate -> callback
 *
 * State machine: Stopped -> Starting -> Running -> Stopped
 *                                        Running -> Stopping -> Stopped
 *
 * The model is loaded and the audio stream opened on the pipeline task, not
 * on the caller of start(). start() polls the task's setup result for up to
 * START_POLL_ATTEMPTS * START_POLL_INTERVAL_MS and returns false (with no
 * task left running) on failure or timeout.
 *
 * stop() is idempotent and waits at most STOP_TIMEOUT_MS for the task. A task
 * that misses the deadline is never killed: the pipeline stays Stopping,
 * stop() returns false, and start() refuses until a later stop() observes
 * the exit. The task releases the audio stream and the model on its way out.
 *
 * The detection callback runs on the pipeline task, outside every pipeline
 * lock, so it may call back into StripController. Throwing or returning false
 * counts as a callback failure: logged, counted, loop continues.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

#ifdef NATIVE_BUILD
#include "mocks/freertos_mock.h"
#else
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#endif

#include "DetectionGate.h"
#include "PolyphaseResampler.h"
#include "config/DeviceConfig.h"
#include "hal/interface/IAudioSource.h"
#include "hal/interface/IWakeWordScorer.h"

namespace wakelight {
namespace audio {

enum class PipelineState : uint8_t {
    Stopped = 0,
    Starting,
    Running,
    Stopping
};

const char* pipelineStateName(PipelineState state);

struct PipelineStats {
    uint32_t chunksProcessed = 0;
    uint32_t detections = 0;
    uint32_t suppressed = 0;
    uint32_t readErrors = 0;
    uint32_t predictErrors = 0;
    uint32_t callbackFailures = 0;
};

class WakeWordPipeline {
public:
    typedef std::function<bool(const DetectionEvent&)> DetectionCallback;

    /**
     * @param source Audio input; not owned, must outlive the pipeline
     * @param scorer Wake-word model; not owned, must outlive the pipeline
     */
    WakeWordPipeline(const config::AudioSettings& audioSettings,
                     const config::WakeWordSettings& wakeSettings,
                     hal::IAudioSource& source,
                     hal::IWakeWordScorer& scorer);
    ~WakeWordPipeline();

    WakeWordPipeline(const WakeWordPipeline&) = delete;
    WakeWordPipeline& operator=(const WakeWordPipeline&) = delete;

    /**
     * @brief Spawn the task and wait for its setup result
     * @return true once Running; false if setup failed or timed out
     */
    bool start();

    /**
     * @brief Signal the task and wait for it to exit
     * @return true once no task remains; false if it is still Stopping
     */
    bool stop();

    /**
     * @brief Replace the detection callback (any thread, any time)
     */
    void setCallback(DetectionCallback callback);

    PipelineState getState() const { return static_cast<PipelineState>(m_state.load()); }
    bool isRunning() const { return getState() == PipelineState::Running; }

    PipelineStats getStats() const;

    // Valid while Running
    uint8_t getDeviceIndex() const { return m_deviceIndex; }
    uint32_t getDeviceRate() const { return m_deviceRate; }
    uint32_t getDeviceChunkFrames() const { return m_deviceChunk; }
    bool isResampling() const { return m_deviceRate != m_targetRate; }

    float getThreshold() const { return m_gate.getThreshold(); }
    uint32_t getCooldownMs() const { return m_gate.getCooldownMs(); }

private:
    enum SetupResult : uint8_t {
        SETUP_PENDING = 0,
        SETUP_OK,
        SETUP_FAILED
    };

    static void taskFunction(void* param);
    void run();

    bool setup();
    bool selectDevice(uint8_t deviceCount, uint8_t& index);
    void processChunk();
    void dispatch(const DetectionEvent& event);
    void releaseResources();

    /// Sleep up to @p ms; returns true if stop was requested
    bool backoff(uint32_t ms);

    static uint32_t nowMs();

    hal::IAudioSource& m_source;
    hal::IWakeWordScorer& m_scorer;

    const uint32_t m_targetRate;
    const uint32_t m_targetChunk;
    const int32_t m_requestedDevice;
    char m_modelPath[config::MAX_MODEL_PATH];

    DetectionGate m_gate;
    PolyphaseResampler m_resampler;
    std::vector<int16_t> m_captureBuffer;
    std::vector<int16_t> m_resampleBuffer;
    hal::ScoreSet m_scores;

    uint8_t m_deviceIndex;
    uint32_t m_deviceRate;
    uint32_t m_deviceChunk;
    hal::AudioHandle m_handle;
    bool m_modelLoaded;

    DetectionCallback m_callback;

    TaskHandle_t m_taskHandle;
    SemaphoreHandle_t m_callbackLock;
    SemaphoreHandle_t m_resourceLock;
    SemaphoreHandle_t m_wakeSignal;
    SemaphoreHandle_t m_exitSignal;

    std::atomic<uint8_t> m_state;
    std::atomic<uint8_t> m_setupResult;
    std::atomic<bool> m_stopRequested;

    std::atomic<uint32_t> m_chunksProcessed;
    std::atomic<uint32_t> m_detections;
    std::atomic<uint32_t> m_suppressed;
    std::atomic<uint32_t> m_readErrors;
    std::atomic<uint32_t> m_predictErrors;
    std::atomic<uint32_t> m_callbackFailures;
};

} // namespace audio
} // namespace wakelight
