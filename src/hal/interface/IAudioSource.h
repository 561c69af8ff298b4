// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IAudioSource.h
 * @brief Hardware abstraction interface for audio input devices
 *
 * open() and read() are called from the pipeline task. close() may come from
 * another task, but never concurrently with read().
 *
 * Implementations:
 * - ESP32-S3: I2sAudioSource (legacy I2S driver, one MEMS microphone)
 * - Tests: scripted source
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "config/audio_config.h"

namespace wakelight {
namespace hal {

typedef int32_t AudioHandle;
constexpr AudioHandle INVALID_AUDIO_HANDLE = -1;

struct AudioDeviceInfo {
    uint8_t index = 0;
    char name[audio::MAX_DEVICE_NAME] = "";
    uint32_t defaultSampleRate = 0;     ///< Native rate
    uint8_t maxInputChannels = 0;
};

struct AudioStreamConfig {
    uint8_t deviceIndex = 0;
    uint32_t sampleRate = audio::DEFAULT_SAMPLE_RATE;
    uint8_t channels = 1;
    uint32_t chunkFrames = audio::DEFAULT_CHUNK_SIZE;
};

/**
 * @brief Result of a read
 */
enum class CaptureResult : uint8_t {
    Success,        ///< Buffer filled
    Timeout,        ///< No data within the chunk period
    ReadError,      ///< Driver error
    NotOpen         ///< Handle invalid or closed
};

class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    virtual uint8_t getDeviceCount() = 0;

    /**
     * @return false if @p index is out of range
     */
    virtual bool getDeviceInfo(uint8_t index, AudioDeviceInfo& info) = 0;

    virtual bool isSampleRateSupported(uint8_t index, uint32_t sampleRate) = 0;

    /**
     * @brief Open a PCM16 input stream
     * @return Handle, or INVALID_AUDIO_HANDLE if the device cannot be opened
     */
    virtual AudioHandle open(const AudioStreamConfig& config) = 0;

    /**
     * @brief Blocking read of @p frames samples (mono)
     */
    virtual CaptureResult read(AudioHandle handle, int16_t* buffer, size_t frames) = 0;

    virtual void close(AudioHandle handle) = 0;
};

} // namespace hal
} // namespace wakelight
