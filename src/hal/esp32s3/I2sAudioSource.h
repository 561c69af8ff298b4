// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file I2sAudioSource.h
 * @brief ESP32-S3 audio input from one INMP441 MEMS microphone
 *
 * Legacy I2S driver (driver/i2s.h), 32-bit slots, LEFT channel only.
 * Samples are 24-bit left-aligned; conversion is >>8 (24-bit), DC-blocking
 * high-pass, then scaled to PCM16.
 *
 * Exposes a single device. The legacy driver accepts any standard rate, so
 * the pipeline never needs to resample on this board.
 */

#pragma once

#include <cstdint>
#include <vector>

#include <driver/i2s.h>

#include "hal/interface/IAudioSource.h"

namespace wakelight {
namespace hal {

struct I2sCaptureStats {
    uint32_t chunksRead = 0;
    uint32_t timeouts = 0;
    uint32_t readErrors = 0;
    int16_t peakSample = 0;
};

class I2sAudioSource : public IAudioSource {
public:
    I2sAudioSource();
    ~I2sAudioSource() override;

    uint8_t getDeviceCount() override { return 1; }
    bool getDeviceInfo(uint8_t index, AudioDeviceInfo& info) override;
    bool isSampleRateSupported(uint8_t index, uint32_t sampleRate) override;

    AudioHandle open(const AudioStreamConfig& config) override;
    CaptureResult read(AudioHandle handle, int16_t* buffer, size_t frames) override;
    void close(AudioHandle handle) override;

    const I2sCaptureStats& getStats() const { return m_stats; }

private:
    static constexpr i2s_port_t I2S_PORT = I2S_NUM_0;
    static constexpr AudioHandle HANDLE = 0;

    bool m_open;
    uint32_t m_sampleRate;
    std::vector<int32_t> m_dmaBuffer;
    float m_dcPrevInput;
    float m_dcPrevOutput;
    I2sCaptureStats m_stats;
};

} // namespace hal
} // namespace wakelight
