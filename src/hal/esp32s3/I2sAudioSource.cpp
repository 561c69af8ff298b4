// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#define WL_LOG_TAG "I2sAudio"
#include "I2sAudioSource.h"
#include "utils/Log.h"

#include <algorithm>
#include <cstring>

namespace wakelight {
namespace hal {

namespace {

constexpr float DC_BLOCK_ALPHA = 0.995f;
// 24-bit full scale after the >>8 extract
constexpr float RECIP_SCALE = 1.0f / 8388608.0f;

const uint32_t SUPPORTED_RATES[] = {8000, 11025, 16000, 22050, 32000, 44100, 48000};

} // namespace

I2sAudioSource::I2sAudioSource()
    : m_open(false)
    , m_sampleRate(0)
    , m_dcPrevInput(0.0f)
    , m_dcPrevOutput(0.0f)
{
}

I2sAudioSource::~I2sAudioSource()
{
    close(HANDLE);
}

bool I2sAudioSource::getDeviceInfo(uint8_t index, AudioDeviceInfo& info)
{
    if (index != 0) {
        return false;
    }
    info.index = 0;
    strncpy(info.name, "I2S MEMS Mic (INMP441)", sizeof(info.name) - 1);
    info.name[sizeof(info.name) - 1] = '\0';
    info.defaultSampleRate = audio::DEFAULT_SAMPLE_RATE;
    info.maxInputChannels = 1;
    return true;
}

bool I2sAudioSource::isSampleRateSupported(uint8_t index, uint32_t sampleRate)
{
    if (index != 0) {
        return false;
    }
    for (uint32_t rate : SUPPORTED_RATES) {
        if (rate == sampleRate) {
            return true;
        }
    }
    return false;
}

AudioHandle I2sAudioSource::open(const AudioStreamConfig& config)
{
    if (m_open) {
        WL_AUDIO_LOGE("I2S already open");
        return INVALID_AUDIO_HANDLE;
    }
    if (config.deviceIndex != 0 || config.channels != 1 ||
        !isSampleRateSupported(config.deviceIndex, config.sampleRate)) {
        WL_AUDIO_LOGE("Unsupported stream (device=%u channels=%u rate=%lu)",
                      config.deviceIndex, config.channels, (unsigned long)config.sampleRate);
        return INVALID_AUDIO_HANDLE;
    }

    i2s_config_t i2sConfig = {
        .mode = static_cast<i2s_mode_t>(I2S_MODE_MASTER | I2S_MODE_RX),
        .sample_rate = config.sampleRate,
        .bits_per_sample = I2S_BITS_PER_SAMPLE_32BIT,
        .channel_format = I2S_CHANNEL_FMT_ONLY_LEFT,
        .communication_format = I2S_COMM_FORMAT_STAND_I2S,
        .intr_alloc_flags = ESP_INTR_FLAG_LEVEL1,
        .dma_buf_count = static_cast<int>(audio::I2S_DMA_BUFFER_COUNT),
        .dma_buf_len = static_cast<int>(audio::I2S_DMA_BUFFER_SAMPLES),
        .use_apll = false,
        .tx_desc_auto_clear = false,
        .fixed_mclk = 0,
        .mclk_multiple = I2S_MCLK_MULTIPLE_256,
        .bits_per_chan = I2S_BITS_PER_CHAN_32BIT,
    };

    esp_err_t err = i2s_driver_install(I2S_PORT, &i2sConfig, 0, nullptr);
    if (err != ESP_OK) {
        WL_AUDIO_LOGE("i2s_driver_install failed: %s", esp_err_to_name(err));
        return INVALID_AUDIO_HANDLE;
    }

    i2s_pin_config_t pinConfig = {
        .mck_io_num = I2S_PIN_NO_CHANGE,
        .bck_io_num = audio::I2S_BCLK_PIN,
        .ws_io_num = audio::I2S_LRCL_PIN,
        .data_out_num = I2S_PIN_NO_CHANGE,
        .data_in_num = audio::I2S_DIN_PIN,
    };

    err = i2s_set_pin(I2S_PORT, &pinConfig);
    if (err != ESP_OK) {
        WL_AUDIO_LOGE("i2s_set_pin failed: %s", esp_err_to_name(err));
        i2s_driver_uninstall(I2S_PORT);
        return INVALID_AUDIO_HANDLE;
    }

    err = i2s_start(I2S_PORT);
    if (err != ESP_OK) {
        WL_AUDIO_LOGE("i2s_start failed: %s", esp_err_to_name(err));
        i2s_driver_uninstall(I2S_PORT);
        return INVALID_AUDIO_HANDLE;
    }

    m_dmaBuffer.assign(config.chunkFrames, 0);
    m_sampleRate = config.sampleRate;
    m_dcPrevInput = 0.0f;
    m_dcPrevOutput = 0.0f;
    m_stats = I2sCaptureStats{};
    m_open = true;

    WL_AUDIO_LOGI("I2S open: %lu Hz, %lu frames/chunk, BCLK=%d WS=%d DIN=%d",
                  (unsigned long)m_sampleRate, (unsigned long)config.chunkFrames,
                  audio::I2S_BCLK_PIN, audio::I2S_LRCL_PIN, audio::I2S_DIN_PIN);
    return HANDLE;
}

CaptureResult I2sAudioSource::read(AudioHandle handle, int16_t* buffer, size_t frames)
{
    if (!m_open || handle != HANDLE) return CaptureResult::NotOpen;
    if (buffer == nullptr || frames > m_dmaBuffer.size()) return CaptureResult::ReadError;

    const size_t expectedBytes = frames * sizeof(int32_t);
    size_t bytesRead = 0;
    const uint32_t chunkMs = static_cast<uint32_t>((frames * 1000) / m_sampleRate);
    const TickType_t timeout = pdMS_TO_TICKS(chunkMs * 2 + 10);

    esp_err_t err = i2s_read(I2S_PORT, m_dmaBuffer.data(), expectedBytes, &bytesRead, timeout);
    if (err == ESP_ERR_TIMEOUT) {
        m_stats.timeouts++;
        return CaptureResult::Timeout;
    }
    if (err != ESP_OK) {
        m_stats.readErrors++;
        WL_AUDIO_LOGE("I2S read error: %s", esp_err_to_name(err));
        return CaptureResult::ReadError;
    }

    const size_t samplesRead = bytesRead / sizeof(int32_t);
    if (samplesRead < frames) {
        m_stats.timeouts++;
        return CaptureResult::Timeout;
    }

    int16_t peak = 0;
    for (size_t i = 0; i < frames; i++) {
        float input = static_cast<float>(m_dmaBuffer[i] >> audio::I2S_SAMPLE_SHIFT);

        // y[n] = x[n] - x[n-1] + alpha * y[n-1]
        float dcBlocked = input - m_dcPrevInput + DC_BLOCK_ALPHA * m_dcPrevOutput;
        m_dcPrevInput = input;
        m_dcPrevOutput = dcBlocked;

        float normalized = std::max(-1.0f, std::min(1.0f, dcBlocked * RECIP_SCALE));
        int16_t sample = static_cast<int16_t>(normalized * 32767.0f);
        buffer[i] = sample;

        int16_t absSample = (sample < 0) ? static_cast<int16_t>(-sample) : sample;
        if (absSample > peak) peak = absSample;
    }

    m_stats.chunksRead++;
    m_stats.peakSample = peak;
    return CaptureResult::Success;
}

void I2sAudioSource::close(AudioHandle handle)
{
    if (!m_open || handle != HANDLE) {
        return;
    }
    i2s_stop(I2S_PORT);
    i2s_driver_uninstall(I2S_PORT);
    m_open = false;
    WL_AUDIO_LOGI("I2S closed (%lu chunks, %lu timeouts, %lu errors)",
                  (unsigned long)m_stats.chunksRead, (unsigned long)m_stats.timeouts,
                  (unsigned long)m_stats.readErrors);
}

} // namespace hal
} // namespace wakelight
