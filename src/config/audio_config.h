// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file audio_config.h
 * @brief Audio capture and wake-word pipeline defaults
 *
 * The scorer consumes 16 kHz mono PCM16. 1280 samples = 80 ms per chunk.
 */

#pragma once

#include <cstdint>

namespace wakelight {
namespace audio {

constexpr uint32_t DEFAULT_SAMPLE_RATE = 16000;
constexpr uint32_t DEFAULT_CHUNK_SIZE = 1280;
constexpr int32_t DEFAULT_DEVICE_INDEX = -1;   ///< -1 = auto select

constexpr float DEFAULT_THRESHOLD = 0.5f;
constexpr float DEFAULT_COOLDOWN_SECONDS = 3.0f;

constexpr const char* DEFAULT_MODEL_PATH = "model";

// Scores above this are logged at VERBOSE
constexpr float SCORE_LOG_FLOOR = 0.01f;

// Pipeline task
constexpr uint32_t PIPELINE_TASK_STACK = 8192;
constexpr uint8_t PIPELINE_TASK_PRIORITY = 4;
constexpr int8_t PIPELINE_TASK_CORE = 0;

constexpr uint32_t START_POLL_INTERVAL_MS = 100;
constexpr uint32_t START_POLL_ATTEMPTS = 100;   ///< 10 s total
constexpr uint32_t STOP_TIMEOUT_MS = 2000;
constexpr uint32_t ERROR_BACKOFF_MIN_MS = 100;
constexpr uint32_t ERROR_BACKOFF_MAX_MS = 1000;

constexpr uint8_t MAX_MODELS = 8;
constexpr uint8_t MAX_MODEL_NAME = 32;
constexpr uint8_t MAX_DEVICE_NAME = 32;

// ============================================================================
// I2S Pin Configuration (INMP441 on the legacy driver)
// ============================================================================

constexpr int I2S_BCLK_PIN = 14;
constexpr int I2S_LRCL_PIN = 12;
constexpr int I2S_DIN_PIN = 13;
constexpr uint32_t I2S_DMA_BUFFER_COUNT = 4;
constexpr uint32_t I2S_DMA_BUFFER_SAMPLES = 512;

// INMP441: 24-bit, LEFT channel, >>8 shift
constexpr int I2S_SAMPLE_SHIFT = 8;

} // namespace audio
} // namespace wakelight
