// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DetectionGate.h
 * @brief Threshold and cooldown debouncing for wake-word scores
 *
 * A score fires when score >= threshold and the cooldown since the last
 * accepted detection has elapsed. Cooldown is tracked per model name, or
 * with one timestamp shared by all models when sharedCooldown is set.
 *
 * Timestamps are milliseconds from any monotonic source; differences use
 * unsigned arithmetic so tick wrap-around is harmless.
 *
 * Only the pipeline task calls evaluate(); not thread-safe.
 */

#pragma once

#include <cstdint>

#include "config/audio_config.h"

namespace wakelight {
namespace audio {

struct DetectionEvent {
    char modelName[MAX_MODEL_NAME];
    float score;
    uint32_t timestampMs;
};

enum class GateDecision : uint8_t {
    BelowThreshold,
    Suppressed,         ///< Above threshold but inside cooldown
    Fired
};

class DetectionGate {
public:
    DetectionGate(float threshold, uint32_t cooldownMs, bool sharedCooldown);

    /**
     * @brief Decide whether (@p modelName, @p score) at @p nowMs fires
     * @param event Filled only when the decision is Fired
     */
    GateDecision evaluate(const char* modelName, float score, uint32_t nowMs,
                          DetectionEvent& event);

    /// Forget all detection history
    void reset();

    float getThreshold() const { return m_threshold; }
    uint32_t getCooldownMs() const { return m_cooldownMs; }
    bool isSharedCooldown() const { return m_sharedCooldown; }

    uint32_t getFiredCount() const { return m_firedCount; }
    uint32_t getSuppressedCount() const { return m_suppressedCount; }

private:
    struct ModelHistory {
        char modelName[MAX_MODEL_NAME];
        uint32_t lastDetectionMs;
    };

    ModelHistory* findHistory(const char* modelName);
    ModelHistory* addHistory(const char* modelName);

    float m_threshold;
    uint32_t m_cooldownMs;
    bool m_sharedCooldown;

    ModelHistory m_history[MAX_MODELS];
    uint8_t m_historyCount;

    bool m_hasSharedDetection;
    uint32_t m_sharedLastMs;

    uint32_t m_firedCount;
    uint32_t m_suppressedCount;
};

} // namespace audio
} // namespace wakelight
