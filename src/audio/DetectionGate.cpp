// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#define WL_LOG_TAG "Gate"
#include "DetectionGate.h"
#include "../utils/Log.h"

#include <cstring>

namespace wakelight {
namespace audio {

DetectionGate::DetectionGate(float threshold, uint32_t cooldownMs, bool sharedCooldown)
    : m_threshold(threshold)
    , m_cooldownMs(cooldownMs)
    , m_sharedCooldown(sharedCooldown)
    , m_historyCount(0)
    , m_hasSharedDetection(false)
    , m_sharedLastMs(0)
    , m_firedCount(0)
    , m_suppressedCount(0)
{
    memset(m_history, 0, sizeof(m_history));
}

void DetectionGate::reset() {
    memset(m_history, 0, sizeof(m_history));
    m_historyCount = 0;
    m_hasSharedDetection = false;
    m_sharedLastMs = 0;
    m_firedCount = 0;
    m_suppressedCount = 0;
}

GateDecision DetectionGate::evaluate(const char* modelName, float score, uint32_t nowMs,
                                     DetectionEvent& event) {
    if (modelName == nullptr || !(score >= m_threshold)) {
        return GateDecision::BelowThreshold;
    }

    ModelHistory* history = nullptr;
    bool seen = false;
    uint32_t lastMs = 0;

    if (m_sharedCooldown) {
        seen = m_hasSharedDetection;
        lastMs = m_sharedLastMs;
    } else {
        history = findHistory(modelName);
        if (history != nullptr) {
            seen = true;
            lastMs = history->lastDetectionMs;
        }
    }

    if (seen && (nowMs - lastMs) < m_cooldownMs) {
        m_suppressedCount++;
        WL_WAKE_LOGD("'%s' %.3f suppressed (%lu ms into %lu ms cooldown)", modelName, score,
                     (unsigned long)(nowMs - lastMs), (unsigned long)m_cooldownMs);
        return GateDecision::Suppressed;
    }

    if (m_sharedCooldown) {
        m_hasSharedDetection = true;
        m_sharedLastMs = nowMs;
    } else {
        if (history == nullptr) {
            history = addHistory(modelName);
        }
        if (history != nullptr) {
            history->lastDetectionMs = nowMs;
        } else {
            WL_WAKE_LOGW("Model history full, '%s' has no cooldown", modelName);
        }
    }

    strncpy(event.modelName, modelName, sizeof(event.modelName) - 1);
    event.modelName[sizeof(event.modelName) - 1] = '\0';
    event.score = score;
    event.timestampMs = nowMs;
    m_firedCount++;
    return GateDecision::Fired;
}

DetectionGate::ModelHistory* DetectionGate::findHistory(const char* modelName) {
    for (uint8_t i = 0; i < m_historyCount; i++) {
        if (strncmp(m_history[i].modelName, modelName, sizeof(m_history[i].modelName) - 1) == 0) {
            return &m_history[i];
        }
    }
    return nullptr;
}

DetectionGate::ModelHistory* DetectionGate::addHistory(const char* modelName) {
    if (m_historyCount >= MAX_MODELS) {
        return nullptr;
    }
    ModelHistory& entry = m_history[m_historyCount++];
    strncpy(entry.modelName, modelName, sizeof(entry.modelName) - 1);
    entry.modelName[sizeof(entry.modelName) - 1] = '\0';
    entry.lastDetectionMs = 0;
    return &entry;
}

} // namespace audio
} // namespace wakelight
