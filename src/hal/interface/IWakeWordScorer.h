// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IWakeWordScorer.h
 * @brief Wake-word model interface
 *
 * The scorer consumes 16-bit mono PCM at the pipeline's target rate and
 * returns one score in [0,1] per loaded model.
 *
 * Implementations:
 * - ESP32-S3: WakeNetScorer (esp-sr WakeNet)
 * - Tests: scripted scorer
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "config/audio_config.h"

namespace wakelight {
namespace hal {

struct ModelScore {
    char modelName[audio::MAX_MODEL_NAME];
    float score;
};

struct ScoreSet {
    ModelScore entries[audio::MAX_MODELS];
    uint8_t count = 0;

    void clear() { count = 0; }

    /// @return false when full
    bool add(const char* modelName, float score) {
        if (count >= audio::MAX_MODELS || modelName == nullptr) {
            return false;
        }
        ModelScore& entry = entries[count++];
        strncpy(entry.modelName, modelName, sizeof(entry.modelName) - 1);
        entry.modelName[sizeof(entry.modelName) - 1] = '\0';
        entry.score = score;
        return true;
    }
};

class IWakeWordScorer {
public:
    virtual ~IWakeWordScorer() = default;

    /**
     * @brief Load model(s)
     * @param modelPath Implementation-defined location (partition label, file)
     */
    virtual bool load(const char* modelPath) = 0;

    /**
     * @brief Score one window
     * @return false on a scoring failure (scores undefined)
     */
    virtual bool predict(const int16_t* samples, size_t count, ScoreSet& scores) = 0;

    /**
     * @brief Release model memory. Safe to call when not loaded.
     */
    virtual void unload() = 0;
};

} // namespace hal
} // namespace wakelight
