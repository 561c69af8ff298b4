// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WakeNetScorer.h
 * @brief esp-sr WakeNet wake-word scorer
 *
 * WakeNet consumes fixed frames (get_samp_chunksize) and reports a trigger
 * rather than a probability. Each wake word in the loaded model becomes one
 * entry in the ScoreSet: 1.0 if it triggered anywhere in the window, else 0.0.
 *
 * Samples left over after the last whole frame are carried into the next
 * predict() call.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "esp_wn_iface.h"
#include "esp_wn_models.h"
#include "model_path.h"

#include "hal/interface/IWakeWordScorer.h"

namespace wakelight {
namespace hal {

class WakeNetScorer : public IWakeWordScorer {
public:
    WakeNetScorer();
    ~WakeNetScorer() override;

    /**
     * @param modelPath esp-sr model location: partition label ("model") or
     *        a mounted directory holding srmodels
     */
    bool load(const char* modelPath) override;
    bool predict(const int16_t* samples, size_t count, ScoreSet& scores) override;
    void unload() override;

    bool isLoaded() const { return m_data != nullptr; }
    const char* getModelName() const { return m_modelName; }

private:
    srmodel_list_t* m_models;
    const esp_wn_iface_t* m_wakenet;
    model_iface_data_t* m_data;
    char m_modelName[audio::MAX_MODEL_NAME];

    int m_frameSize;
    int m_wordCount;
    std::vector<int16_t> m_pending;
    size_t m_pendingCount;
};

} // namespace hal
} // namespace wakelight
