// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#define WL_LOG_TAG "WakeNet"
#include "WakeNetScorer.h"
#include "utils/Log.h"

#include <cstring>

namespace wakelight {
namespace hal {

WakeNetScorer::WakeNetScorer()
    : m_models(nullptr)
    , m_wakenet(nullptr)
    , m_data(nullptr)
    , m_frameSize(0)
    , m_wordCount(0)
    , m_pendingCount(0)
{
    m_modelName[0] = '\0';
}

WakeNetScorer::~WakeNetScorer()
{
    unload();
}

bool WakeNetScorer::load(const char* modelPath)
{
    if (m_data != nullptr) {
        WL_WAKE_LOGW("Model '%s' already loaded", m_modelName);
        return true;
    }

    m_models = esp_srmodel_init(modelPath);
    if (m_models == nullptr) {
        WL_WAKE_LOGE("No esp-sr models at '%s' (flash srmodels.bin)", modelPath);
        return false;
    }

    char* wnName = esp_srmodel_filter(m_models, ESP_WN_PREFIX, NULL);
    if (wnName == nullptr) {
        WL_WAKE_LOGE("No WakeNet model in '%s'", modelPath);
        unload();
        return false;
    }

    m_wakenet = esp_wn_handle_from_name(wnName);
    if (m_wakenet == nullptr) {
        WL_WAKE_LOGE("esp_wn_handle_from_name('%s') failed", wnName);
        unload();
        return false;
    }

    m_data = m_wakenet->create(wnName, DET_MODE_95);
    if (m_data == nullptr) {
        WL_WAKE_LOGE("WakeNet create('%s') failed", wnName);
        unload();
        return false;
    }

    strncpy(m_modelName, wnName, sizeof(m_modelName) - 1);
    m_modelName[sizeof(m_modelName) - 1] = '\0';

    m_frameSize = m_wakenet->get_samp_chunksize(m_data);
    m_wordCount = m_wakenet->get_word_num(m_data);
    if (m_wordCount > static_cast<int>(audio::MAX_MODELS)) {
        WL_WAKE_LOGW("Model has %d wake words, scoring first %u",
                     m_wordCount, static_cast<unsigned>(audio::MAX_MODELS));
        m_wordCount = audio::MAX_MODELS;
    }
    m_pending.assign(static_cast<size_t>(m_frameSize), 0);
    m_pendingCount = 0;

    WL_WAKE_LOGI("Loaded %s: %d word(s), %d samples per frame, %d Hz",
                 m_modelName, m_wordCount, m_frameSize,
                 m_wakenet->get_samp_rate(m_data));
    for (int i = 0; i < m_wordCount; i++) {
        WL_WAKE_LOGD("  word %d: %s", i + 1, m_wakenet->get_word_name(m_data, i + 1));
    }
    return true;
}

bool WakeNetScorer::predict(const int16_t* samples, size_t count, ScoreSet& scores)
{
    if (m_data == nullptr || samples == nullptr || m_frameSize <= 0) {
        return false;
    }

    int triggered = 0;
    const size_t frameSize = static_cast<size_t>(m_frameSize);

    size_t consumed = 0;
    while (consumed < count) {
        size_t take = frameSize - m_pendingCount;
        if (take > count - consumed) {
            take = count - consumed;
        }
        memcpy(&m_pending[m_pendingCount], samples + consumed, take * sizeof(int16_t));
        m_pendingCount += take;
        consumed += take;

        if (m_pendingCount == frameSize) {
            int result = static_cast<int>(m_wakenet->detect(m_data, m_pending.data()));
            if (result > 0 && triggered == 0) {
                triggered = result;
            }
            m_pendingCount = 0;
        }
    }

    for (int i = 0; i < m_wordCount; i++) {
        const char* word = m_wakenet->get_word_name(m_data, i + 1);
        scores.add(word != nullptr ? word : m_modelName, (triggered == i + 1) ? 1.0f : 0.0f);
    }
    return true;
}

void WakeNetScorer::unload()
{
    if (m_data != nullptr && m_wakenet != nullptr) {
        m_wakenet->destroy(m_data);
    }
    m_data = nullptr;
    m_wakenet = nullptr;

    if (m_models != nullptr) {
        esp_srmodel_deinit(m_models);
        m_models = nullptr;
    }

    m_modelName[0] = '\0';
    m_frameSize = 0;
    m_wordCount = 0;
    m_pending.clear();
    m_pendingCount = 0;
}

} // namespace hal
} // namespace wakelight
