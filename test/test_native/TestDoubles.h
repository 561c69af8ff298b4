/**
 * WakeLight - Test doubles for native unit tests
 *
 * - RecordingSink: IHardwareSink that records pixels, flushes, brightness,
 *   and flushes whose pixels were not all one color
 * - RecordingTarget: IAnimationTarget that counts frames
 * - FakeAudioSource: scripted devices, rates and read results
 * - ScriptedScorer: returns whatever scores the test sets
 *
 * All doubles are called from task threads, so their state is guarded.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "hal/interface/IAudioSource.h"
#include "hal/interface/IHardwareSink.h"
#include "hal/interface/IWakeWordScorer.h"
#include "led/AnimationEngine.h"

namespace wakelight {
namespace test {

/**
 * @brief Poll @p condition every 5 ms for up to @p timeoutMs
 */
inline bool waitUntil(std::function<bool()> condition, uint32_t timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

inline void sleepMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

//==============================================================================
// LED
//==============================================================================

class RecordingSink : public hal::IHardwareSink {
public:
    explicit RecordingSink(uint16_t count) : m_pixels(count, 0) {}

    void setPixel(uint16_t index, uint32_t packedColor) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (index < m_pixels.size()) {
            m_pixels[index] = packedColor;
        }
        m_pixelWrites++;
    }

    void show() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (uint32_t px : m_pixels) {
            if (px != m_pixels[0]) {
                m_mixedShows++;
                break;
            }
        }
        m_shows++;
    }

    void setBrightness(uint8_t level) override { m_brightness = level; }

    uint32_t pixel(uint16_t index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pixels[index];
    }

    uint32_t pixelWrites() { return m_pixelWrites.load(); }
    uint32_t shows() { return m_shows.load(); }
    uint32_t mixedShows() { return m_mixedShows.load(); }
    uint8_t brightness() { return m_brightness.load(); }

private:
    std::mutex m_mutex;
    std::vector<uint32_t> m_pixels;
    std::atomic<uint32_t> m_pixelWrites{0};
    std::atomic<uint32_t> m_shows{0};
    std::atomic<uint32_t> m_mixedShows{0};
    std::atomic<uint8_t> m_brightness{0};
};

class RecordingTarget : public led::IAnimationTarget {
public:
    explicit RecordingTarget(uint16_t count) : m_count(count), m_last(count) {}

    uint16_t getLedCount() const override { return m_count; }

    void writeAnimationFrame(const led::Color* frame, uint16_t count) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last.assign(frame, frame + count);
        m_lastCount = count;
        m_frames++;
    }

    uint32_t frames() { return m_frames.load(); }

    uint16_t lastCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastCount;
    }

private:
    const uint16_t m_count;
    std::mutex m_mutex;
    std::vector<led::Color> m_last;
    uint16_t m_lastCount = 0;
    std::atomic<uint32_t> m_frames{0};
};

//==============================================================================
// Audio
//==============================================================================

class FakeAudioSource : public hal::IAudioSource {
public:
    void addDevice(const char* name, uint32_t nativeRate, std::vector<uint32_t> supportedRates) {
        Device d;
        d.info.index = static_cast<uint8_t>(m_devices.size());
        strncpy(d.info.name, name, sizeof(d.info.name) - 1);
        d.info.defaultSampleRate = nativeRate;
        d.info.maxInputChannels = 1;
        d.rates = std::move(supportedRates);
        m_devices.push_back(d);
    }

    uint8_t getDeviceCount() override { return static_cast<uint8_t>(m_devices.size()); }

    bool getDeviceInfo(uint8_t index, hal::AudioDeviceInfo& info) override {
        if (index >= m_devices.size()) {
            return false;
        }
        info = m_devices[index].info;
        return true;
    }

    bool isSampleRateSupported(uint8_t index, uint32_t sampleRate) override {
        if (index >= m_devices.size()) {
            return false;
        }
        for (uint32_t r : m_devices[index].rates) {
            if (r == sampleRate) {
                return true;
            }
        }
        return false;
    }

    hal::AudioHandle open(const hal::AudioStreamConfig& config) override {
        m_opens++;
        if (failOpen) {
            return hal::INVALID_AUDIO_HANDLE;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastConfig = config;
        m_isOpen = true;
        return 7;
    }

    hal::CaptureResult read(hal::AudioHandle handle, int16_t* buffer, size_t frames) override {
        sleepMs(readDelayMs);
        if (stallReads.load()) {
            m_stalls++;
            for (int i = 0; i < 1000 && stallReads.load(); i++) {
                sleepMs(5);
            }
        }
        if (handle != 7 || !m_isOpen.load()) {
            return hal::CaptureResult::NotOpen;
        }
        uint32_t n = m_reads++;
        if (n < failingReads.load()) {
            return hal::CaptureResult::ReadError;
        }
        for (size_t i = 0; i < frames; i++) {
            buffer[i] = 0;
        }
        return hal::CaptureResult::Success;
    }

    void close(hal::AudioHandle handle) override {
        if (handle == 7) {
            m_isOpen = false;
            m_closes++;
        }
    }

    hal::AudioStreamConfig lastConfig() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastConfig;
    }

    uint32_t opens() { return m_opens.load(); }
    uint32_t closes() { return m_closes.load(); }
    uint32_t reads() { return m_reads.load(); }
    bool isOpen() { return m_isOpen.load(); }
    uint32_t stalls() { return m_stalls.load(); }

    bool failOpen = false;
    std::atomic<uint32_t> failingReads{0};     ///< First N reads return ReadError
    uint32_t readDelayMs = 5;
    std::atomic<bool> stallReads{false};       ///< Reads block until cleared (5 s cap)

private:
    struct Device {
        hal::AudioDeviceInfo info;
        std::vector<uint32_t> rates;
    };

    std::vector<Device> m_devices;
    std::mutex m_mutex;
    hal::AudioStreamConfig m_lastConfig;
    std::atomic<bool> m_isOpen{false};
    std::atomic<uint32_t> m_opens{0};
    std::atomic<uint32_t> m_closes{0};
    std::atomic<uint32_t> m_reads{0};
    std::atomic<uint32_t> m_stalls{0};
};

class ScriptedScorer : public hal::IWakeWordScorer {
public:
    bool load(const char* modelPath) override {
        m_loads++;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastPath = modelPath ? modelPath : "";
        if (failLoad) {
            return false;
        }
        m_loaded = true;
        return true;
    }

    bool predict(const int16_t* samples, size_t count, hal::ScoreSet& scores) override {
        (void)samples;
        m_predicts++;
        m_lastWindow = count;
        if (failPredict.load()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_scores) {
            scores.add(entry.first.c_str(), entry.second);
        }
        return true;
    }

    void unload() override {
        m_unloads++;
        m_loaded = false;
    }

    void setScores(std::vector<std::pair<std::string, float>> scores) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scores = std::move(scores);
    }

    std::string lastPath() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastPath;
    }

    uint32_t loads() { return m_loads.load(); }
    uint32_t unloads() { return m_unloads.load(); }
    uint32_t predicts() { return m_predicts.load(); }
    size_t lastWindow() { return m_lastWindow.load(); }
    bool isLoaded() { return m_loaded.load(); }

    bool failLoad = false;
    std::atomic<bool> failPredict{false};

private:
    std::mutex m_mutex;
    std::vector<std::pair<std::string, float>> m_scores;
    std::string m_lastPath;
    std::atomic<bool> m_loaded{false};
    std::atomic<uint32_t> m_loads{0};
    std::atomic<uint32_t> m_unloads{0};
    std::atomic<uint32_t> m_predicts{0};
    std::atomic<size_t> m_lastWindow{0};
};

} // namespace test
} // namespace wakelight
