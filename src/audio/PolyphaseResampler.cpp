// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PolyphaseResampler.cpp
 * @brief Polyphase resampler implementation
 *
 * Output sample k sits at upsampled position p = k * M. With the FIR centred
 * at halfLength:
 *   y[k] = sum over n of x[n] * h[p + halfLength - n * L]
 * only for taps inside [0, taps). That is one polyphase branch per output.
 */

#define WL_LOG_TAG "Resample"
#include "PolyphaseResampler.h"
#include "../utils/Log.h"

#include <cmath>

namespace wakelight {
namespace audio {

namespace {

constexpr double KAISER_BETA = 5.0;
constexpr uint32_t HALF_LENGTH_FACTOR = 10;
constexpr double PI = 3.14159265358979323846;

uint32_t gcd(uint32_t a, uint32_t b) {
    while (b != 0) {
        uint32_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

} // namespace

PolyphaseResampler::PolyphaseResampler()
    : m_up(0)
    , m_down(0)
    , m_halfLength(0)
    , m_maxInputFrames(0)
{
}

double PolyphaseResampler::besselI0(double x) {
    // Power series; converges quickly for the beta values used here
    double sum = 1.0;
    double term = 1.0;
    const double halfX = x / 2.0;
    for (int k = 1; k < 50; k++) {
        term *= (halfX / k) * (halfX / k);
        sum += term;
        if (term < sum * 1e-12) {
            break;
        }
    }
    return sum;
}

bool PolyphaseResampler::configure(uint32_t inputRate, uint32_t outputRate, size_t maxInputFrames) {
    if (inputRate == 0 || outputRate == 0) {
        WL_AUDIO_LOGE("Invalid rates %lu -> %lu", (unsigned long)inputRate, (unsigned long)outputRate);
        m_up = 0;
        m_down = 0;
        m_taps.clear();
        return false;
    }

    const uint32_t g = gcd(inputRate, outputRate);
    m_up = outputRate / g;
    m_down = inputRate / g;
    m_maxInputFrames = maxInputFrames;

    if (isPassthrough()) {
        m_halfLength = 0;
        m_taps.assign(1, 1.0f);
        return true;
    }

    const uint32_t maxRate = (m_up > m_down) ? m_up : m_down;
    const double cutoff = 1.0 / static_cast<double>(maxRate);
    m_halfLength = static_cast<size_t>(HALF_LENGTH_FACTOR) * maxRate;
    const size_t tapCount = 2 * m_halfLength + 1;

    std::vector<double> taps(tapCount);
    const double i0Beta = besselI0(KAISER_BETA);
    double sum = 0.0;

    for (size_t i = 0; i < tapCount; i++) {
        const double t = static_cast<double>(i) - static_cast<double>(m_halfLength);

        // Ideal low-pass: cutoff * sinc(cutoff * t)
        const double arg = PI * cutoff * t;
        const double sinc = (t == 0.0) ? 1.0 : sin(arg) / arg;

        // Kaiser window
        const double ratio = t / static_cast<double>(m_halfLength);
        const double window = besselI0(KAISER_BETA * sqrt(1.0 - ratio * ratio)) / i0Beta;

        taps[i] = cutoff * sinc * window;
        sum += taps[i];
    }

    // Unity DC gain after zero-stuffing by m_up
    m_taps.resize(tapCount);
    for (size_t i = 0; i < tapCount; i++) {
        m_taps[i] = static_cast<float>(taps[i] / sum * m_up);
    }

    WL_AUDIO_LOGI("Resampler %lu -> %lu Hz (up=%lu down=%lu, %u taps)",
                  (unsigned long)inputRate, (unsigned long)outputRate,
                  (unsigned long)m_up, (unsigned long)m_down, (unsigned)tapCount);
    return true;
}

size_t PolyphaseResampler::outputLength(size_t inputFrames) const {
    if (m_down == 0) {
        return 0;
    }
    return (inputFrames * m_up + m_down - 1) / m_down;
}

size_t PolyphaseResampler::process(const int16_t* input, size_t inputFrames,
                                   int16_t* output, size_t outCapacity) const {
    if (!isConfigured() || input == nullptr || output == nullptr) {
        return 0;
    }
    if (inputFrames > m_maxInputFrames) {
        WL_AUDIO_LOGW("Chunk of %u frames exceeds configured %u",
                      (unsigned)inputFrames, (unsigned)m_maxInputFrames);
        return 0;
    }

    const size_t outLen = outputLength(inputFrames);
    if (outLen > outCapacity) {
        return 0;
    }

    if (isPassthrough()) {
        for (size_t i = 0; i < inputFrames; i++) {
            output[i] = input[i];
        }
        return inputFrames;
    }

    const long tapCount = static_cast<long>(m_taps.size());
    const long up = static_cast<long>(m_up);
    const long half = static_cast<long>(m_halfLength);

    for (size_t k = 0; k < outLen; k++) {
        // Tap index for input n is base - n * up; keep it within [0, tapCount)
        const long base = static_cast<long>(k) * static_cast<long>(m_down) + half;

        long nFirst = (base - (tapCount - 1) + up - 1) / up;
        if (base - (tapCount - 1) <= 0) {
            nFirst = 0;
        }
        long nLast = base / up;
        if (nLast > static_cast<long>(inputFrames) - 1) {
            nLast = static_cast<long>(inputFrames) - 1;
        }

        float acc = 0.0f;
        for (long n = nFirst; n <= nLast; n++) {
            acc += static_cast<float>(input[n]) * m_taps[base - n * up];
        }

        if (acc > 32767.0f) {
            acc = 32767.0f;
        } else if (acc < -32768.0f) {
            acc = -32768.0f;
        }
        output[k] = static_cast<int16_t>(acc);
    }

    return outLen;
}

} // namespace audio
} // namespace wakelight
