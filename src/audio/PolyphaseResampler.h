// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PolyphaseResampler.h
 * @brief Rational-ratio polyphase resampler for PCM16 chunks
 *
 * Upsample by L, low-pass, downsample by M, computed only at the kept output
 * positions. The anti-alias FIR is a Kaiser-windowed sinc (beta 5) with
 * 10 * max(L, M) taps on each side and cutoff 1 / max(L, M), scaled for a
 * DC gain of 1 after upsampling. Output length is ceil(n * L / M).
 *
 * Each chunk is filtered independently (zero history), the same as running a
 * block resampler on every chunk.
 *
 * Taps are built once in configure(); process() does not allocate.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace wakelight {
namespace audio {

class PolyphaseResampler {
public:
    PolyphaseResampler();

    /**
     * @brief Build the filter for @p inputRate -> @p outputRate
     * @param maxInputFrames Largest chunk process() will be given
     * @return false if either rate is zero
     */
    bool configure(uint32_t inputRate, uint32_t outputRate, size_t maxInputFrames);

    bool isConfigured() const { return m_up > 0; }

    /// true when configured for equal rates (process() copies)
    bool isPassthrough() const { return m_up == 1 && m_down == 1; }

    uint32_t getUpFactor() const { return m_up; }
    uint32_t getDownFactor() const { return m_down; }
    size_t getTapCount() const { return m_taps.size(); }

    /// ceil(inputFrames * up / down)
    size_t outputLength(size_t inputFrames) const;

    /**
     * @brief Resample one chunk
     * @param outCapacity Size of @p output in samples
     * @return Samples written, 0 if not configured, input too long, or
     *         @p outCapacity too small
     */
    size_t process(const int16_t* input, size_t inputFrames,
                   int16_t* output, size_t outCapacity) const;

private:
    static double besselI0(double x);

    uint32_t m_up;
    uint32_t m_down;
    size_t m_halfLength;
    size_t m_maxInputFrames;
    std::vector<float> m_taps;
};

} // namespace audio
} // namespace wakelight
