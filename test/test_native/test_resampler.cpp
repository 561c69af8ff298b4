/**
 * WakeLight - PolyphaseResampler Unit Tests
 */

#include <unity.h>

#include <vector>

#include "audio/PolyphaseResampler.h"

using wakelight::audio::PolyphaseResampler;

void test_resample_ratio_reduced_by_gcd() {
    PolyphaseResampler r;
    TEST_ASSERT_TRUE(r.configure(44100, 16000, 1280));
    TEST_ASSERT_EQUAL_UINT32(160, r.getUpFactor());
    TEST_ASSERT_EQUAL_UINT32(441, r.getDownFactor());
    TEST_ASSERT_FALSE(r.isPassthrough());
    // 2 * 10 * max(up, down) + 1
    TEST_ASSERT_EQUAL_size_t(8821, r.getTapCount());
}

void test_resample_44100_chunk_preserves_duration() {
    PolyphaseResampler r;
    TEST_ASSERT_TRUE(r.configure(44100, 16000, 1280));

    std::vector<int16_t> in(1280, 0);
    std::vector<int16_t> out(r.outputLength(1280));
    size_t produced = r.process(in.data(), in.size(), out.data(), out.size());

    // 1280 * 16000 / 44100 = 464.4
    TEST_ASSERT_TRUE(produced >= 464 && produced <= 465);
    TEST_ASSERT_EQUAL_size_t(465, produced);
}

void test_resample_preserves_dc_level() {
    PolyphaseResampler r;
    TEST_ASSERT_TRUE(r.configure(44100, 16000, 1280));

    std::vector<int16_t> in(1280, 1000);
    std::vector<int16_t> out(r.outputLength(1280));
    size_t produced = r.process(in.data(), in.size(), out.data(), out.size());
    TEST_ASSERT_EQUAL_size_t(465, produced);

    // Away from the edges the filter sees a full window of constant input
    for (size_t k = 100; k < 365; k += 20) {
        TEST_ASSERT_INT_WITHIN(20, 1000, out[k]);
    }
}

void test_resample_integer_decimation() {
    PolyphaseResampler r;
    TEST_ASSERT_TRUE(r.configure(48000, 16000, 3840));
    TEST_ASSERT_EQUAL_UINT32(1, r.getUpFactor());
    TEST_ASSERT_EQUAL_UINT32(3, r.getDownFactor());
    TEST_ASSERT_EQUAL_size_t(1280, r.outputLength(3840));

    std::vector<int16_t> in(3840, -2000);
    std::vector<int16_t> out(1280);
    TEST_ASSERT_EQUAL_size_t(1280, r.process(in.data(), in.size(), out.data(), out.size()));
    TEST_ASSERT_INT_WITHIN(40, -2000, out[640]);
}

void test_resample_passthrough_copies() {
    PolyphaseResampler r;
    TEST_ASSERT_TRUE(r.configure(16000, 16000, 4));
    TEST_ASSERT_TRUE(r.isPassthrough());

    const int16_t in[] = {1, -2, 300, -32768};
    int16_t out[4] = {0, 0, 0, 0};
    TEST_ASSERT_EQUAL_size_t(4, r.process(in, 4, out, 4));
    TEST_ASSERT_EQUAL_INT16_ARRAY(in, out, 4);
}

void test_resample_rejects_bad_input() {
    PolyphaseResampler r;
    TEST_ASSERT_FALSE(r.configure(0, 16000, 1280));
    TEST_ASSERT_FALSE(r.isConfigured());

    int16_t buf[8] = {0};
    TEST_ASSERT_EQUAL_size_t(0, r.process(buf, 8, buf, 8));

    TEST_ASSERT_TRUE(r.configure(44100, 16000, 1280));
    std::vector<int16_t> in(1281, 0);
    std::vector<int16_t> out(1000);
    // More frames than configured
    TEST_ASSERT_EQUAL_size_t(0, r.process(in.data(), in.size(), out.data(), out.size()));
    // Output buffer too small
    TEST_ASSERT_EQUAL_size_t(0, r.process(in.data(), 1280, out.data(), 100));
}

void test_resample_bessel_i0() {
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, static_cast<float>(PolyphaseResampler::besselI0(0.0)));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 27.239872f, static_cast<float>(PolyphaseResampler::besselI0(5.0)));
}

void run_resampler_tests() {
    RUN_TEST(test_resample_ratio_reduced_by_gcd);
    RUN_TEST(test_resample_44100_chunk_preserves_duration);
    RUN_TEST(test_resample_preserves_dc_level);
    RUN_TEST(test_resample_integer_decimation);
    RUN_TEST(test_resample_passthrough_copies);
    RUN_TEST(test_resample_rejects_bad_input);
    RUN_TEST(test_resample_bessel_i0);
}
