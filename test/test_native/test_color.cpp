/**
 * WakeLight - Color Unit Tests
 *
 * - Validated construction from components and hex strings
 * - Hex formatting and parsing agree
 * - lerp endpoints, clamping and per-channel monotonicity
 */

#include <unity.h>

#include <cstring>

#include "led/Color.h"

using namespace wakelight::led;

//==============================================================================
// Construction
//==============================================================================

void test_color_from_components_accepts_full_range() {
    Color c;
    TEST_ASSERT_TRUE(Color::fromComponents(0, 128, 255, c));
    TEST_ASSERT_EQUAL_UINT8(0, c.r);
    TEST_ASSERT_EQUAL_UINT8(128, c.g);
    TEST_ASSERT_EQUAL_UINT8(255, c.b);
}

void test_color_from_components_rejects_out_of_range() {
    Color c(1, 2, 3);
    TEST_ASSERT_FALSE(Color::fromComponents(256, 0, 0, c));
    TEST_ASSERT_FALSE(Color::fromComponents(0, -1, 0, c));
    TEST_ASSERT_FALSE(Color::fromComponents(0, 0, 1000, c));
    TEST_ASSERT_TRUE(c == Color(1, 2, 3));
}

void test_color_from_hex_with_and_without_hash() {
    Color c;
    TEST_ASSERT_TRUE(Color::fromHex("#FF8800", c));
    TEST_ASSERT_TRUE(c == Color(255, 136, 0));

    TEST_ASSERT_TRUE(Color::fromHex("00ff7f", c));
    TEST_ASSERT_TRUE(c == Color(0, 255, 127));
}

void test_color_from_hex_rejects_malformed() {
    const Color original(9, 9, 9);
    const char* bad[] = {"", "#", "#FFF", "#FFFFF", "#FFFFFFF", "#GG0000", "12345G", "##123456", " 123456"};

    for (const char* hex : bad) {
        Color c = original;
        TEST_ASSERT_FALSE_MESSAGE(Color::fromHex(hex, c), hex);
        TEST_ASSERT_TRUE(c == original);
    }

    Color c = original;
    TEST_ASSERT_FALSE(Color::fromHex(nullptr, c));
    TEST_ASSERT_TRUE(c == original);
}

void test_color_to_hex_format() {
    char buf[Color::HEX_STRING_SIZE];
    TEST_ASSERT_EQUAL_size_t(7, Color(255, 10, 171).toHex(buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("#FF0AAB", buf);

    char small[4];
    TEST_ASSERT_EQUAL_size_t(0, Color(1, 2, 3).toHex(small, sizeof(small)));
}

void test_color_hex_round_trip() {
    // Each channel over its full range, the others at boundary values
    const uint8_t others[] = {0, 127, 255};
    char buf[Color::HEX_STRING_SIZE];

    for (int v = 0; v <= 255; v++) {
        for (uint8_t o : others) {
            const Color probes[] = {
                Color(static_cast<uint8_t>(v), o, o),
                Color(o, static_cast<uint8_t>(v), o),
                Color(o, o, static_cast<uint8_t>(v)),
            };
            for (const Color& c : probes) {
                c.toHex(buf, sizeof(buf));
                Color parsed;
                TEST_ASSERT_TRUE(Color::fromHex(buf, parsed));
                TEST_ASSERT_TRUE(parsed == c);
            }
        }
    }
}

void test_color_packed() {
    TEST_ASSERT_EQUAL_HEX32(0x123456, Color(0x12, 0x34, 0x56).packed());
    TEST_ASSERT_TRUE(colors::OFF.isOff());
    TEST_ASSERT_FALSE(colors::YELLOW.isOff());
}

//==============================================================================
// Interpolation
//==============================================================================

void test_color_lerp_endpoints() {
    const Color a(10, 200, 30);
    const Color b(250, 0, 90);

    TEST_ASSERT_TRUE(Color::lerp(a, b, 0.0f) == a);
    TEST_ASSERT_TRUE(Color::lerp(a, b, 1.0f) == b);
}

void test_color_lerp_clamps_t() {
    const Color a(10, 200, 30);
    const Color b(250, 0, 90);

    TEST_ASSERT_TRUE(Color::lerp(a, b, -0.5f) == a);
    TEST_ASSERT_TRUE(Color::lerp(a, b, 7.0f) == b);
}

void test_color_lerp_midpoint() {
    Color mid = Color::lerp(Color(0, 0, 0), Color(200, 100, 50), 0.5f);
    TEST_ASSERT_EQUAL_UINT8(100, mid.r);
    TEST_ASSERT_EQUAL_UINT8(50, mid.g);
    TEST_ASSERT_EQUAL_UINT8(25, mid.b);
}

void test_color_lerp_monotonic_per_channel() {
    const Color a(0, 255, 10);
    const Color b(255, 0, 200);
    Color prev = a;

    for (int step = 1; step <= 100; step++) {
        Color c = Color::lerp(a, b, step / 100.0f);
        TEST_ASSERT_TRUE(c.r >= prev.r);
        TEST_ASSERT_TRUE(c.g <= prev.g);
        TEST_ASSERT_TRUE(c.b >= prev.b);
        prev = c;
    }
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_color_tests() {
    RUN_TEST(test_color_from_components_accepts_full_range);
    RUN_TEST(test_color_from_components_rejects_out_of_range);
    RUN_TEST(test_color_from_hex_with_and_without_hash);
    RUN_TEST(test_color_from_hex_rejects_malformed);
    RUN_TEST(test_color_to_hex_format);
    RUN_TEST(test_color_hex_round_trip);
    RUN_TEST(test_color_packed);
    RUN_TEST(test_color_lerp_endpoints);
    RUN_TEST(test_color_lerp_clamps_t);
    RUN_TEST(test_color_lerp_midpoint);
    RUN_TEST(test_color_lerp_monotonic_per_channel);
}
