/**
 * WakeLight - Scene Catalog Unit Tests
 *
 * - Static scene lookup and rendering
 * - Animated scene table validity
 */

#include <unity.h>

#include <cstring>
#include <vector>

#include "led/AnimatedScenes.h"
#include "led/SceneCatalog.h"

using namespace wakelight::led;

void test_scene_lookup_by_exact_name() {
    const SceneEntry* off = SceneCatalog::find("off");
    TEST_ASSERT_NOT_NULL(off);
    TEST_ASSERT_EQUAL_STRING("off", off->name);

    TEST_ASSERT_NULL(SceneCatalog::find("OFF"));
    TEST_ASSERT_NULL(SceneCatalog::find("all_re"));
    TEST_ASSERT_NULL(SceneCatalog::find(""));
    TEST_ASSERT_NULL(SceneCatalog::find(nullptr));
}

void test_scene_names_are_unique_across_tables() {
    std::vector<const char*> names;
    for (uint8_t i = 0; i < SceneCatalog::count(); i++) {
        names.push_back(SceneCatalog::at(i)->name);
    }
    for (uint8_t i = 0; i < AnimatedScenes::count(); i++) {
        names.push_back(AnimatedScenes::at(i)->name);
    }

    for (size_t i = 0; i < names.size(); i++) {
        for (size_t j = i + 1; j < names.size(); j++) {
            TEST_ASSERT_TRUE_MESSAGE(strcmp(names[i], names[j]) != 0, names[i]);
        }
    }
    TEST_ASSERT_NULL(SceneCatalog::at(SceneCatalog::count()));
    TEST_ASSERT_NULL(AnimatedScenes::at(AnimatedScenes::count()));
}

void test_scene_static_renders_exact_length() {
    const uint16_t count = 17;
    for (uint8_t s = 0; s < SceneCatalog::count(); s++) {
        // One guard element past the end must stay untouched
        std::vector<Color> out(count + 1, Color(1, 2, 3));
        SceneCatalog::at(s)->render(out.data(), count);
        TEST_ASSERT_TRUE_MESSAGE(out[count] == Color(1, 2, 3), SceneCatalog::at(s)->name);
    }
}

void test_scene_solid_colors() {
    std::vector<Color> out(8);

    SceneCatalog::find("off")->render(out.data(), 8);
    for (const Color& c : out) TEST_ASSERT_TRUE(c.isOff());

    SceneCatalog::find("all_red")->render(out.data(), 8);
    for (const Color& c : out) TEST_ASSERT_TRUE(c == colors::RED);

    SceneCatalog::find("warm_white")->render(out.data(), 8);
    for (const Color& c : out) TEST_ASSERT_TRUE(c == colors::WARM_WHITE);

    SceneCatalog::find("cool_white")->render(out.data(), 8);
    for (const Color& c : out) TEST_ASSERT_TRUE(c == Color(255, 255, 255));

    SceneCatalog::find("idea")->render(out.data(), 8);
    for (const Color& c : out) TEST_ASSERT_TRUE(c == colors::YELLOW);
}

void test_scene_rainbow_spans_the_wheel() {
    std::vector<Color> out(3);
    SceneCatalog::find("rainbow")->render(out.data(), 3);

    TEST_ASSERT_TRUE(out[0] == wheel(0));
    TEST_ASSERT_TRUE(out[1] == wheel(85));
    TEST_ASSERT_TRUE(out[2] == wheel(170));
    TEST_ASSERT_TRUE(out[0] == Color(255, 0, 0));
}

void test_scene_animated_specs_valid() {
    TEST_ASSERT_TRUE(AnimatedScenes::count() >= 2);
    for (uint8_t i = 0; i < AnimatedScenes::count(); i++) {
        TEST_ASSERT_TRUE_MESSAGE(AnimatedScenes::at(i)->isValid(), AnimatedScenes::at(i)->name);
    }

    const AnimatedSceneSpec* ocean = AnimatedScenes::find("ocean");
    TEST_ASSERT_NOT_NULL(ocean);
    TEST_ASSERT_EQUAL_UINT8(3, ocean->colorCount);
    TEST_ASSERT_EQUAL_FLOAT(8.0f, ocean->cycleDurationSec);
    TEST_ASSERT_TRUE(ocean->colors[0] == Color(0, 40, 120));

    TEST_ASSERT_NOT_NULL(AnimatedScenes::find("dreamy"));
    TEST_ASSERT_NULL(AnimatedScenes::find("off"));
}

void test_scene_spec_validation() {
    const Color two[] = {colors::RED, colors::BLUE};
    AnimatedSceneSpec spec = {"t", two, 2, 1.0f, 0.0f, 30};
    TEST_ASSERT_TRUE(spec.isValid());

    spec.cycleDurationSec = 0.0f;
    TEST_ASSERT_FALSE(spec.isValid());
    spec.cycleDurationSec = 1.0f;

    spec.waveSpread = -0.1f;
    TEST_ASSERT_FALSE(spec.isValid());
    spec.waveSpread = 0.0f;

    spec.framesPerSecond = 0;
    TEST_ASSERT_FALSE(spec.isValid());
    spec.framesPerSecond = 30;

    spec.colorCount = 0;
    TEST_ASSERT_FALSE(spec.isValid());
}

void run_scene_tests() {
    RUN_TEST(test_scene_lookup_by_exact_name);
    RUN_TEST(test_scene_names_are_unique_across_tables);
    RUN_TEST(test_scene_static_renders_exact_length);
    RUN_TEST(test_scene_solid_colors);
    RUN_TEST(test_scene_rainbow_spans_the_wheel);
    RUN_TEST(test_scene_animated_specs_valid);
    RUN_TEST(test_scene_spec_validation);
}
