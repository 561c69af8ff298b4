/**
 * WakeLight - DetectionGate Unit Tests
 *
 * Deterministic timestamps; no tasks involved.
 */

#include <unity.h>

#include <cmath>

#include "audio/DetectionGate.h"

using namespace wakelight::audio;

void test_gate_threshold_and_cooldown_sequence() {
    DetectionGate gate(0.3f, 3000, false);
    DetectionEvent event;

    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::BelowThreshold),
                          static_cast<int>(gate.evaluate("A", 0.2f, 1000, event)));

    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.4f, 1000, event)));
    TEST_ASSERT_EQUAL_STRING("A", event.modelName);
    TEST_ASSERT_EQUAL_FLOAT(0.4f, event.score);
    TEST_ASSERT_EQUAL_UINT32(1000, event.timestampMs);

    // 0.5 s later: inside cooldown
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Suppressed),
                          static_cast<int>(gate.evaluate("A", 0.4f, 1500, event)));

    // 3.1 s after the first detection
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.4f, 4100, event)));

    TEST_ASSERT_EQUAL_UINT32(2, gate.getFiredCount());
    TEST_ASSERT_EQUAL_UINT32(1, gate.getSuppressedCount());
}

void test_gate_score_equal_to_threshold_fires() {
    DetectionGate gate(0.5f, 1000, false);
    DetectionEvent event;
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.5f, 0, event)));
}

void test_gate_nan_score_never_fires() {
    DetectionGate gate(0.0f, 0, false);
    DetectionEvent event;
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::BelowThreshold),
                          static_cast<int>(gate.evaluate("A", NAN, 0, event)));
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::BelowThreshold),
                          static_cast<int>(gate.evaluate(nullptr, 1.0f, 0, event)));
}

void test_gate_cooldown_boundary() {
    DetectionGate gate(0.3f, 3000, false);
    DetectionEvent event;
    gate.evaluate("A", 0.9f, 0, event);

    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Suppressed),
                          static_cast<int>(gate.evaluate("A", 0.9f, 2999, event)));
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.9f, 3000, event)));
}

void test_gate_suppressed_does_not_extend_cooldown() {
    DetectionGate gate(0.3f, 3000, false);
    DetectionEvent event;
    gate.evaluate("A", 0.9f, 0, event);
    gate.evaluate("A", 0.9f, 2000, event);

    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.9f, 3000, event)));
}

void test_gate_per_model_cooldown() {
    DetectionGate gate(0.3f, 3000, false);
    DetectionEvent event;

    gate.evaluate("hey_light", 0.9f, 0, event);
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("lights_off", 0.9f, 500, event)));
    TEST_ASSERT_EQUAL_STRING("lights_off", event.modelName);
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Suppressed),
                          static_cast<int>(gate.evaluate("hey_light", 0.9f, 600, event)));
}

void test_gate_shared_cooldown() {
    DetectionGate gate(0.3f, 3000, true);
    DetectionEvent event;

    gate.evaluate("hey_light", 0.9f, 0, event);
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Suppressed),
                          static_cast<int>(gate.evaluate("lights_off", 0.9f, 500, event)));
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("lights_off", 0.9f, 3000, event)));
}

void test_gate_tick_wraparound() {
    DetectionGate gate(0.3f, 3000, false);
    DetectionEvent event;
    const uint32_t nearWrap = 0xFFFFFF00u;

    gate.evaluate("A", 0.9f, nearWrap, event);
    // 256 + 1000 ms later, after the counter wrapped
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Suppressed),
                          static_cast<int>(gate.evaluate("A", 0.9f, 1000, event)));
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.9f, 2800, event)));
}

void test_gate_reset_forgets_history() {
    DetectionGate gate(0.3f, 3000, false);
    DetectionEvent event;
    gate.evaluate("A", 0.9f, 0, event);

    gate.reset();

    TEST_ASSERT_EQUAL_UINT32(0, gate.getFiredCount());
    TEST_ASSERT_EQUAL_INT(static_cast<int>(GateDecision::Fired),
                          static_cast<int>(gate.evaluate("A", 0.9f, 10, event)));
}

void run_detection_gate_tests() {
    RUN_TEST(test_gate_threshold_and_cooldown_sequence);
    RUN_TEST(test_gate_score_equal_to_threshold_fires);
    RUN_TEST(test_gate_nan_score_never_fires);
    RUN_TEST(test_gate_cooldown_boundary);
    RUN_TEST(test_gate_suppressed_does_not_extend_cooldown);
    RUN_TEST(test_gate_per_model_cooldown);
    RUN_TEST(test_gate_shared_cooldown);
    RUN_TEST(test_gate_tick_wraparound);
    RUN_TEST(test_gate_reset_forgets_history);
}
