/**
 * WakeLight - DebugConfig Unit Tests
 */

#include <unity.h>

#include "config/DebugConfig.h"

using namespace wakelight::config;

void test_debug_defaults_follow_global() {
    DebugConfig cfg;
    TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(DebugLevel::WARN), cfg.globalLevel);
    TEST_ASSERT_TRUE(cfg.shouldLog(DebugDomain::WAKE, DebugLevel::WARN));
    TEST_ASSERT_FALSE(cfg.shouldLog(DebugDomain::WAKE, DebugLevel::INFO));
}

void test_debug_global_level_command() {
    DebugConfig cfg;
    TEST_ASSERT_TRUE(applyDebugCommand(cfg, "4"));
    TEST_ASSERT_EQUAL_UINT8(4, cfg.globalLevel);
    TEST_ASSERT_TRUE(cfg.shouldLog(DebugDomain::LED, DebugLevel::VERBOSE));
}

void test_debug_domain_override_and_reset() {
    DebugConfig cfg;
    TEST_ASSERT_TRUE(applyDebugCommand(cfg, "wake 5"));
    TEST_ASSERT_EQUAL_UINT8(5, cfg.effectiveLevel(DebugDomain::WAKE));
    TEST_ASSERT_EQUAL_UINT8(2, cfg.effectiveLevel(DebugDomain::AUDIO));

    TEST_ASSERT_TRUE(applyDebugCommand(cfg, "WAKE -"));
    TEST_ASSERT_EQUAL_UINT8(2, cfg.effectiveLevel(DebugDomain::WAKE));

    TEST_ASSERT_TRUE(applyDebugCommand(cfg, "network 0"));
    TEST_ASSERT_FALSE(cfg.shouldLog(DebugDomain::NETWORK, DebugLevel::ERROR));
}

void test_debug_rejects_malformed_commands() {
    DebugConfig cfg;
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, ""));
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, "6"));
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, "3x"));
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, "radio 3"));
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, "led 9"));
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, "led 3 extra"));
    TEST_ASSERT_FALSE(applyDebugCommand(cfg, nullptr));

    TEST_ASSERT_EQUAL_UINT8(2, cfg.globalLevel);
    TEST_ASSERT_EQUAL_UINT8(2, cfg.effectiveLevel(DebugDomain::LED));
}

void test_debug_names() {
    TEST_ASSERT_EQUAL_STRING("AUDIO", DebugConfig::domainName(DebugDomain::AUDIO));
    TEST_ASSERT_EQUAL_STRING("TRACE", DebugConfig::levelName(5));
    TEST_ASSERT_EQUAL_STRING("INVALID", DebugConfig::levelName(9));

    DebugDomain domain;
    TEST_ASSERT_TRUE(DebugConfig::parseDomain("sys", domain));
    TEST_ASSERT_EQUAL_INT(static_cast<int>(DebugDomain::SYSTEM), static_cast<int>(domain));
}

void run_debug_config_tests() {
    RUN_TEST(test_debug_defaults_follow_global);
    RUN_TEST(test_debug_global_level_command);
    RUN_TEST(test_debug_domain_override_and_reset);
    RUN_TEST(test_debug_rejects_malformed_commands);
    RUN_TEST(test_debug_names);
}
