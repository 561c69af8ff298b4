// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.h
 * @brief Runtime debug verbosity per domain
 *
 * Levels:
 *   0 = OFF
 *   1 = ERROR    - Actual failures
 *   2 = WARN     - Errors + actionable warnings (default)
 *   3 = INFO     - Warn + significant events
 *   4 = VERBOSE  - Info + diagnostic values
 *   5 = TRACE    - Everything (per-frame, per-chunk)
 *
 * The global level comes from "debug.level" in /config.json.
 */

#pragma once

#include <cstdint>

namespace wakelight {
namespace config {

enum class DebugDomain : uint8_t {
    LED = 0,
    AUDIO = 1,
    WAKE = 2,
    NETWORK = 3,
    SYSTEM = 4,
    _COUNT = 5
};

/**
 * @brief Debug levels
 *
 * VERBOSE instead of DEBUG to avoid collision with a DEBUG macro.
 */
enum class DebugLevel : uint8_t {
    OFF = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    VERBOSE = 4,
    TRACE = 5
};

struct DebugConfig {
    /// Global verbosity level (affects all domains unless overridden)
    uint8_t globalLevel = static_cast<uint8_t>(DebugLevel::WARN);

    /// Domain-specific overrides (-1 = use global level)
    int8_t domainLevels[static_cast<uint8_t>(DebugDomain::_COUNT)] = {-1, -1, -1, -1, -1};

    uint8_t effectiveLevel(DebugDomain domain) const {
        uint8_t idx = static_cast<uint8_t>(domain);
        if (idx >= static_cast<uint8_t>(DebugDomain::_COUNT)) {
            return globalLevel;
        }
        int8_t domainLevel = domainLevels[idx];
        return (domainLevel >= 0) ? static_cast<uint8_t>(domainLevel) : globalLevel;
    }

    /**
     * @brief Set domain-specific level
     * @param level Level to set (-1 to use global)
     */
    void setDomainLevel(DebugDomain domain, int8_t level) {
        uint8_t idx = static_cast<uint8_t>(domain);
        if (idx < static_cast<uint8_t>(DebugDomain::_COUNT)) {
            domainLevels[idx] = level;
        }
    }

    bool shouldLog(DebugDomain domain, DebugLevel level) const {
        return effectiveLevel(domain) >= static_cast<uint8_t>(level);
    }

    static const char* domainName(DebugDomain domain);
    static const char* levelName(uint8_t level);

    /// Case-insensitive domain lookup ("led", "audio", "wake", "net", "sys")
    static bool parseDomain(const char* name, DebugDomain& out);
};

/**
 * @brief Apply a serial "dbg" argument string
 *
 *   "3"        global level
 *   "wake 5"   override one domain
 *   "wake -"   drop the override, follow global again
 *
 * @return false if the arguments are malformed (nothing changed)
 */
bool applyDebugCommand(DebugConfig& cfg, const char* args);

/**
 * @brief Get the process-wide debug configuration
 */
DebugConfig& getDebugConfig();

/**
 * @brief Reset debug configuration to defaults
 */
void resetDebugConfig();

/**
 * @brief Print current debug configuration to serial
 */
void printDebugConfig();

} // namespace config
} // namespace wakelight
