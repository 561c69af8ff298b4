// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.cpp
 * @brief Runtime log verbosity
 */

#include "DebugConfig.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef ARDUINO
#include <Arduino.h>
#define WL_DBG_OUT(...) Serial.printf(__VA_ARGS__)
#else
#define WL_DBG_OUT(...) printf(__VA_ARGS__)
#endif

namespace wakelight {
namespace config {

namespace {

DebugConfig s_debugConfig;

constexpr uint8_t DOMAIN_COUNT = static_cast<uint8_t>(DebugDomain::_COUNT);
constexpr uint8_t MAX_LEVEL = static_cast<uint8_t>(DebugLevel::TRACE);

struct DomainInfo {
    const char* name;       ///< Printed name
    const char* alias;      ///< Short form accepted by parseDomain
};

// Indexed by DebugDomain
const DomainInfo DOMAINS[DOMAIN_COUNT] = {
    {"LED",     "led"},
    {"AUDIO",   "audio"},
    {"WAKE",    "wake"},
    {"NETWORK", "net"},
    {"SYSTEM",  "sys"},
};

const char* const LEVEL_NAMES[MAX_LEVEL + 1] = {
    "OFF", "ERROR", "WARN", "INFO", "VERBOSE", "TRACE"
};

bool equalsIgnoreCase(const char* a, const char* b) {
    while (*a != '\0' && *b != '\0') {
        if (tolower(static_cast<unsigned char>(*a)) != tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        a++;
        b++;
    }
    return *a == *b;
}

/// Whole-token level 0..MAX_LEVEL
bool parseLevel(const char* token, uint8_t& out) {
    if (token == nullptr || *token == '\0') {
        return false;
    }
    char* end = nullptr;
    long value = strtol(token, &end, 10);
    if (*end != '\0' || value < 0 || value > MAX_LEVEL) {
        return false;
    }
    out = static_cast<uint8_t>(value);
    return true;
}

} // namespace

DebugConfig& getDebugConfig() {
    return s_debugConfig;
}

void resetDebugConfig() {
    s_debugConfig = DebugConfig();
}

const char* DebugConfig::domainName(DebugDomain domain) {
    uint8_t idx = static_cast<uint8_t>(domain);
    return idx < DOMAIN_COUNT ? DOMAINS[idx].name : "UNKNOWN";
}

const char* DebugConfig::levelName(uint8_t level) {
    return level <= MAX_LEVEL ? LEVEL_NAMES[level] : "INVALID";
}

bool DebugConfig::parseDomain(const char* name, DebugDomain& out) {
    if (name == nullptr) {
        return false;
    }
    for (uint8_t i = 0; i < DOMAIN_COUNT; i++) {
        if (equalsIgnoreCase(name, DOMAINS[i].alias) || equalsIgnoreCase(name, DOMAINS[i].name)) {
            out = static_cast<DebugDomain>(i);
            return true;
        }
    }
    return false;
}

bool applyDebugCommand(DebugConfig& cfg, const char* args) {
    if (args == nullptr) {
        return false;
    }

    char buf[32];
    strncpy(buf, args, sizeof(buf) - 1);
    buf[sizeof(buf) - 1] = '\0';

    char* first = strtok(buf, " \t");
    char* second = strtok(nullptr, " \t");
    if (first == nullptr || strtok(nullptr, " \t") != nullptr) {
        return false;
    }

    uint8_t level = 0;
    if (second == nullptr) {
        if (!parseLevel(first, level)) {
            return false;
        }
        cfg.globalLevel = level;
        return true;
    }

    DebugDomain domain;
    if (!DebugConfig::parseDomain(first, domain)) {
        return false;
    }
    if (strcmp(second, "-") == 0) {
        cfg.setDomainLevel(domain, -1);
        return true;
    }
    if (!parseLevel(second, level)) {
        return false;
    }
    cfg.setDomainLevel(domain, static_cast<int8_t>(level));
    return true;
}

void printDebugConfig() {
    const DebugConfig& cfg = getDebugConfig();

    WL_DBG_OUT("\nLog level: %u (%s)\n", cfg.globalLevel, DebugConfig::levelName(cfg.globalLevel));
    for (uint8_t i = 0; i < DOMAIN_COUNT; ++i) {
        DebugDomain domain = static_cast<DebugDomain>(i);
        uint8_t effective = cfg.effectiveLevel(domain);
        WL_DBG_OUT("  %-5s %-8s %u (%s)%s\n", DOMAINS[i].alias, DOMAINS[i].name, effective,
                   DebugConfig::levelName(effective),
                   cfg.domainLevels[i] < 0 ? "" : " override");
    }
    WL_DBG_OUT("Usage: dbg <0-5> | dbg <domain> <0-5> | dbg <domain> -\n\n");
}

} // namespace config
} // namespace wakelight
