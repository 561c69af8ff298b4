// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ApiErrors.h
 * @brief Error codes and HTTP status values shared by codecs and handlers
 *
 * Kept free of ESPAsyncWebServer so the codecs build natively.
 */

#pragma once

#include <cstdint>

namespace wakelight {
namespace network {

namespace ErrorCodes {
    constexpr const char* INVALID_JSON = "INVALID_JSON";
    constexpr const char* MISSING_FIELD = "MISSING_FIELD";
    constexpr const char* INVALID_VALUE = "INVALID_VALUE";
    constexpr const char* OUT_OF_RANGE = "OUT_OF_RANGE";
    constexpr const char* NOT_FOUND = "NOT_FOUND";
    constexpr const char* INTERNAL_ERROR = "INTERNAL_ERROR";
    constexpr const char* FEATURE_DISABLED = "FEATURE_DISABLED";
    constexpr const char* OPERATION_FAILED = "OPERATION_FAILED";
}

namespace HttpStatus {
    constexpr uint16_t OK = 200;
    constexpr uint16_t BAD_REQUEST = 400;
    constexpr uint16_t NOT_FOUND = 404;
    constexpr uint16_t INTERNAL_ERROR = 500;
    constexpr uint16_t SERVICE_UNAVAILABLE = 503;
}

} // namespace network
} // namespace wakelight
