// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once

#define WAKELIGHT_VERSION_MAJOR 1
#define WAKELIGHT_VERSION_MINOR 0
#define WAKELIGHT_VERSION_PATCH 0
#define WAKELIGHT_VERSION_STRING "1.0.0"

namespace wakelight {
constexpr const char* API_VERSION = "1.0";
}
