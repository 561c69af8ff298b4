// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#define WL_LOG_TAG "Config"
#include "DeviceConfig.h"
#include "../utils/Log.h"

namespace wakelight {
namespace config {

void logDeviceConfig(const DeviceConfig& cfg) {
    WL_LOGI("LED: count=%u pin=%u brightness=%u",
            cfg.led.count, cfg.led.gpioPin, cfg.led.brightness);
    WL_LOGI("Audio: rate=%lu chunk=%lu device=%ld",
            (unsigned long)cfg.audio.sampleRate, (unsigned long)cfg.audio.chunkSize,
            (long)cfg.audio.deviceIndex);
    WL_LOGI("Wake: model=%s threshold=%.2f cooldown=%.1fs%s",
            cfg.wakeWord.modelPath, cfg.wakeWord.threshold, cfg.wakeWord.cooldownSeconds,
            cfg.wakeWord.sharedCooldown ? " (shared)" : "");
    WL_LOGI("API: port=%u wifi=%s", cfg.api.port,
            cfg.wifi.hasCredentials() ? cfg.wifi.ssid : "(AP mode)");
}

} // namespace config
} // namespace wakelight
