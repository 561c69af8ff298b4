// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "Color.h"

#include <cstdio>

namespace wakelight {
namespace led {

namespace {

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int hexByte(const char* p) {
    int hi = hexNibble(p[0]);
    if (hi < 0) {
        return -1;
    }
    int lo = hexNibble(p[1]);
    if (lo < 0) {
        return -1;
    }
    return (hi << 4) | lo;
}

uint8_t blendChannel(uint8_t from, uint8_t to, float t) {
    // static_cast truncates toward zero
    float v = static_cast<float>(from) + (static_cast<float>(to) - static_cast<float>(from)) * t;
    return static_cast<uint8_t>(static_cast<int>(v));
}

} // namespace

bool Color::fromComponents(int32_t red, int32_t green, int32_t blue, Color& out) {
    if (red < 0 || red > 255 || green < 0 || green > 255 || blue < 0 || blue > 255) {
        return false;
    }
    out = Color(static_cast<uint8_t>(red), static_cast<uint8_t>(green), static_cast<uint8_t>(blue));
    return true;
}

bool Color::fromHex(const char* hex, Color& out) {
    if (hex == nullptr) {
        return false;
    }
    if (hex[0] == '#') {
        hex++;
    }

    int values[3];
    for (int i = 0; i < 3; i++) {
        // hexByte stops at a terminator since '\0' is not a hex digit
        values[i] = hexByte(hex + i * 2);
        if (values[i] < 0) {
            return false;
        }
    }
    if (hex[6] != '\0') {
        return false;
    }

    out = Color(static_cast<uint8_t>(values[0]), static_cast<uint8_t>(values[1]),
                static_cast<uint8_t>(values[2]));
    return true;
}

Color Color::lerp(const Color& from, const Color& to, float t) {
    if (!(t > 0.0f)) {
        t = 0.0f;
    } else if (t > 1.0f) {
        t = 1.0f;
    }
    return Color(blendChannel(from.r, to.r, t),
                 blendChannel(from.g, to.g, t),
                 blendChannel(from.b, to.b, t));
}

size_t Color::toHex(char* out, size_t size) const {
    if (out == nullptr || size < HEX_STRING_SIZE) {
        return 0;
    }
    snprintf(out, size, "#%02X%02X%02X", r, g, b);
    return HEX_STRING_SIZE - 1;
}

Color wheel(uint8_t pos) {
    if (pos < 85) {
        return Color(static_cast<uint8_t>(255 - pos * 3), static_cast<uint8_t>(pos * 3), 0);
    }
    if (pos < 170) {
        pos -= 85;
        return Color(0, static_cast<uint8_t>(255 - pos * 3), static_cast<uint8_t>(pos * 3));
    }
    pos -= 170;
    return Color(static_cast<uint8_t>(pos * 3), 0, static_cast<uint8_t>(255 - pos * 3));
}

} // namespace led
} // namespace wakelight
