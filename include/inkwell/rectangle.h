#pragma once

#include <cstdint>

namespace inkwell {

struct Size {
    uint32_t width = 0;
    uint32_t height = 0;

    bool isEmpty() const { return width == 0 || height == 0; }
    bool operator==(const Size& other) const = default;
};

// Axis-aligned rectangle, +y up
struct Rectangle {
    float left = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float top = 0.0f;

    // [-w/2, w/2] x [-h/2, h/2]
    static Rectangle centered(Size size) {
        float hw = static_cast<float>(size.width) / 2.0f;
        float hh = static_cast<float>(size.height) / 2.0f;
        return Rectangle{-hw, hw, -hh, hh};
    }

    float width() const { return right - left; }
    float height() const { return top - bottom; }
};

} // namespace inkwell
