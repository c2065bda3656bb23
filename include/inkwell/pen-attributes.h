#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <optional>

namespace inkwell {

using Color4f = std::array<float, 4>;

constexpr float DEFAULT_PEN_DIAMETER = 1.0f;
constexpr Color4f DEFAULT_PEN_COLOR = {0.0f, 0.0f, 1.0f, 1.0f};

// 65520 color floats / 24 floats per segment
constexpr uint32_t DEFAULT_BATCH_SEGMENTS = 2730;

// Below this many written color floats only the written range is uploaded
constexpr uint32_t DEFAULT_PARTIAL_UPLOAD_FLOATS = 1000;

// Values used for whatever a PenAttributes leaves unset
struct PenDefaults {
    float diameter = DEFAULT_PEN_DIAMETER;
    Color4f color = DEFAULT_PEN_COLOR;
};

//-----------------------------------------------------------------------------
// PenAttributes - how a point or line is drawn
//
// color is straight (non-premultiplied) RGBA in [0,1]. A diameter that is not
// a positive finite number counts as unset.
//-----------------------------------------------------------------------------
struct PenAttributes {
    std::optional<float> diameter;
    std::optional<Color4f> color;

    float resolvedDiameter(const PenDefaults& defaults = {}) const {
        if (diameter && std::isfinite(*diameter) && *diameter > 0.0f) {
            return *diameter;
        }
        return defaults.diameter;
    }

    Color4f resolvedColor(const PenDefaults& defaults = {}) const {
        return color ? *color : defaults.color;
    }
};

inline Color4f premultiply(const Color4f& c) {
    return {c[0] * c[3], c[1] * c[3], c[2] * c[3], c[3]};
}

} // namespace inkwell
