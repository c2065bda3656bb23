#pragma once

#include <inkwell/pixel-image.h>
#include <array>
#include <cstdint>
#include <vector>

namespace inkwell {

//-----------------------------------------------------------------------------
// Silhouette - CPU copy of a skin's pixels for hit-testing
//
// Filled lazily by the owning skin's updateSilhouette(). Queries use the
// nearest texel; row 0 is the top row. Coordinates outside the image never
// touch.
//-----------------------------------------------------------------------------
class Silhouette {
public:
    void update(const uint8_t* rgba, uint32_t width, uint32_t height, bool isPremultiplied);
    void update(const PixelImage& image) {
        update(image.pixels.data(), image.width, image.height, image.premultiplied);
    }

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }
    bool isPremultiplied() const { return _premultiplied; }
    bool isEmpty() const { return _width == 0 || _height == 0; }
    const std::vector<uint8_t>& pixels() const { return _pixels; }

    // Number of completed update() calls
    uint64_t generation() const { return _generation; }

    uint8_t alphaAt(int64_t x, int64_t y) const;

    // Premultiplied RGBA at the texel, transparent outside the image
    std::array<uint8_t, 4> colorAt(int64_t x, int64_t y) const;

    bool isTouching(int64_t x, int64_t y) const { return alphaAt(x, y) > 0; }

    // Normalized coordinates in [0,1), nearest texel
    bool isTouchingNearest(float u, float v) const;

private:
    std::vector<uint8_t> _pixels;
    uint32_t _width = 0;
    uint32_t _height = 0;
    bool _premultiplied = false;
    uint64_t _generation = 0;
};

} // namespace inkwell
