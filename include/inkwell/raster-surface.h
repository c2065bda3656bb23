#pragma once

#include <inkwell/pixel-image.h>
#include <inkwell/rectangle.h>
#include <cstdint>
#include <vector>

namespace inkwell {

//-----------------------------------------------------------------------------
// RasterSurface - software RGBA8 canvas for stamp compositing
//
// Pixels are premultiplied, row 0 at the top, origin at the top-left corner.
// Stamps are composited source-over at the nearest whole-pixel position and
// clipped to the surface.
//-----------------------------------------------------------------------------
class RasterSurface {
public:
    RasterSurface() = default;
    RasterSurface(uint32_t width, uint32_t height);

    // Reallocates and clears, like resizing an HTML canvas.
    void resize(uint32_t width, uint32_t height);

    void clear();

    // Draws image with its top-left corner at (x, y) surface pixels.
    // Returns false when the image lies entirely outside the surface.
    bool drawImage(const PixelImage& image, float x, float y);

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }
    Size size() const { return {_width, _height}; }

    const uint8_t* data() const { return _pixels.data(); }
    size_t byteSize() const { return _pixels.size(); }
    const uint8_t* pixelAt(uint32_t x, uint32_t y) const {
        return _pixels.data() + (static_cast<size_t>(y) * _width + x) * 4;
    }

    // True until something is drawn after the last clear/resize
    bool isBlank() const { return _blank; }

private:
    uint32_t _width = 0;
    uint32_t _height = 0;
    std::vector<uint8_t> _pixels;
    bool _blank = true;
};

} // namespace inkwell
