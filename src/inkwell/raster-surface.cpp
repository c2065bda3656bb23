#include <inkwell/raster-surface.h>
#include <algorithm>
#include <cmath>

namespace inkwell {

namespace {

inline uint8_t mulDiv255(uint32_t a, uint32_t b) {
    return static_cast<uint8_t>((a * b + 127) / 255);
}

inline uint8_t straightToPremultiplied(uint8_t c, uint8_t a) {
    return mulDiv255(c, a);
}

} // namespace

RasterSurface::RasterSurface(uint32_t width, uint32_t height) {
    resize(width, height);
}

void RasterSurface::resize(uint32_t width, uint32_t height) {
    _width = width;
    _height = height;
    _pixels.assign(static_cast<size_t>(width) * height * 4, 0);
    _blank = true;
}

void RasterSurface::clear() {
    if (_blank) return;
    std::fill(_pixels.begin(), _pixels.end(), uint8_t{0});
    _blank = true;
}

bool RasterSurface::drawImage(const PixelImage& image, float x, float y) {
    if (image.isEmpty() || _width == 0 || _height == 0) {
        return false;
    }

    const int64_t originX = static_cast<int64_t>(std::floor(x + 0.5f));
    const int64_t originY = static_cast<int64_t>(std::floor(y + 0.5f));

    // Clip image rect against the surface
    const int64_t x0 = std::max<int64_t>(originX, 0);
    const int64_t y0 = std::max<int64_t>(originY, 0);
    const int64_t x1 = std::min<int64_t>(originX + image.width, _width);
    const int64_t y1 = std::min<int64_t>(originY + image.height, _height);
    if (x0 >= x1 || y0 >= y1) {
        return false;
    }

    for (int64_t dy = y0; dy < y1; dy++) {
        const uint32_t sy = static_cast<uint32_t>(dy - originY);
        for (int64_t dx = x0; dx < x1; dx++) {
            const uint32_t sx = static_cast<uint32_t>(dx - originX);
            const uint8_t* src = image.pixelAt(sx, sy);
            uint8_t* dst = _pixels.data() + (static_cast<size_t>(dy) * _width + dx) * 4;

            const uint8_t sa = src[3];
            if (sa == 0) continue;

            uint8_t sr = src[0], sg = src[1], sb = src[2];
            if (!image.premultiplied) {
                sr = straightToPremultiplied(sr, sa);
                sg = straightToPremultiplied(sg, sa);
                sb = straightToPremultiplied(sb, sa);
            }

            // Premultiplied source-over: dst = src + dst * (1 - srcA)
            const uint32_t inv = 255u - sa;
            dst[0] = static_cast<uint8_t>(std::min<uint32_t>(sr + mulDiv255(dst[0], inv), 255));
            dst[1] = static_cast<uint8_t>(std::min<uint32_t>(sg + mulDiv255(dst[1], inv), 255));
            dst[2] = static_cast<uint8_t>(std::min<uint32_t>(sb + mulDiv255(dst[2], inv), 255));
            dst[3] = static_cast<uint8_t>(std::min<uint32_t>(sa + mulDiv255(dst[3], inv), 255));
        }
    }

    _blank = false;
    return true;
}

} // namespace inkwell
