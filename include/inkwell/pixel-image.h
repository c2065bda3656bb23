#pragma once

#include <inkwell/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace inkwell {

//-----------------------------------------------------------------------------
// PixelImage - tightly packed RGBA8 pixels, row 0 at the top
//-----------------------------------------------------------------------------
struct PixelImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;
    bool premultiplied = false;

    static PixelImage create(uint32_t width, uint32_t height, bool premultiplied = false);

    // Decode PNG/JPEG/BMP/... bytes. Result is straight alpha.
    static Result<PixelImage> decode(const uint8_t* data, size_t size);
    static Result<PixelImage> load(const std::string& path);

    bool isEmpty() const { return width == 0 || height == 0; }
    size_t byteSize() const { return static_cast<size_t>(width) * height * 4; }

    uint8_t* pixelAt(uint32_t x, uint32_t y) { return pixels.data() + (static_cast<size_t>(y) * width + x) * 4; }
    const uint8_t* pixelAt(uint32_t x, uint32_t y) const { return pixels.data() + (static_cast<size_t>(y) * width + x) * 4; }

    void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    // Convert straight alpha to premultiplied in place. No-op if already premultiplied.
    void premultiply();
};

} // namespace inkwell
