#include <inkwell/pixel-image.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <cstring>
#include <limits>

namespace inkwell {

PixelImage PixelImage::create(uint32_t width, uint32_t height, bool premultiplied) {
    PixelImage image;
    image.width = width;
    image.height = height;
    image.pixels.assign(image.byteSize(), 0);
    image.premultiplied = premultiplied;
    return image;
}

Result<PixelImage> PixelImage::decode(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return Err<PixelImage>("PixelImage::decode: empty input");
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Err<PixelImage>("PixelImage::decode: input too large");
    }

    int width = 0, height = 0, channels = 0;
    stbi_uc* decoded = stbi_load_from_memory(data, static_cast<int>(size),
                                             &width, &height, &channels, 4);
    if (!decoded) {
        return Err<PixelImage>(std::string("PixelImage::decode: stbi_load failed: ") +
                               stbi_failure_reason());
    }

    PixelImage image = create(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    std::memcpy(image.pixels.data(), decoded, image.byteSize());
    stbi_image_free(decoded);

    ydebug("PixelImage: decoded {}x{} ({} channels -> 4)", width, height, channels);
    return Ok(std::move(image));
}

Result<PixelImage> PixelImage::load(const std::string& path) {
    int width = 0, height = 0, channels = 0;
    stbi_uc* decoded = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!decoded) {
        return Err<PixelImage>("PixelImage::load: " + path + ": " + stbi_failure_reason());
    }

    PixelImage image = create(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    std::memcpy(image.pixels.data(), decoded, image.byteSize());
    stbi_image_free(decoded);

    yinfo("PixelImage: loaded {} ({}x{})", path, width, height);
    return Ok(std::move(image));
}

void PixelImage::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    for (size_t i = 0; i < pixels.size(); i += 4) {
        pixels[i + 0] = r;
        pixels[i + 1] = g;
        pixels[i + 2] = b;
        pixels[i + 3] = a;
    }
}

void PixelImage::premultiply() {
    if (premultiplied) return;
    for (size_t i = 0; i < pixels.size(); i += 4) {
        uint32_t a = pixels[i + 3];
        // (c * a + 127) / 255 rounds to nearest
        pixels[i + 0] = static_cast<uint8_t>((pixels[i + 0] * a + 127) / 255);
        pixels[i + 1] = static_cast<uint8_t>((pixels[i + 1] * a + 127) / 255);
        pixels[i + 2] = static_cast<uint8_t>((pixels[i + 2] * a + 127) / 255);
    }
    premultiplied = true;
}

} // namespace inkwell
