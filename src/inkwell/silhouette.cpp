#include <inkwell/silhouette.h>
#include <cmath>
#include <cstring>

namespace inkwell {

void Silhouette::update(const uint8_t* rgba, uint32_t width, uint32_t height, bool isPremultiplied) {
    _width = width;
    _height = height;
    _premultiplied = isPremultiplied;

    size_t byteSize = static_cast<size_t>(width) * height * 4;
    _pixels.resize(byteSize);
    if (rgba && byteSize) {
        std::memcpy(_pixels.data(), rgba, byteSize);
    }
    _generation++;
}

uint8_t Silhouette::alphaAt(int64_t x, int64_t y) const {
    if (x < 0 || y < 0 || x >= _width || y >= _height) {
        return 0;
    }
    return _pixels[(static_cast<size_t>(y) * _width + static_cast<size_t>(x)) * 4 + 3];
}

std::array<uint8_t, 4> Silhouette::colorAt(int64_t x, int64_t y) const {
    if (x < 0 || y < 0 || x >= _width || y >= _height) {
        return {0, 0, 0, 0};
    }
    const uint8_t* p = _pixels.data() + (static_cast<size_t>(y) * _width + static_cast<size_t>(x)) * 4;
    return {p[0], p[1], p[2], p[3]};
}

bool Silhouette::isTouchingNearest(float u, float v) const {
    if (isEmpty()) return false;
    int64_t x = static_cast<int64_t>(std::floor(u * static_cast<float>(_width)));
    int64_t y = static_cast<int64_t>(std::floor(v * static_cast<float>(_height)));
    return isTouching(x, y);
}

} // namespace inkwell
