#include <inkwell/line-batch.h>
#include <algorithm>
#include <cmath>

namespace inkwell {

namespace {

// Two triangles over the unit square: (1,0) (0,0) (1,1) / (1,1) (0,0) (0,1)
constexpr float QUAD_CORNERS[LineBatch::CORNER_FLOATS_PER_SEGMENT] = {
    1.0f, 0.0f,
    0.0f, 0.0f,
    1.0f, 1.0f,
    1.0f, 1.0f,
    0.0f, 0.0f,
    0.0f, 1.0f,
};

} // namespace

LineBatch::LineBatch(uint32_t segmentCapacity, PenDefaults defaults)
    : _segmentCapacity(std::max<uint32_t>(segmentCapacity, 1))
    , _defaults(defaults)
    , _lineColor(static_cast<size_t>(_segmentCapacity) * COLOR_FLOATS_PER_SEGMENT, 0.0f)
    , _lineThicknessAndLength(static_cast<size_t>(_segmentCapacity) * THICKNESS_FLOATS_PER_SEGMENT, 0.0f)
    , _penPoints(static_cast<size_t>(_segmentCapacity) * POINT_FLOATS_PER_SEGMENT, 0.0f)
    , _cornerTemplate(static_cast<size_t>(_segmentCapacity) * CORNER_FLOATS_PER_SEGMENT) {
    for (size_t i = 0; i < _cornerTemplate.size(); i += CORNER_FLOATS_PER_SEGMENT) {
        std::copy(std::begin(QUAD_CORNERS), std::end(QUAD_CORNERS), _cornerTemplate.begin() + i);
    }
}

Result<void> LineBatch::append(const PenAttributes& attrs, float x0, float y0, float x1, float y1) {
    if (wouldOverflow()) {
        if (!_flushHandler) {
            return Err<void>("LineBatch::append: batch full and no flush handler");
        }
        if (auto res = _flushHandler(); !res) {
            return Err<void>("LineBatch::append: flush failed", res);
        }
        if (wouldOverflow()) {
            return Err<void>("LineBatch::append: flush handler left the batch full");
        }
    }

    const Color4f color = premultiply(attrs.resolvedColor(_defaults));
    const float thickness = attrs.resolvedDiameter(_defaults);

    // Length is computed here rather than in the line program: squaring
    // components at mediump precision overflows for lines longer than ~128.
    const float dx = x1 - x0;
    const float dy = y1 - y0;
    const float length = std::sqrt(dx * dx + dy * dy);

    float* colors = _lineColor.data() + _colorCursor;
    float* thicknesses = _lineThicknessAndLength.data() + _thicknessCursor;
    float* points = _penPoints.data() + _pointsCursor;

    for (uint32_t i = 0; i < VERTICES_PER_SEGMENT; i++) {
        *colors++ = color[0];
        *colors++ = color[1];
        *colors++ = color[2];
        *colors++ = color[3];

        *thicknesses++ = thickness;
        *thicknesses++ = length;

        *points++ = x0;
        *points++ = -y0;
        *points++ = dx;
        *points++ = -dy;
    }

    _colorCursor += COLOR_FLOATS_PER_SEGMENT;
    _thicknessCursor += THICKNESS_FLOATS_PER_SEGMENT;
    _pointsCursor += POINT_FLOATS_PER_SEGMENT;
    return Ok();
}

void LineBatch::reset() {
    _colorCursor = 0;
    _thicknessCursor = 0;
    _pointsCursor = 0;
}

} // namespace inkwell
