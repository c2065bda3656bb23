#pragma once

#include <inkwell/pen-attributes.h>
#include <inkwell/result.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace inkwell {

//-----------------------------------------------------------------------------
// LineBatch - CPU staging for pen line vertex attributes
//
// Each segment becomes one quad (6 vertices). Only per-segment attributes are
// stored; the quad corners come from a shared template and the line program
// expands them into geometry. Per vertex:
//   lineColor              vec4  premultiplied RGBA
//   lineThicknessAndLength vec2  diameter, segment length
//   penPoints              vec4  x0, -y0, dx, -dy  (stage units, +y down)
//
// Cursors count floats written. When an append would overflow, the flush
// handler runs first; it is expected to draw and reset() the batch.
//-----------------------------------------------------------------------------
class LineBatch {
public:
    using FlushHandler = std::function<Result<void>()>;

    static constexpr uint32_t VERTICES_PER_SEGMENT = 6;
    static constexpr uint32_t COLOR_COMPONENTS = 4;
    static constexpr uint32_t THICKNESS_COMPONENTS = 2;
    static constexpr uint32_t POINT_COMPONENTS = 4;
    static constexpr uint32_t CORNER_COMPONENTS = 2;

    static constexpr uint32_t COLOR_FLOATS_PER_SEGMENT = VERTICES_PER_SEGMENT * COLOR_COMPONENTS;
    static constexpr uint32_t THICKNESS_FLOATS_PER_SEGMENT = VERTICES_PER_SEGMENT * THICKNESS_COMPONENTS;
    static constexpr uint32_t POINT_FLOATS_PER_SEGMENT = VERTICES_PER_SEGMENT * POINT_COMPONENTS;
    static constexpr uint32_t CORNER_FLOATS_PER_SEGMENT = VERTICES_PER_SEGMENT * CORNER_COMPONENTS;

    explicit LineBatch(uint32_t segmentCapacity = DEFAULT_BATCH_SEGMENTS,
                       PenDefaults defaults = {});

    LineBatch(const LineBatch&) = delete;
    LineBatch& operator=(const LineBatch&) = delete;

    void setFlushHandler(FlushHandler handler) { _flushHandler = std::move(handler); }
    const PenDefaults& defaults() const { return _defaults; }

    // Append one segment. Coordinates are stage units, +y up.
    Result<void> append(const PenAttributes& attrs, float x0, float y0, float x1, float y1);

    void reset();

    bool empty() const { return _colorCursor == 0; }
    bool wouldOverflow() const { return _colorCursor + COLOR_FLOATS_PER_SEGMENT > _lineColor.size(); }

    // True when the written range is small enough that uploading just that
    // range beats uploading the whole arrays.
    bool usePartialUpload(uint32_t thresholdFloats) const { return _colorCursor < thresholdFloats; }

    uint32_t segmentCapacity() const { return _segmentCapacity; }
    uint32_t segmentCount() const { return _thicknessCursor / THICKNESS_FLOATS_PER_SEGMENT; }
    uint32_t vertexCount() const { return _thicknessCursor / THICKNESS_COMPONENTS; }

    uint32_t colorCursor() const { return _colorCursor; }
    uint32_t thicknessCursor() const { return _thicknessCursor; }
    uint32_t pointsCursor() const { return _pointsCursor; }

    const std::vector<float>& lineColor() const { return _lineColor; }
    const std::vector<float>& lineThicknessAndLength() const { return _lineThicknessAndLength; }
    const std::vector<float>& penPoints() const { return _penPoints; }

    // Unit-square corner codes, 6 per segment, for the whole capacity.
    // Constant for the batch's lifetime; uploaded once.
    const std::vector<float>& cornerTemplate() const { return _cornerTemplate; }

private:
    uint32_t _segmentCapacity;
    PenDefaults _defaults;
    FlushHandler _flushHandler;

    std::vector<float> _lineColor;
    std::vector<float> _lineThicknessAndLength;
    std::vector<float> _penPoints;
    std::vector<float> _cornerTemplate;

    uint32_t _colorCursor = 0;
    uint32_t _thicknessCursor = 0;
    uint32_t _pointsCursor = 0;
};

} // namespace inkwell
