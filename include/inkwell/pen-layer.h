#pragma once

#include <inkwell/line-batch.h>
#include <inkwell/pen-attributes.h>
#include <inkwell/pixel-image.h>
#include <inkwell/rectangle.h>
#include <inkwell/skin.h>
#include <inkwell/surface-sync.h>
#include <glm/glm.hpp>
#include <memory>

namespace inkwell {

class Config;
class PenHost;

struct PenLayerConfig {
    uint32_t batchSegments = DEFAULT_BATCH_SEGMENTS;
    uint32_t partialUploadFloats = DEFAULT_PARTIAL_UPLOAD_FLOATS;
    PenDefaults defaults;
    float renderQuality = 1.0f;

    static PenLayerConfig fromConfig(const Config& config);
};

//-----------------------------------------------------------------------------
// PenLayer - persistent ink layer of the stage
//
// Lines are batched and drawn on the GPU into the composite framebuffer.
// Stamps are drawn on a software raster surface and composited into the same
// framebuffer only when something needs the result (getTexture(),
// updateSilhouette(), a resize). Nothing is redrawn from history: content
// survives resizes by drawing the old export texture into the new one.
//
// Coordinates are stage units with the origin at the center and +y up.
// Backing resolution is round(nativeSize * renderQuality); size() stays the
// native size.
//
// Every operation after dispose() fails.
//-----------------------------------------------------------------------------
class PenLayer : public Skin {
public:
    using Ptr = std::shared_ptr<PenLayer>;

    // host must outlive the layer
    static Result<Ptr> create(uint32_t skinId, PenHost* host,
                              const PenLayerConfig& config = {}) noexcept;

    ~PenLayer() override = default;

    // Erase everything, including lines not yet flushed
    virtual Result<void> clear() = 0;

    virtual Result<void> drawPoint(const PenAttributes& attrs, float x, float y) = 0;
    virtual Result<void> drawLine(const PenAttributes& attrs,
                                  float x0, float y0, float x1, float y1) = 0;

    // Image's top-left corner lands at (x, y)
    virtual Result<void> drawStamp(const PixelImage& image, float x, float y) = 0;

    // Draw pending batched lines now
    virtual Result<void> flushLines() = 0;

    virtual Result<void> setRenderQuality(float quality) = 0;
    virtual float renderQuality() const = 0;

    virtual Size backingSize() const = 0;
    virtual Rectangle bounds() const = 0;
    virtual glm::vec2 rotationCenter() const = 0;
    virtual SurfaceState surfaceState() const = 0;
    virtual const LineBatch& lineBatch() const = 0;

protected:
    explicit PenLayer(uint32_t skinId) : Skin(skinId) {}
};

} // namespace inkwell
