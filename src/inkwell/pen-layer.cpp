#include <inkwell/pen-layer.h>
#include <inkwell/base/event-listener.h>
#include <inkwell/config.h>
#include <inkwell/pen-host.h>
#include <inkwell/raster-surface.h>
#include <ytrace/ytrace.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <cmath>
#include <optional>
#include <string>

namespace inkwell {

PenLayerConfig PenLayerConfig::fromConfig(const Config& config) {
    PenLayerConfig result;
    result.batchSegments = config.penBatchSegments();
    result.partialUploadFloats = config.penPartialUploadFloats();
    result.defaults.diameter = config.penDefaultDiameter();
    result.defaults.color = config.penDefaultColor();
    result.renderQuality = config.penRenderQuality();
    return result;
}

namespace {

constexpr Color4f TRANSPARENT = {0.0f, 0.0f, 0.0f, 0.0f};

bool isValidQuality(float quality) {
    return std::isfinite(quality) && quality > 0.0f;
}

Size scaledSize(Size native, float quality) {
    return Size{
        static_cast<uint32_t>(std::lround(static_cast<double>(native.width) * quality)),
        static_cast<uint32_t>(std::lround(static_cast<double>(native.height) * quality))
    };
}

std::string sizeString(Size size) {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

} // namespace

//=============================================================================
// PenLayerImpl
//=============================================================================

class PenLayerImpl : public PenLayer, public base::EventListener {
public:
    PenLayerImpl(uint32_t skinId, PenHost* host, const PenLayerConfig& config)
        : PenLayer(skinId)
        , _host(host)
        , _config(config)
        , _quality(config.renderQuality)
        , _batch(config.batchSegments, config.defaults) {}

    ~PenLayerImpl() override {
        // Listener entries are weak and expire on their own
        if (!isShutdown()) {
            if (auto res = releaseResources(); !res) {
                ywarn("PenLayer {}: {}", skinId(), error_msg(res));
            }
        }
    }

    const char* typeName() const override { return "PenLayer"; }

    Result<void> init() {
        if (!_host) {
            return Err<void>("PenLayer: null host");
        }
        if (!isValidQuality(_quality)) {
            return Err<void>("PenLayer: invalid render quality " + std::to_string(_quality));
        }

        _nativeSize = _host->nativeSize();
        if (_nativeSize.isEmpty()) {
            return Err<void>("PenLayer: host native size is " + sizeString(_nativeSize));
        }

        auto lineProgram = _host->shaders().getShader(DrawMode::Line, NO_EFFECTS);
        if (!lineProgram) {
            return Err<void>("PenLayer: no line program", lineProgram);
        }
        _lineProgram = *lineProgram;

        auto stampProgram = _host->shaders().getShader(DrawMode::Default, NO_EFFECTS);
        if (!stampProgram) {
            return Err<void>("PenLayer: no stamp program", stampProgram);
        }
        _stampProgram = *stampProgram;

        _batch.setFlushHandler([this]() { return drawPendingLines(); });

        auto lineBuffers = _host->gpu().createLineBuffers(_batch);
        if (!lineBuffers) {
            return Err<void>("PenLayer: failed to create line buffers", lineBuffers);
        }
        _lineBuffers = *lineBuffers;

        DrawRegionGuard& regions = _host->drawRegions();
        _lineRegion = regions.add([this]() { return enterLineRegion(); },
                                  [this]() { return exitLineRegion(); });
        _toBufferRegion = regions.add([this]() { return enterToBufferRegion(); },
                                      [this]() { return exitToBufferRegion(); });

        if (auto res = resize(_nativeSize, scaledSize(_nativeSize, _quality)); !res) {
            return Err<void>("PenLayer: failed to allocate surfaces", res);
        }

        auto self = sharedAs<base::EventListener>();
        if (auto res = _host->events().registerListener(base::Event::Type::NativeSizeChanged, self); !res) {
            return Err<void>("PenLayer: failed to register for size changes", res);
        }

        yinfo("PenLayer {}: native {} backing {} quality {}", skinId(),
              sizeString(_nativeSize), sizeString(_backingSize), _quality);
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Skin
    //-------------------------------------------------------------------------

    Size size() const override { return _nativeSize; }

    bool isRaster() const override { return true; }

    Result<TextureHandle> getTexture(uint32_t, uint32_t) override {
        if (auto res = checkAlive("getTexture"); !res) {
            return Err<TextureHandle>("PenLayer::getTexture", res);
        }
        if (auto res = flushLines(); !res) {
            return Err<TextureHandle>("PenLayer::getTexture: flush failed", res);
        }
        if (auto res = mergeRaster(); !res) {
            return Err<TextureHandle>("PenLayer::getTexture: merge failed", res);
        }
        return Ok(_surfaces->exportTexture);
    }

    Result<void> updateSilhouette() override {
        if (auto res = checkAlive("updateSilhouette"); !res) {
            return res;
        }
        if (!_sync.silhouetteDirty()) {
            return Ok();
        }

        if (auto res = mergeRaster(); !res) {
            return Err<void>("PenLayer::updateSilhouette: merge failed", res);
        }
        // Leaves the line region, drawing any pending lines
        if (auto res = _host->drawRegions().enter(_toBufferRegion); !res) {
            return Err<void>("PenLayer::updateSilhouette", res);
        }

        if (auto res = _host->gpu().readPixels(_surfaces->compositeFramebuffer, _readback); !res) {
            return Err<void>("PenLayer::updateSilhouette: readback failed", res);
        }
        _silhouette.update(_readback.data(), _backingSize.width, _backingSize.height, true);
        _sync.silhouetteRead();

        ydebug("PenLayer {}: silhouette updated ({})", skinId(), sizeString(_backingSize));
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Drawing
    //-------------------------------------------------------------------------

    Result<void> clear() override {
        if (auto res = checkAlive("clear"); !res) {
            return res;
        }

        _batch.reset();
        if (auto res = _host->drawRegions().enter(_toBufferRegion); !res) {
            return Err<void>("PenLayer::clear", res);
        }
        if (auto res = _host->gpu().clear(_surfaces->compositeFramebuffer, TRANSPARENT); !res) {
            return Err<void>("PenLayer::clear: GPU clear failed", res);
        }
        _raster.clear();
        _sync.rasterDiscarded();
        return Ok();
    }

    Result<void> drawPoint(const PenAttributes& attrs, float x, float y) override {
        // A zero-length line renders as two coincident round caps
        return drawLine(attrs, x, y, x, y);
    }

    Result<void> drawLine(const PenAttributes& attrs,
                          float x0, float y0, float x1, float y1) override {
        if (auto res = checkAlive("drawLine"); !res) {
            return res;
        }

        // Pixel-align lines of width 1 and 3
        const float diameter = attrs.resolvedDiameter(_config.defaults);
        const float offset = (diameter == 1.0f || diameter == 3.0f) ? 0.5f : 0.0f;

        if (auto res = _host->drawRegions().enter(_lineRegion); !res) {
            return Err<void>("PenLayer::drawLine", res);
        }
        if (auto res = _batch.append(attrs, x0 + offset, y0 + offset, x1 + offset, y1 + offset); !res) {
            return Err<void>("PenLayer::drawLine", res);
        }
        _sync.compositedChanged();
        return Ok();
    }

    Result<void> drawStamp(const PixelImage& image, float x, float y) override {
        if (auto res = checkAlive("drawStamp"); !res) {
            return res;
        }
        if (!_raster.drawImage(image, _rotationCenter.x + x, _rotationCenter.y - y)) {
            ydebug("PenLayer {}: {}x{} stamp at ({}, {}) is outside the layer", skinId(),
                   image.width, image.height, x, y);
        }
        _sync.stamped();
        return Ok();
    }

    Result<void> flushLines() override {
        if (auto res = checkAlive("flushLines"); !res) {
            return res;
        }
        if (_batch.empty()) {
            return Ok();
        }
        // Pending lines imply the line region is current; leaving it draws them.
        return _host->drawRegions().exit(_lineRegion);
    }

    //-------------------------------------------------------------------------
    // Quality / size
    //-------------------------------------------------------------------------

    Result<void> setRenderQuality(float quality) override {
        if (auto res = checkAlive("setRenderQuality"); !res) {
            return res;
        }
        if (!isValidQuality(quality)) {
            return Err<void>("PenLayer::setRenderQuality: invalid quality " + std::to_string(quality));
        }
        if (quality == _quality) {
            return Ok();
        }

        Size backing = scaledSize(_nativeSize, quality);
        if (backing.isEmpty()) {
            return Err<void>("PenLayer::setRenderQuality: quality " + std::to_string(quality) +
                             " gives backing size " + sizeString(backing));
        }
        if (auto res = resize(_nativeSize, backing); !res) {
            return Err<void>("PenLayer::setRenderQuality", res);
        }
        _quality = quality;
        return Ok();
    }

    float renderQuality() const override { return _quality; }
    Size backingSize() const override { return _backingSize; }
    Rectangle bounds() const override { return _bounds; }
    glm::vec2 rotationCenter() const override { return _rotationCenter; }
    SurfaceState surfaceState() const override { return _sync.state(); }
    const LineBatch& lineBatch() const override { return _batch; }

    //-------------------------------------------------------------------------
    // EventListener
    //-------------------------------------------------------------------------

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type != base::Event::Type::NativeSizeChanged) {
            return Ok(false);
        }
        if (isShutdown()) {
            return Ok(false);
        }

        Size native{event.nativeSize.width, event.nativeSize.height};
        Size backing = scaledSize(native, _quality);
        if (backing.isEmpty()) {
            return Err<bool>("PenLayer: rejecting native size " + sizeString(native));
        }

        ydebug("PenLayer {}: native size {} -> {}", skinId(), sizeString(_nativeSize), sizeString(native));
        if (auto res = resize(native, backing); !res) {
            return Err<bool>("PenLayer: resize failed", res);
        }
        // Other layers need the notification too
        return Ok(false);
    }

protected:
    Result<void> onShutdown() override {
        Result<void> result = Ok();

        if (auto self = weak_from_this().lock()) {
            auto listener = std::dynamic_pointer_cast<base::EventListener>(self);
            if (auto res = _host->events().deregisterListener(listener); !res) {
                result = Err<void>("PenLayer: failed to deregister listener", res);
            }
        }
        if (auto res = releaseResources(); !res && result) {
            result = res;
        }

        yinfo("PenLayer {}: disposed", skinId());
        return result;
    }

private:
    // One allocation of every size-dependent GPU resource
    struct SurfaceGeneration {
        Size size;
        TextureHandle sourceTexture;        // mirrors the raster surface
        TextureHandle exportTexture;        // composited result
        TextureHandle pickTexture;
        FramebufferHandle compositeFramebuffer;  // renders into exportTexture
        FramebufferHandle pickFramebuffer;       // reserved for GPU-side picking
    };

    Result<void> checkAlive(const char* operation) const {
        if (isShutdown()) {
            yerror("PenLayer {}: {} called after dispose", skinId(), operation);
            return Err<void>(std::string("PenLayer::") + operation + ": layer is disposed");
        }
        return Ok();
    }

    Viewport backingViewport() const {
        return Viewport{0, 0, _backingSize.width, _backingSize.height};
    }

    //-------------------------------------------------------------------------
    // Draw regions
    //-------------------------------------------------------------------------

    Result<void> enterLineRegion() {
        if (!_surfaces) {
            return Err<void>("PenLayer: line region entered without surfaces");
        }
        _lineUniforms.projection = glm::ortho(0.0f, static_cast<float>(_backingSize.width),
                                              0.0f, static_cast<float>(_backingSize.height),
                                              -1.0f, 1.0f);
        // Lines are in native stage units; the program scales them to the target
        _lineUniforms.stageSize = glm::vec2(static_cast<float>(_nativeSize.width),
                                            static_cast<float>(_nativeSize.height));
        return _host->gpu().beginPass(_surfaces->compositeFramebuffer, _lineProgram, backingViewport());
    }

    Result<void> exitLineRegion() {
        if (auto res = drawPendingLines(); !res) {
            return res;
        }
        return _host->gpu().endPass();
    }

    Result<void> enterToBufferRegion() {
        if (!_surfaces) {
            return Err<void>("PenLayer: stamp region entered without surfaces");
        }
        return _host->gpu().beginPass(_surfaces->compositeFramebuffer, _stampProgram, backingViewport());
    }

    Result<void> exitToBufferRegion() {
        return _host->gpu().endPass();
    }

    // Leaves whichever of this layer's regions is current
    Result<void> exitOwnRegions() {
        DrawRegionGuard& regions = _host->drawRegions();
        if (regions.isCurrent(_lineRegion) || regions.isCurrent(_toBufferRegion)) {
            return regions.exitCurrent();
        }
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Compositing
    //-------------------------------------------------------------------------

    // Line pass must be bound.
    Result<void> drawPendingLines() {
        if (_batch.empty()) {
            return Ok();
        }

        PenGpu& gpu = _host->gpu();
        const bool partial = _batch.usePartialUpload(_config.partialUploadFloats);
        if (auto res = gpu.uploadLines(_lineBuffers, _batch, partial); !res) {
            return Err<void>("PenLayer: line upload failed", res);
        }
        if (auto res = gpu.drawLines(_lineBuffers, _batch.vertexCount(), _lineUniforms); !res) {
            return Err<void>("PenLayer: line draw failed", res);
        }

        ydebug("PenLayer {}: flushed {} segments ({} upload)", skinId(), _batch.segmentCount(),
               partial ? "partial" : "full");
        _batch.reset();
        _sync.compositedChanged();
        return Ok();
    }

    // Draws texture as one rectangle covering rect, in the stamp region.
    Result<void> drawRectangle(TextureHandle texture, const Rectangle& rect) {
        QuadUniforms uniforms;
        uniforms.projection = glm::ortho(_bounds.left, _bounds.right, _bounds.bottom, _bounds.top,
                                         -1.0f, 1.0f);
        uniforms.model = glm::scale(
            glm::translate(glm::mat4(1.0f), glm::vec3(rect.left, rect.bottom, 0.0f)),
            glm::vec3(rect.width(), rect.height(), 1.0f));
        return _host->gpu().drawQuad(texture, uniforms);
    }

    Result<void> mergeRaster() {
        if (!_sync.rasterDirty()) {
            return Ok();
        }

        PenGpu& gpu = _host->gpu();
        if (auto res = gpu.writeTexture(_surfaces->sourceTexture, _raster.data(),
                                        _raster.width(), _raster.height()); !res) {
            return Err<void>("PenLayer: raster upload failed", res);
        }
        _raster.clear();

        if (auto res = _host->drawRegions().enter(_toBufferRegion); !res) {
            return Err<void>("PenLayer: merge", res);
        }
        if (auto res = drawRectangle(_surfaces->sourceTexture, _bounds); !res) {
            return Err<void>("PenLayer: raster draw failed", res);
        }

        ydebug("PenLayer {}: merged raster surface", skinId());
        _sync.rasterMerged();
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Surface generations
    //-------------------------------------------------------------------------

    Result<SurfaceGeneration> allocateGeneration(Size size) {
        PenGpu& gpu = _host->gpu();
        SurfaceGeneration gen;
        gen.size = size;

        auto fail = [&](const char* what, const auto& cause) {
            releaseGeneration(gen);
            return Err<SurfaceGeneration>(std::string("PenLayer: failed to create ") + what, cause);
        };

        auto source = gpu.createTexture(size.width, size.height);
        if (!source) return fail("source texture", source);
        gen.sourceTexture = *source;

        auto exported = gpu.createTexture(size.width, size.height);
        if (!exported) return fail("export texture", exported);
        gen.exportTexture = *exported;

        auto pick = gpu.createTexture(size.width, size.height);
        if (!pick) return fail("pick texture", pick);
        gen.pickTexture = *pick;

        auto composite = gpu.createFramebuffer(gen.exportTexture);
        if (!composite) return fail("composite framebuffer", composite);
        gen.compositeFramebuffer = *composite;

        auto pickFb = gpu.createFramebuffer(gen.pickTexture);
        if (!pickFb) return fail("pick framebuffer", pickFb);
        gen.pickFramebuffer = *pickFb;

        return Ok(gen);
    }

    void releaseGeneration(const SurfaceGeneration& gen) {
        PenGpu& gpu = _host->gpu();
        if (gen.pickFramebuffer) gpu.releaseFramebuffer(gen.pickFramebuffer);
        if (gen.compositeFramebuffer) gpu.releaseFramebuffer(gen.compositeFramebuffer);
        if (gen.pickTexture) gpu.releaseTexture(gen.pickTexture);
        if (gen.exportTexture) gpu.releaseTexture(gen.exportTexture);
        if (gen.sourceTexture) gpu.releaseTexture(gen.sourceTexture);
    }

    // Reallocate every surface at backing size, carrying the current
    // content over stretched to the new bounds. native is committed with
    // the new generation; on allocation failure nothing changes.
    Result<void> resize(Size native, Size backing) {
        if (backing.isEmpty()) {
            return Err<void>("PenLayer: invalid backing size " + sizeString(backing));
        }

        // Bring the old generation up to date first
        if (_surfaces) {
            if (auto res = exitOwnRegions(); !res) {
                return Err<void>("PenLayer::resize: flush failed", res);
            }
            if (auto res = mergeRaster(); !res) {
                return Err<void>("PenLayer::resize: merge failed", res);
            }
            if (auto res = exitOwnRegions(); !res) {
                return res;
            }
        }

        auto next = allocateGeneration(backing);
        if (!next) {
            return Err<void>("PenLayer::resize", next);
        }

        std::optional<SurfaceGeneration> previous = std::move(_surfaces);
        _surfaces = *next;
        _nativeSize = native;
        _backingSize = backing;
        _bounds = Rectangle::centered(backing);
        _rotationCenter = glm::vec2(static_cast<float>(_nativeSize.width) / 2.0f,
                                    static_cast<float>(_nativeSize.height) / 2.0f);
        _raster.resize(backing.width, backing.height);

        PenGpu& gpu = _host->gpu();
        Result<void> migrated = gpu.clear(_surfaces->compositeFramebuffer, TRANSPARENT);

        if (migrated && previous) {
            migrated = _host->drawRegions().enter(_toBufferRegion);
            if (migrated) {
                migrated = drawRectangle(previous->exportTexture, _bounds);
            }
            if (auto res = _host->drawRegions().exit(_toBufferRegion); !res && migrated) {
                migrated = res;
            }
        }

        // Old generation goes only after the new one holds its content
        if (previous) {
            releaseGeneration(*previous);
        }

        _readback.assign(static_cast<size_t>(backing.width) * backing.height * 4, 0);
        _sync.rasterDiscarded();

        if (!migrated) {
            return Err<void>("PenLayer::resize: content migration failed", migrated);
        }
        yinfo("PenLayer {}: backing size {} ({} bytes per surface)", skinId(),
              sizeString(backing), _readback.size());
        return Ok();
    }

    Result<void> releaseResources() {
        Result<void> result = Ok();
        if (!_host) {
            return result;
        }

        DrawRegionGuard& regions = _host->drawRegions();
        for (RegionId id : {_lineRegion, _toBufferRegion}) {
            if (id && regions.contains(id)) {
                if (auto res = regions.remove(id); !res && result) {
                    result = res;
                }
            }
        }
        _lineRegion = 0;
        _toBufferRegion = 0;

        if (_surfaces) {
            releaseGeneration(*_surfaces);
            _surfaces.reset();
        }
        if (_lineBuffers) {
            _host->gpu().releaseLineBuffers(_lineBuffers);
            _lineBuffers = {};
        }
        _batch.reset();
        _raster.resize(0, 0);
        _readback.clear();
        _readback.shrink_to_fit();
        return result;
    }

    PenHost* _host;
    PenLayerConfig _config;

    Program _lineProgram;
    Program _stampProgram;

    float _quality;
    Size _nativeSize;
    Size _backingSize;
    Rectangle _bounds;
    glm::vec2 _rotationCenter{0.0f};

    LineBatch _batch;
    LineBufferHandle _lineBuffers;
    LineUniforms _lineUniforms;

    RegionId _lineRegion = 0;
    RegionId _toBufferRegion = 0;

    std::optional<SurfaceGeneration> _surfaces;
    RasterSurface _raster;
    SurfaceSync _sync;
    std::vector<uint8_t> _readback;
};

Result<PenLayer::Ptr> PenLayer::create(uint32_t skinId, PenHost* host,
                                       const PenLayerConfig& config) noexcept {
    auto layer = std::make_shared<PenLayerImpl>(skinId, host, config);
    if (auto res = layer->init(); !res) {
        return Err<Ptr>("Failed to init PenLayer", res);
    }
    return Ok<Ptr>(layer);
}

} // namespace inkwell
