#pragma once

#include <inkwell/base/object.h>
#include <inkwell/pen-gpu.h>
#include <inkwell/rectangle.h>
#include <inkwell/result.hpp>
#include <inkwell/silhouette.h>
#include <cstdint>
#include <memory>

namespace inkwell {

//-----------------------------------------------------------------------------
// Skin - something the renderer can draw as a textured quad
//
// size() is the skin's logical size in texels, which need not match the
// resolution of the texture it hands out. dispose() goes through the object
// shutdown protocol, so it runs once.
//-----------------------------------------------------------------------------
class Skin : public virtual base::Object {
public:
    using Ptr = std::shared_ptr<Skin>;

    ~Skin() override = default;

    uint32_t skinId() const { return _skinId; }

    virtual Size size() const = 0;

    // true for raster-style skins, false for vector-style
    virtual bool isRaster() const = 0;

    // Texture to draw this skin at the given size in GPU pixels
    virtual Result<TextureHandle> getTexture(uint32_t pixelsWide, uint32_t pixelsTall) = 0;

    // Bring silhouette() up to date before hit-testing
    virtual Result<void> updateSilhouette() = 0;

    const Silhouette& silhouette() const { return _silhouette; }

    Result<void> dispose() { return shutdown(); }

    bool isDisposed() const { return isShutdown(); }

protected:
    explicit Skin(uint32_t skinId) : _skinId(skinId) {}

    Silhouette _silhouette;

private:
    uint32_t _skinId;
};

} // namespace inkwell
