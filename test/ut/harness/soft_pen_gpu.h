#pragma once

//=============================================================================
// Software PenGpu
//
// Rasterizes pen lines and textured quads on the CPU so compositing can be
// checked pixel by pixel without a GPU device.
//
// Lines: each segment is a round-capped capsule. Pen points are stage units
// with the origin at the center and +y down; they are scaled from
// uniforms.stageSize to the target size. A pixel is covered when its center
// lies within diameter / 2 of the segment.
//
// Quads: the unit quad goes through projection * model to NDC, NDC +y is the
// top row. The source is sampled nearest at (u, 1 - v).
//
// All blending is premultiplied source-over.
//=============================================================================

#include <inkwell/line-batch.h>
#include <inkwell/pen-gpu.h>
#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace inkwell::test {

class SoftPenGpu : public PenGpu {
public:
    struct Texture {
        uint32_t width = 0;
        uint32_t height = 0;
        std::vector<uint8_t> pixels;

        const uint8_t* pixelAt(uint32_t x, uint32_t y) const {
            return pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
        }
        uint8_t* pixelAt(uint32_t x, uint32_t y) {
            return pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
        }
    };

    struct LineBuffers {
        std::vector<float> corners;
        std::vector<float> color;
        std::vector<float> thickness;
        std::vector<float> points;
    };

    // Textures
    Result<TextureHandle> createTexture(uint32_t width, uint32_t height) override;
    void releaseTexture(TextureHandle texture) override;
    Result<void> writeTexture(TextureHandle texture, const uint8_t* rgba,
                              uint32_t width, uint32_t height) override;

    // Framebuffers
    Result<FramebufferHandle> createFramebuffer(TextureHandle attachment) override;
    void releaseFramebuffer(FramebufferHandle framebuffer) override;

    // Lines
    Result<LineBufferHandle> createLineBuffers(const LineBatch& batch) override;
    void releaseLineBuffers(LineBufferHandle buffers) override;
    Result<void> uploadLines(LineBufferHandle buffers, const LineBatch& batch, bool partial) override;

    // Passes and draws
    Result<void> beginPass(FramebufferHandle target, const Program& program,
                           const Viewport& viewport) override;
    Result<void> endPass() override;
    Result<void> clear(FramebufferHandle target, const Color4f& color) override;
    Result<void> drawLines(LineBufferHandle buffers, uint32_t vertexCount,
                           const LineUniforms& uniforms) override;
    Result<void> drawQuad(TextureHandle source, const QuadUniforms& uniforms) override;

    Result<void> readPixels(FramebufferHandle source, std::vector<uint8_t>& out) override;

    // Test inspection
    const Texture* texture(TextureHandle handle) const;
    const LineBuffers* lineBuffers(LineBufferHandle handle) const;
    bool passActive() const { return _pass.has_value(); }
    std::optional<DrawMode> passMode() const;

    size_t liveTextures() const { return _textures.size(); }
    size_t liveFramebuffers() const { return _framebuffers.size(); }
    size_t liveLineBuffers() const { return _lineBuffers.size(); }

    int texturesCreated = 0;
    int framebuffersCreated = 0;
    int lineDraws = 0;
    int quadDraws = 0;
    int clears = 0;
    int readbacks = 0;
    int passesBegun = 0;
    int uploads = 0;
    int partialUploads = 0;
    uint32_t lastLineVertexCount = 0;

    // When >= 0, createTexture fails once that many more textures were made
    int failTextureAfter = -1;

private:
    struct Framebuffer {
        TextureHandle attachment;
    };

    struct Pass {
        FramebufferHandle target;
        Program program;
        Viewport viewport;
    };

    Texture* targetTexture();

    std::unordered_map<uint32_t, Texture> _textures;
    std::unordered_map<uint32_t, Framebuffer> _framebuffers;
    std::unordered_map<uint32_t, LineBuffers> _lineBuffers;
    std::optional<Pass> _pass;
    uint32_t _nextHandle = 1;
};

} // namespace inkwell::test
