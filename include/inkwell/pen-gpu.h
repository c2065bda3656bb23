#pragma once

#include <inkwell/pen-attributes.h>
#include <inkwell/result.hpp>
#include <inkwell/shader-cache.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace inkwell {

class LineBatch;

struct TextureHandle {
    uint32_t id = 0;
    explicit operator bool() const { return id != 0; }
    bool operator==(const TextureHandle&) const = default;
};

struct FramebufferHandle {
    uint32_t id = 0;
    explicit operator bool() const { return id != 0; }
    bool operator==(const FramebufferHandle&) const = default;
};

struct LineBufferHandle {
    uint32_t id = 0;
    explicit operator bool() const { return id != 0; }
    bool operator==(const LineBufferHandle&) const = default;
};

struct Viewport {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
};

// Matches the line program's uniform block
struct LineUniforms {
    glm::mat4 projection{1.0f};
    glm::vec2 stageSize{0.0f};
    glm::vec2 _pad{0.0f};
};

// Matches the quad programs' uniform block
struct QuadUniforms {
    glm::mat4 projection{1.0f};
    glm::mat4 model{1.0f};
};

//-----------------------------------------------------------------------------
// PenGpu - the GPU operations the pen layer composites with
//
// Textures are RGBA8, premultiplied, row 0 at the top. A framebuffer renders
// into one texture. beginPass() binds the target, program and viewport that
// subsequent drawLines()/drawQuad() calls use until endPass(); this is the
// state a draw region enters and exits. Draws land in call order.
//-----------------------------------------------------------------------------
class PenGpu {
public:
    using Ptr = std::shared_ptr<PenGpu>;

    virtual ~PenGpu() = default;

    // Textures
    virtual Result<TextureHandle> createTexture(uint32_t width, uint32_t height) = 0;
    virtual void releaseTexture(TextureHandle texture) = 0;
    virtual Result<void> writeTexture(TextureHandle texture, const uint8_t* rgba,
                                      uint32_t width, uint32_t height) = 0;

    // Framebuffers
    virtual Result<FramebufferHandle> createFramebuffer(TextureHandle attachment) = 0;
    virtual void releaseFramebuffer(FramebufferHandle framebuffer) = 0;

    // Line vertex buffers sized for batch; the corner template is uploaded once.
    virtual Result<LineBufferHandle> createLineBuffers(const LineBatch& batch) = 0;
    virtual void releaseLineBuffers(LineBufferHandle buffers) = 0;

    // partial: upload only the written range of each array
    virtual Result<void> uploadLines(LineBufferHandle buffers, const LineBatch& batch,
                                     bool partial) = 0;

    // Pass state
    virtual Result<void> beginPass(FramebufferHandle target, const Program& program,
                                   const Viewport& viewport) = 0;
    virtual Result<void> endPass() = 0;

    // Clears the whole framebuffer; independent of the bound pass.
    virtual Result<void> clear(FramebufferHandle target, const Color4f& color) = 0;

    virtual Result<void> drawLines(LineBufferHandle buffers, uint32_t vertexCount,
                                   const LineUniforms& uniforms) = 0;
    virtual Result<void> drawQuad(TextureHandle source, const QuadUniforms& uniforms) = 0;

    // Blocking read of the full attachment into out (width * height * 4 bytes,
    // rows top to bottom).
    virtual Result<void> readPixels(FramebufferHandle source, std::vector<uint8_t>& out) = 0;
};

} // namespace inkwell
