#pragma once

#include <inkwell/result.hpp>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>

namespace inkwell {

// Draw modes known to the host's program cache
enum class DrawMode : uint8_t {
    Default,        // premultiplied textured quad
    StraightAlpha,  // textured quad, straight-alpha source
    Silhouette,     // alpha-only output
    ColorMask,      // output only where source matches a mask color
    Line,           // pen line quads expanded from LineBatch attributes
    Background      // solid fill
};

inline const char* drawModeName(DrawMode mode) {
    switch (mode) {
        case DrawMode::Default:       return "default";
        case DrawMode::StraightAlpha: return "straightAlpha";
        case DrawMode::Silhouette:    return "silhouette";
        case DrawMode::ColorMask:     return "colorMask";
        case DrawMode::Line:          return "line";
        case DrawMode::Background:    return "background";
    }
    return "unknown";
}

// Effect bits are host-defined; the pen layer only uses NO_EFFECTS.
constexpr uint32_t NO_EFFECTS = 0;

//-----------------------------------------------------------------------------
// Program - a compiled pipeline plus the bind group layout it expects
//
// Pipelines target RGBA8Unorm and blend premultiplied source-over.
//
// Quad programs (Default, ...):
//   group 0: binding 0 uniform { mat4 projection; mat4 model; }
//            binding 1 sampler (nearest, clamp)
//            binding 2 texture_2d<f32>
//   vertex buffer 0: vec2 unit-quad corner, (0,0)..(1,1), 6 vertices
//
// Line program:
//   group 0: binding 0 uniform { mat4 projection; vec2 stageSize; vec2 pad; }
//   vertex buffers: 0 vec2 corner code, 1 vec4 color, 2 vec2 thickness/length,
//                   3 vec4 pen points (see LineBatch)
//-----------------------------------------------------------------------------
struct Program {
    DrawMode mode = DrawMode::Default;
    uint32_t effectBits = NO_EFFECTS;
    WGPURenderPipeline pipeline = nullptr;
    WGPUBindGroupLayout bindGroupLayout = nullptr;
};

// Host-side program cache. Programs stay owned by the cache.
class ShaderCache {
public:
    using Ptr = std::shared_ptr<ShaderCache>;

    virtual ~ShaderCache() = default;

    virtual Result<Program> getShader(DrawMode mode, uint32_t effectBits) = 0;

    // Shared unit-quad vertex buffer (6 x vec2) used by every rectangle draw
    virtual WGPUBuffer quadVertexBuffer() const = 0;
};

} // namespace inkwell
