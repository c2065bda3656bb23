#pragma once

//=============================================================================
// Mock Pen Host
//
// Stands in for the renderer: owns the software GPU, a program cache that
// hands out pipeline-less programs, the shared draw-region guard and the
// event bus size changes are broadcast on.
//=============================================================================

#include "soft_pen_gpu.h"
#include <inkwell/base/event-bus.h>
#include <inkwell/draw-region.h>
#include <inkwell/pen-host.h>
#include <inkwell/shader-cache.h>
#include <optional>

namespace inkwell::test {

//-----------------------------------------------------------------------------
// MockShaderCache
//-----------------------------------------------------------------------------
class MockShaderCache : public ShaderCache {
public:
    Result<Program> getShader(DrawMode mode, uint32_t effectBits) override {
        _requests++;
        if (_failMode && *_failMode == mode) {
            return Err<Program>(std::string("MockShaderCache: no program for ") + drawModeName(mode));
        }
        Program program;
        program.mode = mode;
        program.effectBits = effectBits;
        return Ok(program);
    }

    WGPUBuffer quadVertexBuffer() const override { return nullptr; }

    void failMode(DrawMode mode) { _failMode = mode; }
    int requests() const { return _requests; }

private:
    std::optional<DrawMode> _failMode;
    int _requests = 0;
};

//-----------------------------------------------------------------------------
// MockPenHost
//-----------------------------------------------------------------------------
class MockPenHost : public PenHost {
public:
    MockPenHost(uint32_t width = 480, uint32_t height = 360)
        : _nativeSize{width, height} {}

    Size nativeSize() const override { return _nativeSize; }
    PenGpu& gpu() override { return _gpu; }
    ShaderCache& shaders() override { return _shaders; }
    DrawRegionGuard& drawRegions() override { return _regions; }
    base::EventBus& events() override { return _events; }

    // Change the stage size and notify listeners, like the renderer does
    Result<void> setNativeSize(uint32_t width, uint32_t height) {
        _nativeSize = {width, height};
        return _events.broadcast(base::Event::nativeSizeChanged(width, height));
    }

    SoftPenGpu& softGpu() { return _gpu; }
    MockShaderCache& mockShaders() { return _shaders; }

private:
    Size _nativeSize;
    SoftPenGpu _gpu;
    MockShaderCache _shaders;
    DrawRegionGuard _regions;
    base::EventBus _events;
};

} // namespace inkwell::test
