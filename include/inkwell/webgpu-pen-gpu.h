#pragma once

#include <inkwell/gpu-context.h>
#include <inkwell/pen-gpu.h>
#include <inkwell/shader-cache.h>

namespace inkwell {

// PenGpu on Dawn's WebGPU C API. Every draw encodes its own render pass
// (load/store) and is submitted immediately, so queue writes between draws
// stay ordered with the draws that read them.
class WebGPUPenGpu : public PenGpu {
public:
    using Ptr = std::shared_ptr<WebGPUPenGpu>;

    static Result<Ptr> create(const GPUContext& gpu, ShaderCache::Ptr shaders) noexcept;

    ~WebGPUPenGpu() override = default;

protected:
    WebGPUPenGpu() = default;
};

} // namespace inkwell
