#pragma once

#include <webgpu/webgpu.h>

namespace inkwell {

// Low-level GPU context - pure WebGPU handles, owned by the host renderer
struct GPUContext {
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
};

} // namespace inkwell
