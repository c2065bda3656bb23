#pragma once

// Compatibility macros for WebGPU API differences between backends.
// With emdawnwebgpu, Emscripten uses Dawn's API (same as desktop).

#include <webgpu/webgpu.h>

#ifdef __EMSCRIPTEN__
#include <emscripten.h>
// Emscripten: yield to JS event loop instead of device tick
#define WGPU_DEVICE_TICK(device) emscripten_sleep(1)
#else
// Desktop: use wgpuDeviceTick to process GPU work
#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)
#endif

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// Render pass color attachment uses clearValue
#define WGPU_COLOR_ATTACHMENT_CLEAR(attachment, r, g, b, a)                    \
  (attachment).clearValue = {(r), (g), (b), (a)}
