#pragma once

#include <inkwell/base/event-bus.h>
#include <inkwell/draw-region.h>
#include <inkwell/pen-gpu.h>
#include <inkwell/rectangle.h>
#include <inkwell/shader-cache.h>

namespace inkwell {

// What a pen layer needs from the renderer that owns it. The host outlives
// its layers and broadcasts Event::Type::NativeSizeChanged on events() when
// the stage size changes.
class PenHost {
public:
    virtual ~PenHost() = default;

    virtual Size nativeSize() const = 0;

    virtual PenGpu& gpu() = 0;
    virtual ShaderCache& shaders() = 0;
    virtual DrawRegionGuard& drawRegions() = 0;
    virtual base::EventBus& events() = 0;
};

} // namespace inkwell
