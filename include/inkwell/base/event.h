#pragma once

#include "types.h"
#include <cstdint>

namespace inkwell {
namespace base {

struct Event {
    enum class Type {
        None,
        // Host renderer changed its native stage size
        NativeSizeChanged
    };

    struct NativeSizeEvent {
        uint32_t width;
        uint32_t height;
    };

    Type type = Type::None;

    union {
        NativeSizeEvent nativeSize;
    };

    static Event nativeSizeChanged(uint32_t width, uint32_t height) {
        Event e;
        e.type = Type::NativeSizeChanged;
        e.nativeSize = {width, height};
        return e;
    }
};

} // namespace base
} // namespace inkwell
