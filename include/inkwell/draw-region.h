#pragma once

#include <inkwell/result.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

namespace inkwell {

using RegionId = uint32_t;

//-----------------------------------------------------------------------------
// DrawRegionGuard - de-duplicates GPU state transitions between draw regions
//
// A region is a pair of closures that bind (enter) and unbind (exit) the GPU
// state a run of draw calls needs: target framebuffer, program, viewport.
// Entering the region that is already current does nothing, so consecutive
// draws into the same region cost one transition. The host renderer owns one
// guard shared by every layer.
//-----------------------------------------------------------------------------
class DrawRegionGuard {
public:
    using Callback = std::function<Result<void>()>;

    DrawRegionGuard() = default;

    DrawRegionGuard(const DrawRegionGuard&) = delete;
    DrawRegionGuard& operator=(const DrawRegionGuard&) = delete;

    RegionId add(Callback enter, Callback exit);

    // Exits the region first if it is current.
    Result<void> remove(RegionId id);

    Result<void> enter(RegionId id);

    // Runs the region's exit unconditionally; clears current if it matches.
    Result<void> exit(RegionId id);

    // Exits whichever region is current, if any.
    Result<void> exitCurrent();

    std::optional<RegionId> current() const { return _current; }
    bool isCurrent(RegionId id) const { return _current && *_current == id; }
    bool contains(RegionId id) const { return _regions.count(id) > 0; }

private:
    struct Region {
        Callback enter;
        Callback exit;
    };

    std::unordered_map<RegionId, Region> _regions;
    std::optional<RegionId> _current;
    RegionId _nextId = 1;
};

} // namespace inkwell
