#include <inkwell/draw-region.h>
#include <ytrace/ytrace.hpp>
#include <string>

namespace inkwell {

RegionId DrawRegionGuard::add(Callback enter, Callback exit) {
    RegionId id = _nextId++;
    _regions[id] = Region{std::move(enter), std::move(exit)};
    ydebug("DrawRegionGuard: added region {}", id);
    return id;
}

Result<void> DrawRegionGuard::remove(RegionId id) {
    if (!contains(id)) {
        return Err<void>("DrawRegionGuard::remove: unknown region " + std::to_string(id));
    }
    Result<void> exitResult = Ok();
    if (isCurrent(id)) {
        exitResult = exit(id);
    }
    _regions.erase(id);
    if (!exitResult) {
        return Err<void>("DrawRegionGuard::remove: exit failed", exitResult);
    }
    return Ok();
}

Result<void> DrawRegionGuard::enter(RegionId id) {
    if (isCurrent(id)) {
        return Ok();
    }

    if (!contains(id)) {
        return Err<void>("DrawRegionGuard::enter: unknown region " + std::to_string(id));
    }

    if (auto res = exitCurrent(); !res) {
        return res;
    }

    // Copy: callbacks may add regions and rehash the map
    Callback enterFn = _regions[id].enter;
    if (enterFn) {
        if (auto res = enterFn(); !res) {
            return Err<void>("DrawRegionGuard: enter failed for region " + std::to_string(id), res);
        }
    }
    _current = id;
    return Ok();
}

Result<void> DrawRegionGuard::exit(RegionId id) {
    auto it = _regions.find(id);
    if (it == _regions.end()) {
        return Err<void>("DrawRegionGuard::exit: unknown region " + std::to_string(id));
    }

    // Clear first: an exit callback that draws may re-enter the guard
    if (isCurrent(id)) {
        _current.reset();
    }

    Callback exitFn = it->second.exit;
    if (exitFn) {
        if (auto res = exitFn(); !res) {
            return Err<void>("DrawRegionGuard: exit failed for region " + std::to_string(id), res);
        }
    }
    return Ok();
}

Result<void> DrawRegionGuard::exitCurrent() {
    if (!_current) {
        return Ok();
    }
    return exit(*_current);
}

} // namespace inkwell
