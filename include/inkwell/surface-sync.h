#pragma once

#include <cstdint>

namespace inkwell {

// Coherence between the raster surface, the composited export texture and the
// last silhouette read-back. A raster-dirty layer is always also
// silhouette-dirty; the tagged state makes the opposite unrepresentable.
enum class SurfaceState : uint8_t {
    Clean,            // silhouette matches the composited texture
    CompositedDirty,  // composited texture changed since the last read-back
    RasterDirty       // raster surface holds stamps not yet composited
};

inline const char* surfaceStateName(SurfaceState state) {
    switch (state) {
        case SurfaceState::Clean:           return "Clean";
        case SurfaceState::CompositedDirty: return "CompositedDirty";
        case SurfaceState::RasterDirty:     return "RasterDirty";
    }
    return "Unknown";
}

class SurfaceSync {
public:
    SurfaceState state() const { return _state; }

    bool rasterDirty() const { return _state == SurfaceState::RasterDirty; }
    bool silhouetteDirty() const { return _state != SurfaceState::Clean; }

    // Lines drawn, surface cleared or reallocated
    void compositedChanged() {
        if (_state == SurfaceState::Clean) {
            _state = SurfaceState::CompositedDirty;
        }
    }

    void stamped() { _state = SurfaceState::RasterDirty; }

    // Raster content is now part of the composited texture
    void rasterMerged() {
        if (_state == SurfaceState::RasterDirty) {
            _state = SurfaceState::CompositedDirty;
        }
    }

    // Raster surface emptied without merging (clear)
    void rasterDiscarded() {
        _state = SurfaceState::CompositedDirty;
    }

    // Pixels were read back from the composited texture. Pending raster
    // content is not part of that read, so a raster-dirty state stays.
    void silhouetteRead() {
        if (_state != SurfaceState::RasterDirty) {
            _state = SurfaceState::Clean;
        }
    }

private:
    SurfaceState _state = SurfaceState::Clean;
};

} // namespace inkwell
