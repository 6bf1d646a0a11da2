#include "procgeo/path/path_modifiers.h"

#include <cmath>
#include <utility>

namespace procgeo {

PathModificationResult unchangedPath(const PathData& input) {
    PathModificationResult r;
    r.pathData = input;
    r.boundsChanged = false;
    return r;
}

PathModificationResult modifiedPath(PathData output) {
    PathModificationResult r;
    r.pathData = withComputedBounds(std::move(output));
    r.boundsChanged = true;
    r.newBounds = r.pathData.bounds;
    return r;
}

ValidationStatus validateSettings(const SubdivideSettings& s) noexcept {
    if (s.iterations > 10) return ValidationStatus::InvalidIterations;
    if (!std::isfinite(s.factor) || s.factor <= 0.0 || s.factor >= 1.0) return ValidationStatus::InvalidFactor;
    return ValidationStatus::Ok;
}

ValidationStatus validateSettings(const SmoothSettings& s) noexcept {
    if (s.iterations < 1 || s.iterations > 10) return ValidationStatus::InvalidIterations;
    if (!std::isfinite(s.factor) || s.factor < 0.0 || s.factor > 1.0) return ValidationStatus::InvalidFactor;
    if (!std::isfinite(s.cornerThreshold) || s.cornerThreshold < 0.0 || s.cornerThreshold > 180.0) {
        return ValidationStatus::InvalidThreshold;
    }
    return ValidationStatus::Ok;
}

ValidationStatus validateSettings(const SimplifySettings& s) noexcept {
    if (!std::isfinite(s.tolerance) || s.tolerance < 0.0) return ValidationStatus::InvalidTolerance;
    if (s.minPoints < 2) return ValidationStatus::InvalidMinPoints;
    return ValidationStatus::Ok;
}

ValidationStatus validateSettings(const NoiseOffsetSettings& s) noexcept {
    if (!std::isfinite(s.amplitude) || s.amplitude < 0.0) return ValidationStatus::InvalidAmplitude;
    if (!std::isfinite(s.frequency) || s.frequency <= 0.0) return ValidationStatus::InvalidFrequency;
    if (s.octaves < 1 || s.octaves > 8) return ValidationStatus::InvalidOctaves;
    switch (s.direction) {
        case NoiseDirection::Both:
        case NoiseDirection::Normal:
        case NoiseDirection::Tangent:
            return ValidationStatus::Ok;
    }
    return ValidationStatus::InvalidDirection;
}

} // namespace procgeo
