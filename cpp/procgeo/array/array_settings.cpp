#include "procgeo/array/array_settings.h"

#include <cmath>
#include <initializer_list>

namespace procgeo {

namespace {

bool allFinite(std::initializer_list<double> values) noexcept {
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

bool positiveScale(double s) noexcept { return std::isfinite(s) && s > 0.0; }

} // namespace

ValidationStatus validateSettings(const LinearArraySettings& s) noexcept {
    if (s.count < 1 || s.count > kMaxArrayCount) return ValidationStatus::InvalidCount;
    if (!allFinite({s.offsetX, s.offsetY, s.rotationIncrement, s.rotateAll})) return ValidationStatus::InvalidFactor;
    if (!positiveScale(s.scaleStep)) return ValidationStatus::InvalidScale;
    return ValidationStatus::Ok;
}

ValidationStatus validateSettings(const CircularArraySettings& s) noexcept {
    if (s.count < 1 || s.count > kMaxArrayCount) return ValidationStatus::InvalidCount;
    if (!std::isfinite(s.radius) || s.radius < 0.0) return ValidationStatus::InvalidRadius;
    if (!allFinite({s.startAngle, s.endAngle, s.centerX, s.centerY, s.rotateAll, s.rotateEach})) {
        return ValidationStatus::InvalidFactor;
    }
    return ValidationStatus::Ok;
}

ValidationStatus validateSettings(const GridArraySettings& s) noexcept {
    if (s.rows < 1 || s.columns < 1 || s.rows > kMaxGridExtent || s.columns > kMaxGridExtent) {
        return ValidationStatus::InvalidCount;
    }
    if (!allFinite({s.spacingX, s.spacingY, s.rotateEach, s.rotateEachRow, s.rotateEachColumn, s.rotateAll})) {
        return ValidationStatus::InvalidFactor;
    }
    if (!positiveScale(s.scaleStep) || !positiveScale(s.rowScaleStep) || !positiveScale(s.columnScaleStep)) {
        return ValidationStatus::InvalidScale;
    }
    return ValidationStatus::Ok;
}

ValidationStatus validateSettings(const MirrorSettings& s) noexcept {
    if (!allFinite({s.offset, s.pointX, s.pointY})) return ValidationStatus::InvalidFactor;
    switch (s.axis) {
        case MirrorAxis::X:
        case MirrorAxis::Y:
        case MirrorAxis::Diagonal:
        case MirrorAxis::Point:
            return ValidationStatus::Ok;
    }
    return ValidationStatus::InvalidAxis;
}

ValidationStatus validateSettings(const LSystemSettings& s) noexcept {
    if (s.iterations > kMaxLSystemIterations) return ValidationStatus::InvalidIterations;
    if (!allFinite({s.angle, s.angleJitter})) return ValidationStatus::InvalidFactor;
    if (!std::isfinite(s.stepPercent) || s.stepPercent <= 0.0) return ValidationStatus::InvalidFactor;
    if (!std::isfinite(s.lengthDecay) || s.lengthDecay <= 0.0) return ValidationStatus::InvalidFactor;
    if (!positiveScale(s.scalePerIteration)) return ValidationStatus::InvalidScale;
    if (!std::isfinite(s.branchProbability) || s.branchProbability < 0.0 || s.branchProbability > 1.0) {
        return ValidationStatus::InvalidProbability;
    }
    for (double b : s.branches) {
        if (!std::isfinite(b)) return ValidationStatus::InvalidFactor;
    }
    if (lsystemCloneBound(s) > kMaxLSystemClones) return ValidationStatus::InvalidCount;
    return ValidationStatus::Ok;
}

std::uint64_t lsystemCloneBound(const LSystemSettings& s) noexcept {
    const std::uint64_t branching = s.branches.empty() ? 2u : static_cast<std::uint64_t>(s.branches.size());
    std::uint64_t total = 0;
    std::uint64_t level = 1;
    for (std::uint32_t k = 0; k < s.iterations; ++k) {
        total += level;
        if (total > kMaxLSystemClones) return kMaxLSystemClones + 1;
        level *= branching;
        if (level > kMaxLSystemClones) level = kMaxLSystemClones + 1;
    }
    return total;
}

} // namespace procgeo
