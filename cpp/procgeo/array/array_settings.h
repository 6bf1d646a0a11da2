#ifndef PROCGEO_ARRAY_ARRAY_SETTINGS_H
#define PROCGEO_ARRAY_ARRAY_SETTINGS_H

#include "procgeo/core/status.h"
#include "procgeo/shape/shape_state.h"

#include <cstdint>
#include <vector>

namespace procgeo {

// Upper bounds keep a single pass from exploding the instance count.
static constexpr std::uint32_t kMaxArrayCount = 1000;
static constexpr std::uint32_t kMaxGridExtent = 100;
static constexpr std::uint32_t kMaxLSystemIterations = 8;
// Worst-case clones grown from one source, every branch taken.
static constexpr std::uint64_t kMaxLSystemClones = 10000;

// Angles are degrees throughout; offsets and spacing are percent of the
// source size (or of the group bounds in group mode).

struct LinearArraySettings {
    std::uint32_t count{25};
    double offsetX{10.0};
    double offsetY{0.0};
    double rotationIncrement{0.0};
    double rotateAll{0.0};
    double scaleStep{0.98};
};

struct CircularArraySettings {
    std::uint32_t count{8};
    double radius{100.0};
    double startAngle{0.0};
    double endAngle{360.0};
    double centerX{0.0};
    double centerY{0.0};
    double rotateAll{0.0};
    double rotateEach{0.0};
    bool alignToTangent{false};
};

struct GridArraySettings {
    std::uint32_t rows{3};
    std::uint32_t columns{3};
    double spacingX{100.0};
    double spacingY{100.0};
    double rotateEach{0.0};
    double rotateEachRow{0.0};
    double rotateEachColumn{0.0};
    double rotateAll{0.0};
    double scaleStep{1.0};
    double rowScaleStep{1.0};
    double columnScaleStep{1.0};
};

// X reflects across the vertical line x = offset, Y across y = offset,
// Diagonal across y = x + offset, Point through (pointX, pointY).
struct MirrorSettings {
    MirrorAxis axis{MirrorAxis::X};
    double offset{0.0};
    double pointX{0.0};
    double pointY{0.0};
};

struct LSystemSettings {
    std::uint32_t iterations{4};
    double angle{25.0};
    double stepPercent{100.0};
    double lengthDecay{0.75};
    double scalePerIteration{1.0};
    std::vector<double> branches;    // empty means {+angle, -angle}
    double branchProbability{1.0};
    double angleJitter{0.0};
    std::uint32_t seed{0};
};

ValidationStatus validateSettings(const LinearArraySettings& s) noexcept;
ValidationStatus validateSettings(const CircularArraySettings& s) noexcept;
ValidationStatus validateSettings(const GridArraySettings& s) noexcept;
ValidationStatus validateSettings(const MirrorSettings& s) noexcept;
ValidationStatus validateSettings(const LSystemSettings& s) noexcept;

// Clones one source yields when every branch is taken: sum of b^k for
// k < iterations. Saturates just above kMaxLSystemClones.
std::uint64_t lsystemCloneBound(const LSystemSettings& s) noexcept;

// 32-bit linear congruential generator (Numerical Recipes constants).
struct Lcg {
    std::uint32_t state{0};

    explicit Lcg(std::uint32_t seed) noexcept : state(seed) {}

    // Advances the state and returns it normalized to [0, 1).
    double next() noexcept {
        state = state * 1664525u + 1013904223u;
        return static_cast<double>(state) / 4294967296.0;
    }
};

} // namespace procgeo

#endif // PROCGEO_ARRAY_ARRAY_SETTINGS_H
