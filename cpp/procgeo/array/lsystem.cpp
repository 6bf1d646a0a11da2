#include "procgeo/array/array_common.h"
#include "procgeo/array/array_processors.h"
#include "procgeo/core/logging.h"
#include "procgeo/core/transform_math.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace procgeo {

using array_detail::placeClone;

namespace {

constexpr std::uint32_t kLevelSeedStride = 997;

struct Turtle {
    Point2 position;
    double heading{0.0};
    std::uint32_t depth{0};
    double length{0.0};
    std::uint32_t level{0};
};

struct BranchContext {
    const LSystemSettings& settings;
    const ShapeInstance& source;
    std::uint32_t sourceIndex;
    std::vector<double> branchAngles; // radians
    std::size_t firstSlot;            // out.size() before this source grew
};

// Advances, emits a clone at the new position, then recurses into each branch
// that survives its probability draw. Draws come from a generator reseeded for
// the current level.
void grow(const BranchContext& ctx, const Turtle& turtle, std::vector<ShapeInstance>& out) {
    if (turtle.depth == 0) return;

    const Point2 next{turtle.position.x + std::cos(turtle.heading) * turtle.length,
        turtle.position.y + std::sin(turtle.heading) * turtle.length};

    const double scale = std::pow(ctx.settings.scalePerIteration, static_cast<double>(turtle.level));
    ShapeInstance clone = placeClone(ctx.source, next, turtle.heading + kHalfPi, scale);
    // Emission order within the source's tree; the source itself is 0.
    clone.metadata.arrayIndex = static_cast<std::uint32_t>(out.size() - ctx.firstSlot + 1);
    clone.metadata.sourceInstance = ctx.sourceIndex;
    clone.metadata.lsystem = true;
    clone.metadata.lsystemDepth = turtle.depth;
    out.push_back(std::move(clone));

    Lcg rng(ctx.settings.seed + turtle.level * kLevelSeedStride);
    const double jitter = degToRad(ctx.settings.angleJitter);
    for (double branch : ctx.branchAngles) {
        if (rng.next() >= ctx.settings.branchProbability) continue;
        double angle = branch;
        if (jitter != 0.0) {
            angle += (2.0 * rng.next() - 1.0) * jitter;
        }
        Turtle child;
        child.position = next;
        child.heading = turtle.heading + angle;
        child.depth = turtle.depth - 1;
        child.length = turtle.length * ctx.settings.lengthDecay;
        child.level = turtle.level + 1;
        grow(ctx, child, out);
    }
}

} // namespace

ShapeState applyLSystem(const ShapeState& input, const LSystemSettings& settings) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("lsystem: %s", describeStatus(status));
        return input;
    }

    std::vector<double> branchAngles;
    if (settings.branches.empty()) {
        branchAngles = {degToRad(settings.angle), -degToRad(settings.angle)};
    } else {
        for (double b : settings.branches) branchAngles.push_back(degToRad(b));
    }

    ShapeState out = input;
    for (std::uint32_t j = 0; j < static_cast<std::uint32_t>(input.instances.size()); ++j) {
        const ShapeInstance& src = input.instances[j];
        const Size2 size = scaledSize(src);

        Turtle start;
        start.position = instanceVisualCenter(src);
        start.heading = src.transform.rotation != 0.0 ? src.transform.rotation : -kHalfPi;
        start.depth = settings.iterations;
        start.length = std::max(size.width, size.height) * settings.stepPercent / 100.0;

        const BranchContext ctx{settings, src, j, branchAngles, out.instances.size()};
        grow(ctx, start, out.instances);
    }

    reindex(out);
    PROCGEO_LOG_DEBUG("lsystem: %zu -> %zu instances", input.instances.size(), out.instances.size());
    return out;
}

} // namespace procgeo
