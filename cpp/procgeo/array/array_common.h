#pragma once

#include "procgeo/core/types.h"
#include "procgeo/shape/shape_state.h"

#include <cstdint>

// Helpers shared by the array processors. Not part of the public API.

namespace procgeo {
namespace array_detail {

// Maps positions authored around the group's source center onto its current
// placement. Without a groupTransform the mapping is the identity.
struct GroupFrame {
    Point2 sourceCenter{};
    Point2 anchor{};
    double rotation{0.0};
    Size2 bounds{};

    Point2 place(const Point2& local) const noexcept;
};

GroupFrame makeGroupFrame(const GroupContext& group) noexcept;

// rotateAroundPivot about the origin.
Point2 rotateVector(const Point2& v, double angle) noexcept;

// 1 + (step - 1) * progress.
inline double interpolateScale(double step, double progress) noexcept { return 1.0 + (step - 1.0) * progress; }

// index / (count - 1), 0 for a single item.
inline double progressOf(std::uint32_t index, std::uint32_t count) noexcept {
    return count > 1 ? static_cast<double>(index) / static_cast<double>(count - 1) : 0.0;
}

// Copy of `source` whose visual center lands on `center`, with the given
// rotation and the source scale multiplied by `scaleFactor`. Corner-anchor
// compensation uses the clone's scaled size. A clone that lands exactly on
// the source keeps the source transform unchanged.
ShapeInstance placeClone(const ShapeInstance& source, const Point2& center, double rotation, double scaleFactor);

// Stamps array provenance onto a clone.
void markClone(ShapeInstance& clone, std::uint32_t arrayIndex, std::uint32_t sourceInstance, bool groupMode);

} // namespace array_detail
} // namespace procgeo
