#pragma once

#include "procgeo/core/types.h"

#include <cstddef>
#include <vector>

namespace procgeo {

inline double degToRad(double deg) noexcept { return deg * kPi / 180.0; }
inline double radToDeg(double rad) noexcept { return rad * 180.0 / kPi; }

Point2 rotateAroundPivot(const Point2& point, const Point2& pivot, double angle) noexcept;

// Hosts rotate shapes about their top-left corner. For a shape of size (w, h)
// rotated by `rotation`, returns the delta (dx, dy) such that
//   corner = desiredCenter - (w/2, h/2) - (dx, dy)
// makes the shape appear rotated about its visual center.
Point2 compensateCornerAnchoredRotation(double width, double height, double rotation) noexcept;

// Corner-anchored transform position that places the visual center at `center`.
Point2 cornerFromVisualCenter(const Point2& center, double width, double height, double rotation) noexcept;

// Inverse of cornerFromVisualCenter.
Point2 visualCenterFromCorner(const Point2& corner, double width, double height, double rotation) noexcept;

// Unit direction of the polyline at `index`, centered difference in the
// interior (wrapping when closed), one-sided at open endpoints. Returns (1, 0)
// for degenerate input.
Point2 tangent(const std::vector<Point2>& points, std::size_t index, bool isClosed) noexcept;

// Left-hand normal of tangent(): (-t.y, t.x).
Point2 normal(const std::vector<Point2>& points, std::size_t index, bool isClosed) noexcept;

} // namespace procgeo
