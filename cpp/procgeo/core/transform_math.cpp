#include "procgeo/core/transform_math.h"

#include <cmath>

namespace procgeo {

namespace {

static constexpr double eps = 1e-12;

inline Point2 sub(const Point2& a, const Point2& b) noexcept { return Point2{a.x - b.x, a.y - b.y}; }

} // namespace

Point2 rotateAroundPivot(const Point2& point, const Point2& pivot, double angle) noexcept {
    const double cosA = std::cos(angle);
    const double sinA = std::sin(angle);
    const double dx = point.x - pivot.x;
    const double dy = point.y - pivot.y;
    return Point2{
        pivot.x + dx * cosA - dy * sinA,
        pivot.y + dx * sinA + dy * cosA,
    };
}

Point2 compensateCornerAnchoredRotation(double width, double height, double rotation) noexcept {
    const double cosR = std::cos(rotation);
    const double sinR = std::sin(rotation);
    const double hw = width * 0.5;
    const double hh = height * 0.5;
    return Point2{
        hw * (cosR - 1.0) - hh * sinR,
        hw * sinR + hh * (cosR - 1.0),
    };
}

Point2 cornerFromVisualCenter(const Point2& center, double width, double height, double rotation) noexcept {
    const Point2 d = compensateCornerAnchoredRotation(width, height, rotation);
    return Point2{
        center.x - width * 0.5 - d.x,
        center.y - height * 0.5 - d.y,
    };
}

Point2 visualCenterFromCorner(const Point2& corner, double width, double height, double rotation) noexcept {
    const Point2 d = compensateCornerAnchoredRotation(width, height, rotation);
    return Point2{
        corner.x + width * 0.5 + d.x,
        corner.y + height * 0.5 + d.y,
    };
}

Point2 tangent(const std::vector<Point2>& points, std::size_t index, bool isClosed) noexcept {
    const std::size_t n = points.size();
    if (n < 2 || index >= n) return Point2{1.0, 0.0};

    Point2 prev;
    Point2 next;
    if (isClosed) {
        prev = points[(index + n - 1) % n];
        next = points[(index + 1) % n];
    } else if (index == 0) {
        prev = points[0];
        next = points[1];
    } else if (index == n - 1) {
        prev = points[n - 2];
        next = points[n - 1];
    } else {
        prev = points[index - 1];
        next = points[index + 1];
    }

    const Point2 d = sub(next, prev);
    const double l = std::sqrt(d.x * d.x + d.y * d.y);
    if (!(l > eps)) return Point2{1.0, 0.0};
    return Point2{d.x / l, d.y / l};
}

Point2 normal(const std::vector<Point2>& points, std::size_t index, bool isClosed) noexcept {
    const Point2 t = tangent(points, index, isClosed);
    return Point2{-t.y, t.x};
}

} // namespace procgeo
