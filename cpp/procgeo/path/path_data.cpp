#include "procgeo/path/path_data.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace procgeo {

namespace {

struct Extent {
    double minX{std::numeric_limits<double>::infinity()};
    double minY{std::numeric_limits<double>::infinity()};
    double maxX{-std::numeric_limits<double>::infinity()};
    double maxY{-std::numeric_limits<double>::infinity()};

    void include(double x, double y) noexcept {
        minX = std::min(minX, x);
        minY = std::min(minY, y);
        maxX = std::max(maxX, x);
        maxY = std::max(maxY, y);
    }

    bool empty() const noexcept { return minX > maxX; }

    Bounds toBounds() const noexcept {
        if (empty()) return Bounds{};
        return Bounds{minX, minY, maxX - minX, maxY - minY};
    }
};

} // namespace

const char* pathKindName(PathKind kind) noexcept {
    switch (kind) {
        case PathKind::Points: return "points";
        case PathKind::Bezier: return "bezier";
        case PathKind::Svg: return "svg";
    }
    return "unknown";
}

PathData PathData::fromPoints(std::vector<Point2> pts, bool closed) {
    PathData p;
    p.kind = PathKind::Points;
    p.points = std::move(pts);
    p.isClosed = closed;
    return p;
}

PathData PathData::fromBezier(std::vector<BezierPoint> pts, bool closed) {
    PathData p;
    p.kind = PathKind::Bezier;
    p.bezier = std::move(pts);
    p.isClosed = closed;
    return p;
}

PathData PathData::fromSvg(std::string description, bool closed) {
    PathData p;
    p.kind = PathKind::Svg;
    p.svg = std::move(description);
    p.isClosed = closed;
    return p;
}

std::size_t PathData::pointCount() const noexcept {
    switch (kind) {
        case PathKind::Points: return points.size();
        case PathKind::Bezier: return bezier.size();
        case PathKind::Svg: return 0;
    }
    return 0;
}

Bounds computePointBounds(const std::vector<Point2>& points) noexcept {
    Extent e;
    for (const Point2& p : points) e.include(p.x, p.y);
    return e.toBounds();
}

Bounds computeBezierBounds(const std::vector<BezierPoint>& points) noexcept {
    Extent e;
    for (const BezierPoint& p : points) {
        e.include(p.x, p.y);
        if (p.cp1) e.include(p.cp1->x, p.cp1->y);
        if (p.cp2) e.include(p.cp2->x, p.cp2->y);
    }
    return e.toBounds();
}

std::optional<Bounds> computePathBounds(const PathData& path) {
    switch (path.kind) {
        case PathKind::Points: return computePointBounds(path.points);
        case PathKind::Bezier: return computeBezierBounds(path.bezier);
        case PathKind::Svg: return std::nullopt;
    }
    return std::nullopt;
}

PathData withComputedBounds(PathData path) {
    path.bounds = computePathBounds(path);
    return path;
}

std::vector<Point2> anchorPoints(const std::vector<BezierPoint>& points) {
    std::vector<Point2> out;
    out.reserve(points.size());
    for (const BezierPoint& p : points) out.push_back(Point2{p.x, p.y});
    return out;
}

} // namespace procgeo
