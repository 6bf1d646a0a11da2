#include "procgeo/core/logging.h"
#include "procgeo/path/path_modifiers.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace procgeo {

namespace {

inline Point2 lerp(const Point2& a, const Point2& b, double t) noexcept {
    return Point2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

std::vector<Point2> subdividePoints(const std::vector<Point2>& pts, bool closed, double factor) {
    std::vector<Point2> out;
    out.reserve(pts.size() * 2);
    const std::size_t n = pts.size();
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(pts[i]);
        const bool hasNext = i + 1 < n;
        if (hasNext || closed) {
            out.push_back(lerp(pts[i], pts[hasNext ? i + 1 : 0], factor));
        }
    }
    return out;
}

// Straight-line blend; handles are interpolated only when both sides have one.
BezierPoint splitBezierSegment(const BezierPoint& a, const BezierPoint& b, double factor) {
    BezierPoint mid;
    mid.x = a.x + (b.x - a.x) * factor;
    mid.y = a.y + (b.y - a.y) * factor;
    if (a.cp2 && b.cp1) {
        mid.cp1 = lerp(*a.cp2, *b.cp1, factor);
    }
    return mid;
}

std::vector<BezierPoint> subdivideBezier(const std::vector<BezierPoint>& pts, bool closed, double factor) {
    std::vector<BezierPoint> out;
    out.reserve(pts.size() * 2);
    const std::size_t n = pts.size();
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(pts[i]);
        const bool hasNext = i + 1 < n;
        if (hasNext || closed) {
            out.push_back(splitBezierSegment(pts[i], pts[hasNext ? i + 1 : 0], factor));
        }
    }
    return out;
}

// (prev + 2*cur + next) / 4. Open endpoints stay fixed.
std::vector<Point2> relaxPoints(const std::vector<Point2>& pts, bool closed) {
    const std::size_t n = pts.size();
    if (n < 3) return pts;
    std::vector<Point2> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (!closed && (i == 0 || i == n - 1)) {
            out[i] = pts[i];
            continue;
        }
        const Point2& prev = pts[(i + n - 1) % n];
        const Point2& cur = pts[i];
        const Point2& next = pts[(i + 1) % n];
        out[i] = Point2{(prev.x + 2.0 * cur.x + next.x) * 0.25, (prev.y + 2.0 * cur.y + next.y) * 0.25};
    }
    return out;
}

void relaxBezier(std::vector<BezierPoint>& pts, bool closed) {
    const std::vector<Point2> relaxed = relaxPoints(anchorPoints(pts), closed);
    for (std::size_t i = 0; i < pts.size(); ++i) {
        const double dx = relaxed[i].x - pts[i].x;
        const double dy = relaxed[i].y - pts[i].y;
        pts[i].x = relaxed[i].x;
        pts[i].y = relaxed[i].y;
        // Handles ride along with their anchor.
        if (pts[i].cp1) pts[i].cp1 = Point2{pts[i].cp1->x + dx, pts[i].cp1->y + dy};
        if (pts[i].cp2) pts[i].cp2 = Point2{pts[i].cp2->x + dx, pts[i].cp2->y + dy};
    }
}

} // namespace

PathModificationResult subdividePath(const PathData& path, const SubdivideSettings& settings) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("subdivide: %s", describeStatus(status));
        return unchangedPath(path);
    }
    if (path.kind == PathKind::Svg) {
        PROCGEO_LOG_DEBUG("subdivide: %s", describeStatus(ValidationStatus::UnsupportedPathType));
        return unchangedPath(path);
    }
    if (path.pointCount() < 2) {
        PROCGEO_LOG_DEBUG("subdivide: %s", describeStatus(ValidationStatus::InsufficientPoints));
        return unchangedPath(path);
    }

    PathData out = path;
    for (std::uint32_t it = 0; it < settings.iterations; ++it) {
        if (out.kind == PathKind::Points) {
            out.points = subdividePoints(out.points, out.isClosed, settings.factor);
            if (settings.smooth) out.points = relaxPoints(out.points, out.isClosed);
        } else {
            out.bezier = subdivideBezier(out.bezier, out.isClosed, settings.factor);
            if (settings.smooth) relaxBezier(out.bezier, out.isClosed);
        }
    }
    return modifiedPath(std::move(out));
}

} // namespace procgeo
