#include "procgeo/core/logging.h"
#include "procgeo/path/path_modifiers.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace procgeo {

namespace {

struct Neighbors {
    const Point2* prev{nullptr};
    const Point2* next{nullptr};
};

Neighbors neighborsOf(const std::vector<Point2>& pts, std::size_t i, bool closed) noexcept {
    const std::size_t n = pts.size();
    Neighbors nb;
    if (i > 0) nb.prev = &pts[i - 1];
    else if (closed) nb.prev = &pts[n - 1];
    if (i + 1 < n) nb.next = &pts[i + 1];
    else if (closed) nb.next = &pts[0];
    return nb;
}

// Open endpoints and zero-length incident edges count as corners.
bool isCorner(const std::vector<Point2>& pts, std::size_t i, double thresholdDeg, bool closed) noexcept {
    const Neighbors nb = neighborsOf(pts, i, closed);
    if (!nb.prev || !nb.next) return true;
    const Point2& cur = pts[i];
    const double v1x = nb.prev->x - cur.x;
    const double v1y = nb.prev->y - cur.y;
    const double v2x = nb.next->x - cur.x;
    const double v2y = nb.next->y - cur.y;
    const double mag1 = std::sqrt(v1x * v1x + v1y * v1y);
    const double mag2 = std::sqrt(v2x * v2x + v2y * v2y);
    if (mag1 == 0.0 || mag2 == 0.0) return true;
    const double c = std::max(-1.0, std::min(1.0, (v1x * v2x + v1y * v2y) / (mag1 * mag2)));
    const double deg = std::acos(c) * 180.0 / kPi;
    return deg < thresholdDeg;
}

inline Point2 relax(const Point2& cur, const Point2& prev, const Point2& next, double f) noexcept {
    return Point2{
        cur.x * (1.0 - f) + (prev.x + next.x) * f * 0.5,
        cur.y * (1.0 - f) + (prev.y + next.y) * f * 0.5,
    };
}

inline Point2 pullToward(const Point2& handle, const Point2& anchor, double w) noexcept {
    return Point2{handle.x * (1.0 - w) + anchor.x * w, handle.y * (1.0 - w) + anchor.y * w};
}

std::vector<Point2> smoothPointsOnce(const std::vector<Point2>& pts, const SmoothSettings& s, bool closed) {
    std::vector<Point2> out;
    out.reserve(pts.size());
    for (std::size_t i = 0; i < pts.size(); ++i) {
        if (s.preserveCorners && isCorner(pts, i, s.cornerThreshold, closed)) {
            out.push_back(pts[i]);
            continue;
        }
        const Neighbors nb = neighborsOf(pts, i, closed);
        if (nb.prev && nb.next) {
            out.push_back(relax(pts[i], *nb.prev, *nb.next, s.factor));
        } else {
            out.push_back(pts[i]);
        }
    }
    return out;
}

std::vector<BezierPoint> smoothBezierOnce(const std::vector<BezierPoint>& pts, const SmoothSettings& s, bool closed) {
    const std::vector<Point2> anchors = anchorPoints(pts);
    const double handleWeight = s.factor * 0.5;
    std::vector<BezierPoint> out;
    out.reserve(pts.size());
    for (std::size_t i = 0; i < pts.size(); ++i) {
        BezierPoint p = pts[i];
        if (s.preserveCorners && isCorner(anchors, i, s.cornerThreshold, closed)) {
            out.push_back(p);
            continue;
        }
        const Neighbors nb = neighborsOf(anchors, i, closed);
        if (nb.prev && nb.next) {
            const Point2 moved = relax(anchors[i], *nb.prev, *nb.next, s.factor);
            p.x = moved.x;
            p.y = moved.y;
        }
        if (p.cp1 && nb.prev) p.cp1 = pullToward(*pts[i].cp1, *nb.prev, handleWeight);
        if (p.cp2 && nb.next) p.cp2 = pullToward(*pts[i].cp2, *nb.next, handleWeight);
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace

PathModificationResult smoothPath(const PathData& path, const SmoothSettings& settings) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("smooth: %s", describeStatus(status));
        return unchangedPath(path);
    }
    if (path.kind == PathKind::Svg) {
        PROCGEO_LOG_DEBUG("smooth: %s", describeStatus(ValidationStatus::UnsupportedPathType));
        return unchangedPath(path);
    }
    if (path.pointCount() < 3) {
        PROCGEO_LOG_DEBUG("smooth: %s", describeStatus(ValidationStatus::InsufficientPoints));
        return unchangedPath(path);
    }

    PathData out = path;
    for (std::uint32_t it = 0; it < settings.iterations; ++it) {
        if (out.kind == PathKind::Points) {
            out.points = smoothPointsOnce(out.points, settings, out.isClosed);
        } else {
            out.bezier = smoothBezierOnce(out.bezier, settings, out.isClosed);
        }
    }
    return modifiedPath(std::move(out));
}

} // namespace procgeo
