#include "procgeo/core/logging.h"
#include "procgeo/path/path_modifiers.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace procgeo {

namespace {

static constexpr double kCornerAngleDeg = 60.0;

double pointSegmentDistance(const Point2& p, const Point2& a, const Point2& b) noexcept {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    if (dx == 0.0 && dy == 0.0) {
        return std::hypot(p.x - a.x, p.y - a.y);
    }
    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / (dx * dx + dy * dy);
    t = std::max(0.0, std::min(1.0, t));
    return std::hypot(p.x - (a.x + t * dx), p.y - (a.y + t * dy));
}

double triangleArea(const Point2& a, const Point2& b, const Point2& c) noexcept {
    return std::fabs((a.x * (b.y - c.y) + b.x * (c.y - a.y) + c.x * (a.y - b.y)) * 0.5);
}

// Marks the points of pts[first..last] that survive simplification.
void douglasPeucker(const std::vector<Point2>& pts, std::size_t first, std::size_t last, double tolerance,
                    std::vector<bool>& keep) {
    keep[first] = true;
    keep[last] = true;
    if (last <= first + 1) return;

    double maxDistance = 0.0;
    std::size_t maxIndex = first;
    for (std::size_t i = first + 1; i < last; ++i) {
        const double d = pointSegmentDistance(pts[i], pts[first], pts[last]);
        if (d > maxDistance) {
            maxDistance = d;
            maxIndex = i;
        }
    }
    if (maxDistance > tolerance) {
        douglasPeucker(pts, first, maxIndex, tolerance, keep);
        douglasPeucker(pts, maxIndex, last, tolerance, keep);
    }
}

std::vector<std::size_t> keptIndicesOpen(const std::vector<Point2>& pts, double tolerance) {
    std::vector<bool> keep(pts.size(), false);
    douglasPeucker(pts, 0, pts.size() - 1, tolerance, keep);
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < keep.size(); ++i) {
        if (keep[i]) out.push_back(i);
    }
    return out;
}

// Starts from the vertex spanning the largest triangle with its neighbours,
// simplifies the loop as an open run with a duplicated closing point, and maps
// the survivors back to original indices in original order.
std::vector<std::size_t> keptIndicesClosed(const std::vector<Point2>& pts, double tolerance) {
    const std::size_t n = pts.size();
    std::vector<std::size_t> all(n);
    for (std::size_t i = 0; i < n; ++i) all[i] = i;
    if (n <= 3) return all;

    double maxArea = 0.0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const double area = triangleArea(pts[(i + n - 1) % n], pts[i], pts[(i + 1) % n]);
        if (area > maxArea) {
            maxArea = area;
            start = i;
        }
    }

    std::vector<Point2> loop;
    loop.reserve(n + 1);
    for (std::size_t k = 0; k < n; ++k) loop.push_back(pts[(start + k) % n]);
    loop.push_back(pts[start]);

    std::vector<std::size_t> kept = keptIndicesOpen(loop, tolerance);
    kept.pop_back(); // duplicated closing point

    std::vector<std::size_t> out;
    out.reserve(kept.size());
    for (std::size_t k : kept) out.push_back((k + start) % n);
    std::sort(out.begin(), out.end());
    return out;
}

bool isSharpCorner(const std::vector<Point2>& pts, std::size_t i) noexcept {
    if (i == 0 || i + 1 >= pts.size()) return false;
    const Point2& prev = pts[i - 1];
    const Point2& cur = pts[i];
    const Point2& next = pts[i + 1];
    const double v1x = prev.x - cur.x;
    const double v1y = prev.y - cur.y;
    const double v2x = next.x - cur.x;
    const double v2y = next.y - cur.y;
    const double mag1 = std::sqrt(v1x * v1x + v1y * v1y);
    const double mag2 = std::sqrt(v2x * v2x + v2y * v2y);
    if (mag1 == 0.0 || mag2 == 0.0) return false;
    const double c = std::max(-1.0, std::min(1.0, (v1x * v2x + v1y * v2y) / (mag1 * mag2)));
    return std::acos(c) * 180.0 / kPi < kCornerAngleDeg;
}

// Re-adds sharp original vertices that no retained vertex already covers.
std::vector<std::size_t> restoreCorners(const std::vector<Point2>& pts, std::vector<std::size_t> kept,
                                        double tolerance) {
    const std::vector<std::size_t> retained = kept;
    for (std::size_t i = 1; i + 1 < pts.size(); ++i) {
        if (!isSharpCorner(pts, i)) continue;
        const Point2& p = pts[i];
        const bool covered = std::any_of(retained.begin(), retained.end(), [&](std::size_t k) {
            return std::fabs(pts[k].x - p.x) < tolerance && std::fabs(pts[k].y - p.y) < tolerance;
        });
        if (!covered) kept.push_back(i);
    }
    std::sort(kept.begin(), kept.end());
    kept.erase(std::unique(kept.begin(), kept.end()), kept.end());
    return kept;
}

} // namespace

PathModificationResult simplifyPath(const PathData& path, const SimplifySettings& settings) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("simplify: %s", describeStatus(status));
        return unchangedPath(path);
    }
    if (path.kind == PathKind::Svg) {
        PROCGEO_LOG_DEBUG("simplify: %s", describeStatus(ValidationStatus::UnsupportedPathType));
        return unchangedPath(path);
    }
    const std::size_t count = path.pointCount();
    if (count < 3 || count <= settings.minPoints) {
        PROCGEO_LOG_DEBUG("simplify: %s", describeStatus(ValidationStatus::InsufficientPoints));
        return unchangedPath(path);
    }

    const std::vector<Point2> anchors = path.kind == PathKind::Points ? path.points : anchorPoints(path.bezier);
    std::vector<std::size_t> kept = path.isClosed
        ? keptIndicesClosed(anchors, settings.tolerance)
        : keptIndicesOpen(anchors, settings.tolerance);

    if (kept.size() < settings.minPoints) {
        PROCGEO_LOG_DEBUG("simplify: result below minPoints (%zu < %u), keeping original",
                          kept.size(), settings.minPoints);
        return unchangedPath(path);
    }
    if (settings.preserveCorners && path.kind == PathKind::Points) {
        kept = restoreCorners(anchors, std::move(kept), settings.tolerance);
    }

    PathData out = path;
    if (path.kind == PathKind::Points) {
        out.points.clear();
        for (std::size_t k : kept) out.points.push_back(path.points[k]);
    } else {
        // Survivors keep their own handles.
        out.bezier.clear();
        for (std::size_t k : kept) out.bezier.push_back(path.bezier[k]);
    }
    return modifiedPath(std::move(out));
}

} // namespace procgeo
