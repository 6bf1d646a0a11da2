#include "procgeo/core/logging.h"
#include "procgeo/core/transform_math.h"
#include "procgeo/path/path_modifiers.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace procgeo {

namespace {

static constexpr double kHandleSeedOffset1 = 1000.0;
static constexpr double kHandleSeedOffset2 = 2000.0;
static constexpr double kHandleAmplitudeScale = 0.3;

// Maps path coordinates into the unit square of the path's bounds.
struct NoiseFrame {
    Bounds bounds{0.0, 0.0, 100.0, 100.0};

    Point2 normalize(double x, double y) const noexcept {
        return Point2{(x - bounds.x) / bounds.w, (y - bounds.y) / bounds.h};
    }
};

NoiseFrame frameFor(const PathData& path) {
    NoiseFrame frame;
    if (path.pointCount() == 0) return frame;
    const Bounds b = path.bounds ? *path.bounds : computePathBounds(path).value_or(frame.bounds);
    frame.bounds = Bounds{b.x, b.y, std::max(1.0, b.w), std::max(1.0, b.h)};
    return frame;
}

Point2 displacementDirection(const std::vector<Point2>& anchors, std::size_t i, bool closed,
                             NoiseDirection direction, double noiseValue) noexcept {
    switch (direction) {
        case NoiseDirection::Normal: return normal(anchors, i, closed);
        case NoiseDirection::Tangent: return tangent(anchors, i, closed);
        case NoiseDirection::Both: break;
    }
    const double angle = noiseValue * kTwoPi;
    return Point2{std::cos(angle), std::sin(angle)};
}

double sampleAt(const NoiseFrame& frame, const Point2& p, const NoiseOffsetSettings& s, double seed) noexcept {
    const Point2 n = frame.normalize(p.x, p.y);
    return fractalNoise(n.x * s.frequency, n.y * s.frequency, s.octaves, seed);
}

inline Point2 offsetAlong(const Point2& p, const Point2& dir, double distance) noexcept {
    return Point2{p.x + dir.x * distance, p.y + dir.y * distance};
}

} // namespace

double hashNoise(double x, double y) noexcept {
    const double n = std::sin(x * 12.9898 + y * 78.233) * 43758.5453123;
    return (n - std::floor(n)) * 2.0 - 1.0;
}

double fractalNoise(double x, double y, std::uint32_t octaves, double seed) noexcept {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;
    double total = 0.0;
    for (std::uint32_t i = 0; i < octaves; ++i) {
        value += hashNoise(x * frequency + seed, y * frequency + seed) * amplitude;
        total += amplitude;
        amplitude *= 0.5;
        frequency *= 2.0;
    }
    return total > 0.0 ? value / total : 0.0;
}

PathModificationResult noiseOffsetPath(const PathData& path, const NoiseOffsetSettings& settings) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("noise offset: %s", describeStatus(status));
        return unchangedPath(path);
    }
    if (path.kind == PathKind::Svg) {
        PROCGEO_LOG_DEBUG("noise offset: %s", describeStatus(ValidationStatus::UnsupportedPathType));
        return unchangedPath(path);
    }
    if (path.pointCount() < 2) {
        PROCGEO_LOG_DEBUG("noise offset: %s", describeStatus(ValidationStatus::InsufficientPoints));
        return unchangedPath(path);
    }

    const NoiseFrame frame = frameFor(path);
    const double baseSeed = static_cast<double>(settings.seed);
    PathData out = path;

    if (path.kind == PathKind::Points) {
        for (std::size_t i = 0; i < path.points.size(); ++i) {
            const double v = sampleAt(frame, path.points[i], settings, baseSeed + static_cast<double>(i));
            const Point2 dir = displacementDirection(path.points, i, path.isClosed, settings.direction, v);
            out.points[i] = offsetAlong(path.points[i], dir, settings.amplitude * v);
        }
        return modifiedPath(std::move(out));
    }

    const std::vector<Point2> anchors = anchorPoints(path.bezier);
    for (std::size_t i = 0; i < path.bezier.size(); ++i) {
        const BezierPoint& src = path.bezier[i];
        const double seed = baseSeed + static_cast<double>(i);
        const double v = sampleAt(frame, anchors[i], settings, seed);
        const Point2 dir = displacementDirection(anchors, i, path.isClosed, settings.direction, v);
        const Point2 moved = offsetAlong(anchors[i], dir, settings.amplitude * v);

        BezierPoint& dst = out.bezier[i];
        dst.x = moved.x;
        dst.y = moved.y;
        // Handles move along the anchor's direction with their own noise sample.
        if (src.cp1) {
            const double hv = sampleAt(frame, *src.cp1, settings, seed + kHandleSeedOffset1);
            dst.cp1 = offsetAlong(*src.cp1, dir, settings.amplitude * hv * kHandleAmplitudeScale);
        }
        if (src.cp2) {
            const double hv = sampleAt(frame, *src.cp2, settings, seed + kHandleSeedOffset2);
            dst.cp2 = offsetAlong(*src.cp2, dir, settings.amplitude * hv * kHandleAmplitudeScale);
        }
    }
    return modifiedPath(std::move(out));
}

} // namespace procgeo
