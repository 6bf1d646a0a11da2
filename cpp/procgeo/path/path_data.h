#ifndef PROCGEO_PATH_PATH_DATA_H
#define PROCGEO_PATH_PATH_DATA_H

#include "procgeo/core/types.h"
#include "procgeo/shape/shape.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procgeo {

enum class PathKind : std::uint8_t { Points = 0, Bezier = 1, Svg = 2 };

const char* pathKindName(PathKind kind) noexcept;

// Outline or skeleton of a shape, independent of the host's property schema.
// Only the member matching `kind` is meaningful. `bounds`, when set, tightly
// encloses the data including bezier handles.
struct PathData {
    PathKind kind{PathKind::Points};
    std::vector<Point2> points;
    std::vector<BezierPoint> bezier;
    std::string svg;
    bool isClosed{false};
    std::optional<Bounds> bounds;

    static PathData fromPoints(std::vector<Point2> pts, bool closed);
    static PathData fromBezier(std::vector<BezierPoint> pts, bool closed);
    static PathData fromSvg(std::string description, bool closed);

    std::size_t pointCount() const noexcept;
};

Bounds computePointBounds(const std::vector<Point2>& points) noexcept;

// Includes cp1/cp2 handles, not just anchors.
Bounds computeBezierBounds(const std::vector<BezierPoint>& points) noexcept;

// Svg paths are opaque and yield nullopt.
std::optional<Bounds> computePathBounds(const PathData& path);

// Returns `path` with bounds recomputed from its data.
PathData withComputedBounds(PathData path);

std::vector<Point2> anchorPoints(const std::vector<BezierPoint>& points);

} // namespace procgeo

#endif // PROCGEO_PATH_PATH_DATA_H
