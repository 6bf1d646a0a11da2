#ifndef PROCGEO_BOOLEAN_GEOMETRY_ENGINE_H
#define PROCGEO_BOOLEAN_GEOMETRY_ENGINE_H

#include "procgeo/boolean/bounds_oracle.h"
#include "procgeo/boolean/polygon_cache.h"
#include "procgeo/boolean/polygon_clipper.h"
#include "procgeo/boolean/polygon_types.h"
#include "procgeo/shape/shape.h"
#include "procgeo/shape/shape_state.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace procgeo {

struct GeometryEngineOptions {
    std::uint32_t ellipseSegments{32};
    std::uint32_t circleSegments{32};
    std::uint32_t defaultPolygonSides{procgeo::defaultPolygonSides};
    std::size_t cacheCapacity{0}; // 0 = unbounded
};

// Placement hint for outlines built from array-generated groups.
struct PositionContext {
    Point2 collectiveCenter{};
};

// Style applied to boolean outlines when the source carries none.
inline constexpr const char* kDefaultOutlineColor = "#000000";
static constexpr double kDefaultOutlineStrokeWidth = 2.0;

// Converts shapes to polygon rings and combines them with a PolygonClipper.
// One engine per editing session; the outline cache lives and dies with it.
class GeometryEngine {
public:
    explicit GeometryEngine(PolygonClipper& clipper, GeometryEngineOptions options = GeometryEngineOptions());

    GeometryEngine(const GeometryEngine&) = delete;
    GeometryEngine& operator=(const GeometryEngine&) = delete;

    // World-space outline of `shape`. Memoized by polygonCacheKey().
    MultiPolygon shapeToPolygon(const Shape& shape);

    // Left fold of `op` over the shapes' outlines in input order.
    MultiPolygon performBooleanOperation(const std::vector<Shape>& shapes, BooleanOp op);

    // Union/Exclude: largest approximate area, first wins ties.
    // Subtract/Intersect: the first shape. nullptr for empty input.
    const Shape* selectStyleSourceShape(const std::vector<Shape>& shapes, BooleanOp op) const;

    // Rebuilds a closed, anchor-only Bezier shape from the outer ring of the
    // first polygon. Holes and further polygons are dropped. Degenerate input
    // returns `originalShape` unchanged. Style comes from `styleSourceShape`
    // (else the original); fillColor falls back to color and fill to true.
    Shape polygonToOutlineShape(const MultiPolygon& polygon, const Shape& originalShape,
        const PositionContext* positionContext = nullptr, const Shape* styleSourceShape = nullptr);

    // Not owned; may be null.
    void setBoundsOracle(const BoundsOracle* oracle) noexcept { oracle_ = oracle; }

    PolygonCache& cache() noexcept { return cache_; }
    const PolygonCache& cache() const noexcept { return cache_; }
    const GeometryEngineOptions& options() const noexcept { return options_; }

private:
    MultiPolygon buildPolygon(const Shape& shape) const;

    PolygonClipper& clipper_;
    GeometryEngineOptions options_;
    PolygonCache cache_;
    const BoundsOracle* oracle_{nullptr};
};

// Fingerprint of everything that shapes the outline: id, position, rotation
// and the geometric props.
std::string polygonCacheKey(const Shape& shape);

// w*h, or pi*r^2 for circles.
double approximateArea(const Shape& shape) noexcept;

// Keeps each style field only where every shape agrees on it.
ShapeStyle computeSharedStyle(const std::vector<Shape>& shapes);

// Axis-aligned box over every instance's scaled, unrotated footprint.
Bounds collectiveBounds(const ShapeState& state) noexcept;

} // namespace procgeo

#endif // PROCGEO_BOOLEAN_GEOMETRY_ENGINE_H
