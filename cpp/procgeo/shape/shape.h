#ifndef PROCGEO_SHAPE_SHAPE_H
#define PROCGEO_SHAPE_SHAPE_H

#include "procgeo/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace procgeo {

enum class ShapeType : std::uint8_t {
    Rectangle = 0,
    Ellipse = 1,
    Triangle = 2,
    Circle = 3,
    Polygon = 4,
    Bezier = 5,
    Line = 6,
    Draw = 7,
    Text = 8,
    Image = 9,
};

const char* shapeTypeName(ShapeType type) noexcept;

// Anchor with optional incoming (cp1) and outgoing (cp2) handles.
struct BezierPoint {
    double x{0.0};
    double y{0.0};
    std::optional<Point2> cp1;
    std::optional<Point2> cp2;
};

inline bool operator==(const BezierPoint& a, const BezierPoint& b) noexcept {
    return a.x == b.x && a.y == b.y && a.cp1 == b.cp1 && a.cp2 == b.cp2;
}

struct ShapeStyle {
    std::optional<std::string> color;
    std::optional<std::string> fillColor;
    std::optional<double> strokeWidth;
    std::optional<bool> fill;
    std::optional<std::string> dash;
};

inline bool operator==(const ShapeStyle& a, const ShapeStyle& b) {
    return a.color == b.color && a.fillColor == b.fillColor && a.strokeWidth == b.strokeWidth
        && a.fill == b.fill && a.dash == b.dash;
}

// Host property bag. Every field is optional; readers apply the defaults in
// core/types.h. Point lists are stored relative to the shape's top-left.
struct ShapeProps {
    std::optional<double> w;
    std::optional<double> h;
    std::optional<double> radius;
    std::optional<std::uint32_t> sides;
    std::optional<std::vector<Point2>> points;
    std::optional<std::vector<BezierPoint>> bezierPoints;
    std::optional<bool> closed;
    ShapeStyle style;

    // Set when a path modifier upgraded the shape to a curve-capable type.
    std::optional<ShapeType> convertedFromType;
    bool flippedX{false};
    bool flippedY{false};
};

struct Shape {
    std::string id;
    ShapeType type{ShapeType::Rectangle};
    double x{0.0};
    double y{0.0};
    double rotation{0.0};
    ShapeProps props;
};

double shapeWidth(const Shape& shape) noexcept;
double shapeHeight(const Shape& shape) noexcept;
double shapeRadius(const Shape& shape) noexcept;
Size2 shapeSize(const Shape& shape) noexcept;

// ============================================================================
// Capability view over the property bag
// ============================================================================

enum class GeometryKind : std::uint8_t { Rect = 0, Circle = 1, PointList = 2, Bezier = 3 };

struct ShapeGeometry {
    GeometryKind kind{GeometryKind::Rect};
    Size2 size{};
    double radius{0.0};
    std::vector<Point2> points;
    std::vector<BezierPoint> bezier;

    static ShapeGeometry rect(double w, double h) {
        ShapeGeometry g;
        g.kind = GeometryKind::Rect;
        g.size = Size2{w, h};
        return g;
    }
    static ShapeGeometry circle(double r) {
        ShapeGeometry g;
        g.kind = GeometryKind::Circle;
        g.radius = r;
        g.size = Size2{r * 2.0, r * 2.0};
        return g;
    }
    static ShapeGeometry pointList(std::vector<Point2> pts) {
        ShapeGeometry g;
        g.kind = GeometryKind::PointList;
        g.points = std::move(pts);
        return g;
    }
    static ShapeGeometry bezierList(std::vector<BezierPoint> pts) {
        ShapeGeometry g;
        g.kind = GeometryKind::Bezier;
        g.bezier = std::move(pts);
        return g;
    }

    std::optional<Size2> asRect() const;
    std::optional<double> asCircle() const;
    std::optional<std::vector<Point2>> asPointList() const;
    std::optional<std::vector<BezierPoint>> asBezier() const;
};

// Classifies the shape by what its props can describe. Bezier data wins over
// plain points; circles report their radius; everything else is a rect.
ShapeGeometry geometryOf(const Shape& shape);

} // namespace procgeo

#endif // PROCGEO_SHAPE_SHAPE_H
