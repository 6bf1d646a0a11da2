#include "procgeo/shape/shape.h"

namespace procgeo {

const char* shapeTypeName(ShapeType type) noexcept {
    switch (type) {
        case ShapeType::Rectangle: return "rectangle";
        case ShapeType::Ellipse: return "ellipse";
        case ShapeType::Triangle: return "triangle";
        case ShapeType::Circle: return "circle";
        case ShapeType::Polygon: return "polygon";
        case ShapeType::Bezier: return "bezier";
        case ShapeType::Line: return "line";
        case ShapeType::Draw: return "draw";
        case ShapeType::Text: return "text";
        case ShapeType::Image: return "image";
    }
    return "unknown";
}

// Circles without an explicit box are sized by their diameter.
double shapeWidth(const Shape& shape) noexcept {
    if (shape.props.w) return *shape.props.w;
    if (shape.type == ShapeType::Circle && shape.props.radius) return *shape.props.radius * 2.0;
    return defaultShapeWidth;
}

double shapeHeight(const Shape& shape) noexcept {
    if (shape.props.h) return *shape.props.h;
    if (shape.type == ShapeType::Circle && shape.props.radius) return *shape.props.radius * 2.0;
    return defaultShapeHeight;
}

double shapeRadius(const Shape& shape) noexcept {
    return shape.props.radius.value_or(defaultShapeRadius);
}

Size2 shapeSize(const Shape& shape) noexcept {
    return Size2{shapeWidth(shape), shapeHeight(shape)};
}

std::optional<Size2> ShapeGeometry::asRect() const {
    if (kind != GeometryKind::Rect) return std::nullopt;
    return size;
}

std::optional<double> ShapeGeometry::asCircle() const {
    if (kind != GeometryKind::Circle) return std::nullopt;
    return radius;
}

std::optional<std::vector<Point2>> ShapeGeometry::asPointList() const {
    if (kind != GeometryKind::PointList) return std::nullopt;
    return points;
}

std::optional<std::vector<BezierPoint>> ShapeGeometry::asBezier() const {
    if (kind != GeometryKind::Bezier) return std::nullopt;
    return bezier;
}

ShapeGeometry geometryOf(const Shape& shape) {
    const ShapeProps& p = shape.props;
    if (p.bezierPoints && !p.bezierPoints->empty()) {
        ShapeGeometry g = ShapeGeometry::bezierList(*p.bezierPoints);
        g.size = shapeSize(shape);
        return g;
    }
    if (p.points && !p.points->empty()) {
        ShapeGeometry g = ShapeGeometry::pointList(*p.points);
        g.size = shapeSize(shape);
        return g;
    }
    if (shape.type == ShapeType::Circle) {
        return ShapeGeometry::circle(shapeRadius(shape));
    }
    return ShapeGeometry::rect(shapeWidth(shape), shapeHeight(shape));
}

} // namespace procgeo
