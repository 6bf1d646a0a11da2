#include "procgeo/boolean/geometry_engine.h"
#include "procgeo/core/logging.h"
#include "procgeo/core/transform_math.h"
#include "procgeo/path/path_data.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>

namespace procgeo {

namespace {

void appendNumber(std::string& out, double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    out += buf;
    out += '|';
}

template <typename T>
void appendOptional(std::string& out, const std::optional<T>& v) {
    if (v) {
        appendNumber(out, static_cast<double>(*v));
    } else {
        out += "-|";
    }
}

Ring rectangleRing(double x, double y, double w, double h) {
    return Ring{{x, y}, {x + w, y}, {x + w, y + h}, {x, y + h}, {x, y}};
}

Ring ellipseRing(double cx, double cy, double rx, double ry, std::uint32_t segments) {
    Ring ring;
    ring.reserve(segments + 1);
    for (std::uint32_t i = 0; i <= segments; ++i) {
        const double a = static_cast<double>(i) / static_cast<double>(segments) * kTwoPi;
        ring.push_back(Point2{cx + std::cos(a) * rx, cy + std::sin(a) * ry});
    }
    // The last sample only approximates the first.
    ring.back() = ring.front();
    return ring;
}

Ring translatedRing(const std::vector<Point2>& points, double x, double y) {
    Ring ring;
    ring.reserve(points.size() + 1);
    for (const Point2& p : points) ring.push_back(Point2{p.x + x, p.y + y});
    closeRing(ring);
    return ring;
}

Bounds ringsBounds(const MultiPolygon& polygon) {
    std::vector<Point2> all;
    for (const Polygon& poly : polygon) {
        for (const Ring& ring : poly) all.insert(all.end(), ring.begin(), ring.end());
    }
    return computePointBounds(all);
}

template <typename T>
void keepIfShared(std::optional<T>& field, const std::optional<T>& other) {
    if (field && field != other) field.reset();
}

} // namespace

GeometryEngine::GeometryEngine(PolygonClipper& clipper, GeometryEngineOptions options)
    : clipper_(clipper), options_(options), cache_(options.cacheCapacity) {}

MultiPolygon GeometryEngine::shapeToPolygon(const Shape& shape) {
    const std::string key = polygonCacheKey(shape);
    if (const MultiPolygon* hit = cache_.find(key)) {
        return *hit;
    }
    MultiPolygon polygon = buildPolygon(shape);
    cache_.insert(key, polygon);
    return polygon;
}

MultiPolygon GeometryEngine::buildPolygon(const Shape& shape) const {
    const ShapeProps& p = shape.props;
    const double x = shape.x;
    const double y = shape.y;
    const double w = shapeWidth(shape);
    const double h = shapeHeight(shape);

    Ring ring;
    switch (shape.type) {
        case ShapeType::Rectangle:
            ring = rectangleRing(x, y, w, h);
            break;
        case ShapeType::Ellipse:
            ring = ellipseRing(x + w * 0.5, y + h * 0.5, w * 0.5, h * 0.5, options_.ellipseSegments);
            break;
        case ShapeType::Circle: {
            // Centered on the shape position and rotation invariant.
            const double r = shapeRadius(shape);
            return MultiPolygon{Polygon{ellipseRing(x, y, r, r, options_.circleSegments)}};
        }
        case ShapeType::Triangle:
            ring = Ring{{x + w * 0.5, y}, {x + w, y + h}, {x, y + h}, {x + w * 0.5, y}};
            break;
        case ShapeType::Polygon:
            if (p.points && p.points->size() >= 3) {
                ring = translatedRing(*p.points, x, y);
            } else {
                const std::uint32_t sides = std::max<std::uint32_t>(3, p.sides.value_or(options_.defaultPolygonSides));
                const double cx = x + w * 0.5;
                const double cy = y + h * 0.5;
                for (std::uint32_t i = 0; i < sides; ++i) {
                    const double a = static_cast<double>(i) / static_cast<double>(sides) * kTwoPi - kHalfPi;
                    ring.push_back(Point2{cx + std::cos(a) * w * 0.5, cy + std::sin(a) * h * 0.5});
                }
                closeRing(ring);
            }
            break;
        case ShapeType::Bezier:
            if (p.bezierPoints && p.bezierPoints->size() >= 3) {
                ring = translatedRing(anchorPoints(*p.bezierPoints), x, y);
            }
            break;
        case ShapeType::Line:
        case ShapeType::Draw:
            if (p.points && p.points->size() >= 3) {
                ring = translatedRing(*p.points, x, y);
            }
            break;
        case ShapeType::Text:
        case ShapeType::Image:
            break;
    }

    if (ring.size() < 4) {
        PROCGEO_LOG_DEBUG("shapeToPolygon: %s %s falls back to its bounding box",
            shapeTypeName(shape.type), shape.id.c_str());
        ring = rectangleRing(x, y, w, h);
    }

    if (shape.rotation != 0.0) {
        const Point2 pivot{x + w * 0.5, y + h * 0.5};
        for (Point2& v : ring) v = rotateAroundPivot(v, pivot, shape.rotation);
    }
    return MultiPolygon{Polygon{std::move(ring)}};
}

MultiPolygon GeometryEngine::performBooleanOperation(const std::vector<Shape>& shapes, BooleanOp op) {
    if (shapes.empty()) return MultiPolygon{};
    MultiPolygon acc = shapeToPolygon(shapes.front());
    for (std::size_t i = 1; i < shapes.size(); ++i) {
        acc = clipper_.apply(op, acc, shapeToPolygon(shapes[i]));
    }
    PROCGEO_LOG_DEBUG("boolean %s over %zu shapes -> %zu polygons", booleanOpName(op), shapes.size(), acc.size());
    return acc;
}

const Shape* GeometryEngine::selectStyleSourceShape(const std::vector<Shape>& shapes, BooleanOp op) const {
    if (shapes.empty()) return nullptr;
    if (op == BooleanOp::Subtract || op == BooleanOp::Intersect) return &shapes.front();

    const Shape* best = &shapes.front();
    double bestArea = approximateArea(*best);
    for (std::size_t i = 1; i < shapes.size(); ++i) {
        const double area = approximateArea(shapes[i]);
        if (area > bestArea) {
            best = &shapes[i];
            bestArea = area;
        }
    }
    return best;
}

Shape GeometryEngine::polygonToOutlineShape(const MultiPolygon& polygon, const Shape& originalShape,
    const PositionContext* positionContext, const Shape* styleSourceShape) {
    if (polygon.empty() || polygon.front().empty()) {
        PROCGEO_LOG_WARN("outline: empty boolean result, keeping %s", originalShape.id.c_str());
        return originalShape;
    }
    std::vector<Point2> ring = polygon.front().front();
    if (ring.size() > 1 && ring.front() == ring.back()) ring.pop_back();
    if (ring.size() < 3) {
        PROCGEO_LOG_WARN("outline: degenerate ring, keeping %s", originalShape.id.c_str());
        return originalShape;
    }

    const Bounds rb = computePointBounds(ring);
    Point2 topLeft{rb.x, rb.y};
    if (positionContext) {
        topLeft = Point2{positionContext->collectiveCenter.x - rb.w * 0.5,
            positionContext->collectiveCenter.y - rb.h * 0.5};
    } else {
        // Carry the offset between the original's on-screen box and its
        // geometric box over to the new outline.
        const Bounds reference = ringsBounds(shapeToPolygon(originalShape));
        std::optional<Bounds> visual;
        if (oracle_) visual = oracle_->getVisualBounds(originalShape.id);
        const Bounds& v = visual ? *visual : reference;
        topLeft = Point2{rb.x + (v.x - reference.x), rb.y + (v.y - reference.y)};
    }

    std::vector<BezierPoint> anchors;
    anchors.reserve(ring.size());
    for (const Point2& pt : ring) {
        BezierPoint b;
        b.x = pt.x - rb.x;
        b.y = pt.y - rb.y;
        anchors.push_back(b);
    }

    const ShapeStyle& srcStyle = styleSourceShape ? styleSourceShape->props.style : originalShape.props.style;

    Shape out;
    out.id = originalShape.id;
    out.type = ShapeType::Bezier;
    out.x = topLeft.x;
    out.y = topLeft.y;
    out.rotation = 0.0;
    out.props.w = rb.w;
    out.props.h = rb.h;
    out.props.bezierPoints = std::move(anchors);
    out.props.closed = true;
    out.props.style.color = srcStyle.color.value_or(kDefaultOutlineColor);
    out.props.style.fillColor = srcStyle.fillColor ? srcStyle.fillColor : out.props.style.color;
    out.props.style.strokeWidth = srcStyle.strokeWidth.value_or(kDefaultOutlineStrokeWidth);
    out.props.style.fill = srcStyle.fill.value_or(true);
    out.props.style.dash = srcStyle.dash;
    return out;
}

std::string polygonCacheKey(const Shape& shape) {
    const ShapeProps& p = shape.props;
    std::string key = shape.id;
    key += '|';
    key += shapeTypeName(shape.type);
    key += '|';
    appendNumber(key, shape.x);
    appendNumber(key, shape.y);
    appendNumber(key, shape.rotation);
    appendOptional(key, p.w);
    appendOptional(key, p.h);
    appendOptional(key, p.radius);
    appendOptional(key, p.sides);
    if (p.points) {
        key += "pts|";
        for (const Point2& pt : *p.points) {
            appendNumber(key, pt.x);
            appendNumber(key, pt.y);
        }
    }
    if (p.bezierPoints) {
        key += "bez|";
        for (const BezierPoint& b : *p.bezierPoints) {
            appendNumber(key, b.x);
            appendNumber(key, b.y);
        }
    }
    return key;
}

double approximateArea(const Shape& shape) noexcept {
    if (shape.type == ShapeType::Circle) {
        const double r = shapeRadius(shape);
        return kPi * r * r;
    }
    return shapeWidth(shape) * shapeHeight(shape);
}

ShapeStyle computeSharedStyle(const std::vector<Shape>& shapes) {
    if (shapes.empty()) return ShapeStyle{};
    ShapeStyle shared = shapes.front().props.style;
    for (std::size_t i = 1; i < shapes.size(); ++i) {
        const ShapeStyle& s = shapes[i].props.style;
        keepIfShared(shared.color, s.color);
        keepIfShared(shared.fillColor, s.fillColor);
        keepIfShared(shared.strokeWidth, s.strokeWidth);
        keepIfShared(shared.fill, s.fill);
        keepIfShared(shared.dash, s.dash);
    }
    return shared;
}

Bounds collectiveBounds(const ShapeState& state) noexcept {
    if (state.instances.empty()) return Bounds{};
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    for (const ShapeInstance& inst : state.instances) {
        const Size2 s = scaledSize(inst);
        minX = std::min(minX, inst.transform.x);
        minY = std::min(minY, inst.transform.y);
        maxX = std::max(maxX, inst.transform.x + s.width);
        maxY = std::max(maxY, inst.transform.y + s.height);
    }
    return Bounds{minX, minY, maxX - minX, maxY - minY};
}

} // namespace procgeo
