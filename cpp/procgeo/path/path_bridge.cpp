#include "procgeo/path/path_bridge.h"
#include "procgeo/core/logging.h"

#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace procgeo {

namespace {

constexpr std::size_t kEllipseSegments = 64;

std::vector<Point2> regularPolygon(double w, double h, std::uint32_t sides) {
    std::vector<Point2> pts;
    pts.reserve(sides);
    const double cx = w * 0.5;
    const double cy = h * 0.5;
    for (std::uint32_t i = 0; i < sides; ++i) {
        const double a = static_cast<double>(i) * kTwoPi / static_cast<double>(sides) - kHalfPi;
        pts.push_back(Point2{cx + std::cos(a) * w * 0.5, cy + std::sin(a) * h * 0.5});
    }
    return pts;
}

std::vector<Point2> ellipseOutline(double w, double h) {
    std::vector<Point2> pts;
    pts.reserve(kEllipseSegments);
    const double rx = w * 0.5;
    const double ry = h * 0.5;
    for (std::size_t i = 0; i < kEllipseSegments; ++i) {
        const double a = static_cast<double>(i) * kTwoPi / static_cast<double>(kEllipseSegments);
        pts.push_back(Point2{rx + std::cos(a) * rx, ry + std::sin(a) * ry});
    }
    return pts;
}

std::vector<BezierPoint> toBezier(const std::vector<Point2>& pts) {
    std::vector<BezierPoint> out;
    out.reserve(pts.size());
    for (const Point2& p : pts) {
        BezierPoint b;
        b.x = p.x;
        b.y = p.y;
        out.push_back(b);
    }
    return out;
}

std::vector<Point2> offsetPoints(const std::vector<Point2>& pts, double dx, double dy) {
    std::vector<Point2> out;
    out.reserve(pts.size());
    for (const Point2& p : pts) out.push_back(Point2{p.x - dx, p.y - dy});
    return out;
}

std::vector<BezierPoint> offsetBezier(const std::vector<BezierPoint>& pts, double dx, double dy) {
    std::vector<BezierPoint> out = pts;
    for (BezierPoint& b : out) {
        b.x -= dx;
        b.y -= dy;
        if (b.cp1) *b.cp1 = Point2{b.cp1->x - dx, b.cp1->y - dy};
        if (b.cp2) *b.cp2 = Point2{b.cp2->x - dx, b.cp2->y - dy};
    }
    return out;
}

bool hasPoints(const ShapeProps& p, std::size_t minimum) noexcept {
    return p.points && p.points->size() >= minimum;
}

} // namespace

PathCapability pathCapability(ShapeType type) noexcept {
    PathCapability cap;
    switch (type) {
        case ShapeType::Bezier:
            cap.canExtractPath = true;
            cap.pathKind = PathKind::Bezier;
            cap.storesPoints = true;
            cap.storesBezier = true;
            break;
        case ShapeType::Polygon:
        case ShapeType::Line:
        case ShapeType::Draw:
            cap.canExtractPath = true;
            cap.storesPoints = true;
            break;
        case ShapeType::Rectangle:
        case ShapeType::Ellipse:
        case ShapeType::Triangle:
        case ShapeType::Circle:
            cap.canExtractPath = true;
            break;
        case ShapeType::Text:
        case ShapeType::Image:
            break;
    }
    return cap;
}

std::optional<PathData> shapeToPath(const Shape& shape) {
    const ShapeProps& p = shape.props;
    const double w = shapeWidth(shape);
    const double h = shapeHeight(shape);

    switch (shape.type) {
        case ShapeType::Bezier:
            if (p.bezierPoints && !p.bezierPoints->empty()) {
                return withComputedBounds(PathData::fromBezier(*p.bezierPoints, p.closed.value_or(false)));
            }
            if (hasPoints(p, 2)) {
                return withComputedBounds(PathData::fromBezier(toBezier(*p.points), p.closed.value_or(false)));
            }
            return std::nullopt;
        case ShapeType::Line:
        case ShapeType::Draw:
            if (!hasPoints(p, 2)) return std::nullopt;
            return withComputedBounds(PathData::fromPoints(*p.points, p.closed.value_or(false)));
        case ShapeType::Polygon: {
            if (hasPoints(p, 3)) {
                return withComputedBounds(PathData::fromPoints(*p.points, true));
            }
            const std::uint32_t sides = p.sides.value_or(defaultPolygonSides);
            if (sides < 3) return std::nullopt;
            PathData path = PathData::fromPoints(regularPolygon(w, h, sides), true);
            path.bounds = Bounds{0.0, 0.0, w, h};
            return path;
        }
        case ShapeType::Triangle: {
            if (hasPoints(p, 3)) return withComputedBounds(PathData::fromPoints(*p.points, true));
            std::vector<Point2> pts{{w * 0.5, 0.0}, {0.0, h}, {w, h}};
            PathData path = PathData::fromPoints(std::move(pts), true);
            path.bounds = Bounds{0.0, 0.0, w, h};
            return path;
        }
        case ShapeType::Circle:
        case ShapeType::Ellipse: {
            if (hasPoints(p, 3)) return withComputedBounds(PathData::fromPoints(*p.points, true));
            PathData path = PathData::fromPoints(ellipseOutline(w, h), true);
            path.bounds = Bounds{0.0, 0.0, w, h};
            return path;
        }
        case ShapeType::Rectangle: {
            if (hasPoints(p, 3)) return withComputedBounds(PathData::fromPoints(*p.points, true));
            std::vector<Point2> pts{{0.0, 0.0}, {w, 0.0}, {w, h}, {0.0, h}};
            PathData path = PathData::fromPoints(std::move(pts), true);
            path.bounds = Bounds{0.0, 0.0, w, h};
            return path;
        }
        case ShapeType::Text:
        case ShapeType::Image:
            return std::nullopt;
    }
    return std::nullopt;
}

bool requiresCurveUpgrade(const Shape& shape, const PathData& path) noexcept {
    const PathCapability cap = pathCapability(shape.type);
    switch (path.kind) {
        case PathKind::Svg: return false;
        case PathKind::Bezier: return !cap.storesBezier;
        case PathKind::Points: return !(cap.storesPoints || cap.storesBezier);
    }
    return false;
}

Shape pathToShape(const PathData& path, const Shape& original) {
    if (path.kind == PathKind::Svg) return original;

    const Bounds b = path.bounds ? *path.bounds : computePathBounds(path).value_or(Bounds{});
    Shape shape = original;
    ShapeProps& p = shape.props;
    p.w = b.w;
    p.h = b.h;
    p.closed = path.isClosed;

    const bool upgrade = requiresCurveUpgrade(original, path);
    if (upgrade) {
        if (!p.convertedFromType) p.convertedFromType = original.type;
        shape.type = ShapeType::Bezier;
        p.sides.reset();
        p.radius.reset();
        PROCGEO_LOG_DEBUG("pathToShape: upgraded %s to bezier", shapeTypeName(original.type));
    }

    if (shape.type == ShapeType::Bezier) {
        p.points.reset();
        p.bezierPoints = path.kind == PathKind::Bezier ? offsetBezier(path.bezier, b.x, b.y)
                                                       : toBezier(offsetPoints(path.points, b.x, b.y));
        return shape;
    }

    p.bezierPoints.reset();
    p.points = offsetPoints(path.points, b.x, b.y);
    if (shape.type == ShapeType::Polygon) {
        p.sides = static_cast<std::uint32_t>(path.points.size());
    }
    return shape;
}

ShapeState applyPathModifier(const ShapeState& state, const PathModifierFn& modify) {
    ShapeState out;
    out.instances.reserve(state.instances.size());

    for (const ShapeInstance& inst : state.instances) {
        if (!canProcessShapeAsPath(inst.shape.type)) {
            out.instances.push_back(inst);
            continue;
        }
        const std::optional<PathData> path = shapeToPath(inst.shape);
        if (!path) {
            out.instances.push_back(inst);
            continue;
        }

        const PathModificationResult result = modify(*path);
        if (!result.boundsChanged || !result.newBounds) {
            out.instances.push_back(inst);
            continue;
        }

        ShapeInstance next = inst;
        next.shape = pathToShape(result.pathData, inst.shape);

        // The rebased local origin, scaled and rotated into world space.
        const Bounds& nb = *result.newBounds;
        const double lx = nb.x * inst.transform.scaleX;
        const double ly = nb.y * inst.transform.scaleY;
        const double c = std::cos(inst.transform.rotation);
        const double s = std::sin(inst.transform.rotation);
        next.transform.x += lx * c - ly * s;
        next.transform.y += lx * s + ly * c;

        PROCGEO_LOG_DEBUG("path modifier: instance %u (%s path, %zu -> %zu points)", inst.index,
            pathKindName(path->kind), path->pointCount(), result.pathData.pointCount());
        next.metadata.pathModified = true;
        next.metadata.originalPathBounds = path->bounds;
        next.metadata.newPathBounds = nb;
        out.instances.push_back(std::move(next));
    }
    return out;
}

} // namespace procgeo
