#include "procgeo/stack/modifier_stack.h"
#include "procgeo/array/array_processors.h"
#include "procgeo/core/logging.h"
#include "procgeo/path/path_bridge.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace procgeo {

namespace {

void scalePoints(std::vector<Point2>& pts, double sx, double sy) noexcept {
    for (Point2& p : pts) {
        p.x *= sx;
        p.y *= sy;
    }
}

void scaleBezier(std::vector<BezierPoint>& pts, double sx, double sy) noexcept {
    for (BezierPoint& b : pts) {
        b.x *= sx;
        b.y *= sy;
        if (b.cp1) *b.cp1 = Point2{b.cp1->x * sx, b.cp1->y * sy};
        if (b.cp2) *b.cp2 = Point2{b.cp2->x * sx, b.cp2->y * sy};
    }
}

// Folds instance scale into the shape's own geometry.
void bakeScale(Shape& shape, double sx, double sy) {
    if (sx == 1.0 && sy == 1.0) return;
    ShapeProps& p = shape.props;
    const Size2 size = shapeSize(shape);
    p.w = size.width * sx;
    p.h = size.height * sy;
    const ShapeGeometry geometry = geometryOf(shape);
    switch (geometry.kind) {
        case GeometryKind::Circle:
            p.radius = geometry.radius * std::min(sx, sy);
            break;
        case GeometryKind::Bezier:
            scaleBezier(*p.bezierPoints, sx, sy);
            // Hosts may store both lists on one shape.
            if (p.points) scalePoints(*p.points, sx, sy);
            break;
        case GeometryKind::PointList:
            scalePoints(*p.points, sx, sy);
            break;
        case GeometryKind::Rect:
            break;
    }
}

} // namespace

const char* modifierTypeName(ModifierType type) noexcept {
    switch (type) {
        case ModifierType::LinearArray: return "linear-array";
        case ModifierType::CircularArray: return "circular-array";
        case ModifierType::GridArray: return "grid-array";
        case ModifierType::Mirror: return "mirror";
        case ModifierType::LSystem: return "lsystem";
        case ModifierType::Subdivide: return "subdivide";
        case ModifierType::Smooth: return "smooth";
        case ModifierType::Simplify: return "simplify";
        case ModifierType::NoiseOffset: return "noise-offset";
    }
    return "unknown";
}

Modifier makeModifier(std::string id, ModifierType type, std::int32_t order) {
    Modifier m;
    m.id = std::move(id);
    m.type = type;
    m.order = order;
    return m;
}

ShapeState createInitialState(const Shape& shape) {
    return stateFromShape(shape);
}

ShapeState applyModifier(const ShapeState& state, const Modifier& modifier, const GroupContext* group) {
    const ModifierSettings& s = modifier.settings;
    switch (modifier.type) {
        case ModifierType::LinearArray: return applyLinearArray(state, s.linear, group);
        case ModifierType::CircularArray: return applyCircularArray(state, s.circular, group);
        case ModifierType::GridArray: return applyGridArray(state, s.grid, group);
        case ModifierType::Mirror: return applyMirror(state, s.mirror, group);
        case ModifierType::LSystem: return applyLSystem(state, s.lsystem);
        case ModifierType::Subdivide:
            return applyPathModifier(state, [&s](const PathData& p) { return subdividePath(p, s.subdivide); });
        case ModifierType::Smooth:
            return applyPathModifier(state, [&s](const PathData& p) { return smoothPath(p, s.smooth); });
        case ModifierType::Simplify:
            return applyPathModifier(state, [&s](const PathData& p) { return simplifyPath(p, s.simplify); });
        case ModifierType::NoiseOffset:
            return applyPathModifier(state, [&s](const PathData& p) { return noiseOffsetPath(p, s.noise); });
    }
    return state;
}

ShapeState processModifiers(const Shape& shape, const std::vector<Modifier>& modifiers, const GroupContext* group) {
    std::vector<const Modifier*> active;
    active.reserve(modifiers.size());
    for (const Modifier& m : modifiers) {
        if (m.enabled) active.push_back(&m);
    }
    std::stable_sort(active.begin(), active.end(),
        [](const Modifier* a, const Modifier* b) { return a->order < b->order; });

    ShapeState state = createInitialState(shape);
    for (const Modifier* m : active) {
        state = applyModifier(state, *m, group);
        reindex(state);
        PROCGEO_LOG_DEBUG("modifier %s (%s): %zu instances",
            m->id.c_str(), modifierTypeName(m->type), state.instances.size());
    }
    return state;
}

void validateState(const ShapeState& state) {
    if (state.instances.empty()) {
        throw std::invalid_argument("shape state has no instances");
    }
}

std::vector<Shape> materializeInstances(const ShapeState& state) {
    validateState(state);
    std::vector<Shape> shapes;
    shapes.reserve(state.instances.size());
    for (const ShapeInstance& inst : state.instances) {
        Shape shape = inst.shape;
        shape.id = "clone-" + inst.shape.id + "-" + std::to_string(inst.index);
        shape.x = inst.transform.x;
        shape.y = inst.transform.y;
        shape.rotation = inst.transform.rotation;
        bakeScale(shape, inst.transform.scaleX, inst.transform.scaleY);
        shapes.push_back(std::move(shape));
    }
    return shapes;
}

} // namespace procgeo
