#pragma once

#include "procgeo/path/path_data.h"
#include "procgeo/path/path_modifiers.h"
#include "procgeo/shape/shape.h"
#include "procgeo/shape/shape_state.h"

#include <functional>
#include <optional>

namespace procgeo {

// What a shape type can do with path data.
struct PathCapability {
    bool canExtractPath{false};
    PathKind pathKind{PathKind::Points};
    bool storesPoints{false};   // can hold an edited point list natively
    bool storesBezier{false};   // can hold handles natively
};

PathCapability pathCapability(ShapeType type) noexcept;

inline bool canProcessShapeAsPath(ShapeType type) noexcept { return pathCapability(type).canExtractPath; }

// Outline or skeleton of `shape` in its local frame (origin at the shape's
// top-left), with bounds filled in. Text and image shapes, and line/draw
// shapes without points, yield nullopt.
std::optional<PathData> shapeToPath(const Shape& shape);

// True when `shape` cannot store `path` natively and must become a bezier
// shape to carry it.
bool requiresCurveUpgrade(const Shape& shape, const PathData& path) noexcept;

// Writes `path` back into a copy of `original`. Points are rebased so the
// path's bounds start at the local origin and w/h follow the bounds; the
// caller moves the transform by the rebased origin. Shapes that cannot hold
// the data are upgraded to Bezier with `convertedFromType` recorded. Svg data
// leaves the shape untouched.
Shape pathToShape(const PathData& path, const Shape& original);

using PathModifierFn = std::function<PathModificationResult(const PathData&)>;

// Runs `modify` over every path-capable instance of `state`. Instances whose
// bounds changed are moved so the rebased outline stays where it was drawn,
// and are flagged `pathModified`. Everything else passes through.
ShapeState applyPathModifier(const ShapeState& state, const PathModifierFn& modify);

} // namespace procgeo
