#pragma once

#include "procgeo/core/types.h"
#include "procgeo/shape/shape.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace procgeo {

enum class MirrorAxis : std::uint8_t { X = 0, Y = 1, Diagonal = 2, Point = 3 };

// Provenance attached by processors. Downstream consumers decide visibility and
// selection from these; the pipeline never reads them back except to carry
// them forward.
struct InstanceMetadata {
    std::optional<std::uint32_t> arrayIndex;
    std::optional<std::uint32_t> sourceInstance;
    bool isFirstClone{false};
    bool isGroupClone{false};

    std::optional<std::uint32_t> gridRow;
    std::optional<std::uint32_t> gridColumn;

    bool isMirrored{false};
    std::optional<MirrorAxis> mirrorAxis;

    bool lsystem{false};
    std::optional<std::uint32_t> lsystemDepth;

    bool pathModified{false};
    std::optional<Bounds> originalPathBounds;
    std::optional<Bounds> newPathBounds;
};

struct ShapeInstance {
    Shape shape;
    Transform transform{};
    std::uint32_t index{0};
    InstanceMetadata metadata{};
};

struct ShapeState {
    std::vector<ShapeInstance> instances;
};

struct GroupContext {
    Point2 groupTopLeft{};
    Size2 groupBounds{};
    std::optional<Transform> groupTransform;

    Point2 groupCenter() const noexcept {
        return Point2{groupTopLeft.x + groupBounds.width * 0.5, groupTopLeft.y + groupBounds.height * 0.5};
    }
};

// Shape size multiplied by the instance scale.
Size2 scaledSize(const ShapeInstance& instance) noexcept;

// Visual center of a corner-anchored instance.
Point2 instanceVisualCenter(const ShapeInstance& instance) noexcept;

// Single-instance state placed at the shape's own transform.
ShapeState stateFromShape(const Shape& shape);

// Rewrites `index` so it is 0-based and contiguous in output order.
void reindex(ShapeState& state) noexcept;

} // namespace procgeo
