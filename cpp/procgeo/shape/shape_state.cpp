#include "procgeo/shape/shape_state.h"
#include "procgeo/core/transform_math.h"

#include <utility>

namespace procgeo {

Size2 scaledSize(const ShapeInstance& instance) noexcept {
    const Size2 base = shapeSize(instance.shape);
    return Size2{base.width * instance.transform.scaleX, base.height * instance.transform.scaleY};
}

Point2 instanceVisualCenter(const ShapeInstance& instance) noexcept {
    const Size2 s = scaledSize(instance);
    return visualCenterFromCorner(
        Point2{instance.transform.x, instance.transform.y},
        s.width,
        s.height,
        instance.transform.rotation);
}

ShapeState stateFromShape(const Shape& shape) {
    ShapeInstance inst;
    inst.shape = shape;
    inst.transform = Transform{shape.x, shape.y, shape.rotation, 1.0, 1.0};
    inst.index = 0;
    ShapeState state;
    state.instances.push_back(std::move(inst));
    return state;
}

void reindex(ShapeState& state) noexcept {
    std::uint32_t i = 0;
    for (ShapeInstance& inst : state.instances) {
        inst.index = i++;
    }
}

} // namespace procgeo
