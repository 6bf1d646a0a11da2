#include "procgeo/array/array_common.h"
#include "procgeo/core/transform_math.h"

#include <cmath>

namespace procgeo {
namespace array_detail {

Point2 GroupFrame::place(const Point2& local) const noexcept {
    const Point2 rel = rotateVector(Point2{local.x - sourceCenter.x, local.y - sourceCenter.y}, rotation);
    return Point2{anchor.x + rel.x, anchor.y + rel.y};
}

GroupFrame makeGroupFrame(const GroupContext& group) noexcept {
    GroupFrame frame;
    frame.sourceCenter = group.groupCenter();
    frame.anchor = frame.sourceCenter;
    frame.bounds = group.groupBounds;
    if (group.groupTransform) {
        const Transform& t = *group.groupTransform;
        frame.anchor = visualCenterFromCorner(
            Point2{t.x, t.y}, group.groupBounds.width, group.groupBounds.height, t.rotation);
        frame.rotation = t.rotation;
    }
    return frame;
}

Point2 rotateVector(const Point2& v, double angle) noexcept {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    return Point2{v.x * c - v.y * s, v.x * s + v.y * c};
}

ShapeInstance placeClone(const ShapeInstance& source, const Point2& center, double rotation, double scaleFactor) {
    ShapeInstance clone = source;
    // Unmoved clones keep the source transform bit for bit.
    if (scaleFactor == 1.0 && rotation == source.transform.rotation && center == instanceVisualCenter(source)) {
        return clone;
    }
    clone.transform.scaleX = source.transform.scaleX * scaleFactor;
    clone.transform.scaleY = source.transform.scaleY * scaleFactor;
    clone.transform.rotation = rotation;
    const Size2 size = scaledSize(clone);
    const Point2 corner = cornerFromVisualCenter(center, size.width, size.height, rotation);
    clone.transform.x = corner.x;
    clone.transform.y = corner.y;
    return clone;
}

void markClone(ShapeInstance& clone, std::uint32_t arrayIndex, std::uint32_t sourceInstance, bool groupMode) {
    clone.metadata.arrayIndex = arrayIndex;
    clone.metadata.sourceInstance = sourceInstance;
    clone.metadata.isFirstClone = arrayIndex == 0;
    clone.metadata.isGroupClone = groupMode;
}

} // namespace array_detail
} // namespace procgeo
