#include "procgeo/array/array_common.h"
#include "procgeo/array/array_processors.h"
#include "procgeo/core/logging.h"

#include <cstddef>
#include <utility>

namespace procgeo {

using array_detail::GroupFrame;
using array_detail::markClone;
using array_detail::placeClone;

namespace {

struct Reflection {
    Point2 center;
    double rotation{0.0};
};

// `origin` shifts the mirror line (or point) into group space; it is (0, 0)
// outside group mode.
Reflection reflect(const MirrorSettings& s, const Point2& origin, const Point2& c, double rotation) noexcept {
    switch (s.axis) {
        case MirrorAxis::X: {
            const double lineX = origin.x + s.offset;
            return Reflection{Point2{2.0 * lineX - c.x, c.y}, -rotation};
        }
        case MirrorAxis::Y: {
            const double lineY = origin.y + s.offset;
            return Reflection{Point2{c.x, 2.0 * lineY - c.y}, -rotation};
        }
        case MirrorAxis::Diagonal: {
            // Across y = x + offset, expressed relative to origin.
            const double lx = c.x - origin.x;
            const double ly = c.y - origin.y;
            return Reflection{Point2{origin.x + ly - s.offset, origin.y + lx + s.offset}, -rotation - kHalfPi};
        }
        case MirrorAxis::Point: {
            const double px = origin.x + s.pointX;
            const double py = origin.y + s.pointY;
            return Reflection{Point2{2.0 * px - c.x, 2.0 * py - c.y}, rotation + kPi};
        }
    }
    return Reflection{c, rotation};
}

void applyFlip(ShapeInstance& clone, MirrorAxis axis) noexcept {
    ShapeProps& p = clone.shape.props;
    switch (axis) {
        case MirrorAxis::X:
        case MirrorAxis::Diagonal:
            p.flippedX = !p.flippedX;
            break;
        case MirrorAxis::Y:
            p.flippedY = !p.flippedY;
            break;
        case MirrorAxis::Point:
            break;
    }
}

} // namespace

ShapeState applyMirror(const ShapeState& input, const MirrorSettings& settings, const GroupContext* group) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("mirror: %s", describeStatus(status));
        return input;
    }

    ShapeState out;
    out.instances.reserve(input.instances.size() * 2);

    GroupFrame frame;
    Point2 origin{};
    if (group) {
        frame = array_detail::makeGroupFrame(*group);
        origin = frame.sourceCenter;
    }

    auto placeInGroup = [&](const ShapeInstance& inst) {
        if (!group || !group->groupTransform) return inst;
        return placeClone(inst, frame.place(instanceVisualCenter(inst)), inst.transform.rotation + frame.rotation, 1.0);
    };

    for (const ShapeInstance& src : input.instances) {
        out.instances.push_back(placeInGroup(src));
    }

    for (std::size_t j = 0; j < input.instances.size(); ++j) {
        const ShapeInstance& src = input.instances[j];
        const Reflection r = reflect(settings, origin, instanceVisualCenter(src), src.transform.rotation);
        ShapeInstance clone = placeClone(src, r.center, r.rotation, 1.0);
        applyFlip(clone, settings.axis);
        clone = placeInGroup(clone);
        markClone(clone, 1, static_cast<std::uint32_t>(j), group != nullptr);
        clone.metadata.isMirrored = true;
        clone.metadata.mirrorAxis = settings.axis;
        out.instances.push_back(std::move(clone));
    }

    reindex(out);
    PROCGEO_LOG_DEBUG("mirror: %zu -> %zu instances", input.instances.size(), out.instances.size());
    return out;
}

} // namespace procgeo
