#include "procgeo/array/array_common.h"
#include "procgeo/array/array_processors.h"
#include "procgeo/core/logging.h"
#include "procgeo/core/transform_math.h"

#include <cstddef>
#include <utility>

namespace procgeo {

using array_detail::GroupFrame;
using array_detail::interpolateScale;
using array_detail::markClone;
using array_detail::placeClone;
using array_detail::progressOf;
using array_detail::rotateVector;

namespace {

struct LinearStep {
    Point2 offset;        // unrotated, in pixels
    double rotation{0.0}; // added to the source rotation
    double scale{1.0};
};

LinearStep linearStep(const LinearArraySettings& s, std::uint32_t i, double w, double h) noexcept {
    LinearStep step;
    step.offset = Point2{w * s.offsetX / 100.0 * i, h * s.offsetY / 100.0 * i};
    step.rotation = degToRad(s.rotationIncrement * i + s.rotateAll);
    step.scale = interpolateScale(s.scaleStep, progressOf(i, s.count));
    return step;
}

} // namespace

ShapeState applyLinearArray(const ShapeState& input, const LinearArraySettings& settings, const GroupContext* group) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("linear array: %s", describeStatus(status));
        return input;
    }

    ShapeState out;
    out.instances.reserve(input.instances.size() * settings.count);

    if (group) {
        const GroupFrame frame = array_detail::makeGroupFrame(*group);
        for (std::uint32_t i = 0; i < settings.count; ++i) {
            const LinearStep step = linearStep(settings, i, frame.bounds.width, frame.bounds.height);
            for (std::size_t j = 0; j < input.instances.size(); ++j) {
                const ShapeInstance& src = input.instances[j];
                // Rigid copy of the formation: scale and spin about the group
                // center, then slide along the offset.
                const Point2 c = instanceVisualCenter(src);
                const Point2 rel = rotateVector(
                    Point2{(c.x - frame.sourceCenter.x) * step.scale, (c.y - frame.sourceCenter.y) * step.scale},
                    step.rotation);
                const Point2 local{frame.sourceCenter.x + step.offset.x + rel.x,
                    frame.sourceCenter.y + step.offset.y + rel.y};
                ShapeInstance clone = placeClone(
                    src, frame.place(local), src.transform.rotation + step.rotation + frame.rotation, step.scale);
                markClone(clone, i, static_cast<std::uint32_t>(j), true);
                out.instances.push_back(std::move(clone));
            }
        }
    } else {
        for (std::size_t j = 0; j < input.instances.size(); ++j) {
            const ShapeInstance& src = input.instances[j];
            const Size2 size = scaledSize(src);
            const Point2 c = instanceVisualCenter(src);
            for (std::uint32_t i = 0; i < settings.count; ++i) {
                const LinearStep step = linearStep(settings, i, size.width, size.height);
                const Point2 d = rotateVector(step.offset, src.transform.rotation);
                ShapeInstance clone = placeClone(
                    src, Point2{c.x + d.x, c.y + d.y}, src.transform.rotation + step.rotation, step.scale);
                markClone(clone, i, static_cast<std::uint32_t>(j), false);
                out.instances.push_back(std::move(clone));
            }
        }
    }

    reindex(out);
    PROCGEO_LOG_DEBUG("linear array: %zu -> %zu instances", input.instances.size(), out.instances.size());
    return out;
}

} // namespace procgeo
