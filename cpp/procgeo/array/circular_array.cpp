#include "procgeo/array/array_common.h"
#include "procgeo/array/array_processors.h"
#include "procgeo/core/logging.h"
#include "procgeo/core/transform_math.h"

#include <cmath>
#include <cstddef>
#include <utility>

namespace procgeo {

using array_detail::GroupFrame;
using array_detail::markClone;
using array_detail::placeClone;
using array_detail::rotateVector;

namespace {

// Angle step in degrees. A full sweep divides by count so the last copy does
// not land on the first.
double sweepStep(const CircularArraySettings& s) noexcept {
    if (s.count < 2) return 0.0;
    const double total = s.endAngle - s.startAngle;
    if (std::fabs(total) >= 360.0) return total / static_cast<double>(s.count);
    return total / static_cast<double>(s.count - 1);
}

// Circle center chosen so that the start angle points back at `anchor`.
Point2 circleCenterFor(const Point2& anchor, const CircularArraySettings& s) noexcept {
    const double start = degToRad(s.startAngle);
    return Point2{anchor.x + s.centerX - s.radius * std::cos(start),
        anchor.y + s.centerY - s.radius * std::sin(start)};
}

double cloneRotation(const CircularArraySettings& s, double baseRotation, double angle, std::uint32_t i) noexcept {
    const double base = s.alignToTangent ? angle + kHalfPi : baseRotation;
    return base + degToRad(s.rotateAll + s.rotateEach * i);
}

} // namespace

ShapeState applyCircularArray(const ShapeState& input, const CircularArraySettings& settings, const GroupContext* group) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("circular array: %s", describeStatus(status));
        return input;
    }

    const double step = sweepStep(settings);
    ShapeState out;
    out.instances.reserve(input.instances.size() * settings.count);

    if (group) {
        const GroupFrame frame = array_detail::makeGroupFrame(*group);
        const Point2& g = frame.sourceCenter;
        const Point2 pivot = circleCenterFor(g, settings);
        for (std::uint32_t i = 0; i < settings.count; ++i) {
            const double delta = degToRad(step * i);
            const double angle = degToRad(settings.startAngle) + delta;
            // The formation orbits rigidly: its center moves onto the circle
            // and the whole layout spins by the sweep delta plus the extras.
            const double spin = delta + degToRad(settings.rotateAll + settings.rotateEach * i);
            const Point2 shift = i == 0
                ? Point2{settings.centerX, settings.centerY}
                : Point2{pivot.x + settings.radius * std::cos(angle) - g.x,
                      pivot.y + settings.radius * std::sin(angle) - g.y};
            for (std::size_t j = 0; j < input.instances.size(); ++j) {
                const ShapeInstance& src = input.instances[j];
                const Point2 c = instanceVisualCenter(src);
                Point2 center{c.x + shift.x, c.y + shift.y};
                if (spin != 0.0) {
                    const Point2 rel = rotateVector(Point2{c.x - g.x, c.y - g.y}, spin);
                    center = Point2{g.x + shift.x + rel.x, g.y + shift.y + rel.y};
                }
                const double rotation = settings.alignToTangent
                    ? cloneRotation(settings, 0.0, angle, i)
                    : src.transform.rotation + spin;
                ShapeInstance clone = placeClone(src, center, rotation, 1.0);
                if (group->groupTransform) {
                    clone = placeClone(clone, frame.place(instanceVisualCenter(clone)),
                        clone.transform.rotation + frame.rotation, 1.0);
                }
                markClone(clone, i, static_cast<std::uint32_t>(j), true);
                out.instances.push_back(std::move(clone));
            }
        }
    } else {
        for (std::size_t j = 0; j < input.instances.size(); ++j) {
            const ShapeInstance& src = input.instances[j];
            const Point2 c = instanceVisualCenter(src);
            const Point2 pivot = circleCenterFor(c, settings);
            for (std::uint32_t i = 0; i < settings.count; ++i) {
                const double angle = degToRad(settings.startAngle + step * i);
                // Index 0 is written directly so it reproduces the source exactly.
                const Point2 center = i == 0
                    ? Point2{c.x + settings.centerX, c.y + settings.centerY}
                    : Point2{pivot.x + settings.radius * std::cos(angle), pivot.y + settings.radius * std::sin(angle)};
                ShapeInstance clone = placeClone(src, center, cloneRotation(settings, src.transform.rotation, angle, i), 1.0);
                markClone(clone, i, static_cast<std::uint32_t>(j), false);
                out.instances.push_back(std::move(clone));
            }
        }
    }

    reindex(out);
    PROCGEO_LOG_DEBUG("circular array: %zu -> %zu instances", input.instances.size(), out.instances.size());
    return out;
}

} // namespace procgeo
