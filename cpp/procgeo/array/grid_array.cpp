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

struct GridCell {
    std::uint32_t row{0};
    std::uint32_t column{0};
    std::uint32_t linear{0};
    Point2 offset;
    double rotation{0.0};
    double scale{1.0};
};

GridCell gridCell(const GridArraySettings& s, std::uint32_t row, std::uint32_t column, double w, double h) noexcept {
    GridCell cell;
    cell.row = row;
    cell.column = column;
    cell.linear = row * s.columns + column;
    cell.offset = Point2{w * s.spacingX / 100.0 * column, h * s.spacingY / 100.0 * row};
    cell.rotation = degToRad(s.rotateEach * cell.linear + s.rotateEachRow * row
        + s.rotateEachColumn * column + s.rotateAll);
    cell.scale = interpolateScale(s.scaleStep, progressOf(cell.linear, s.rows * s.columns))
        * interpolateScale(s.rowScaleStep, progressOf(row, s.rows))
        * interpolateScale(s.columnScaleStep, progressOf(column, s.columns));
    return cell;
}

void markCell(ShapeInstance& clone, const GridCell& cell, std::size_t source, bool groupMode) {
    markClone(clone, cell.linear, static_cast<std::uint32_t>(source), groupMode);
    clone.metadata.gridRow = cell.row;
    clone.metadata.gridColumn = cell.column;
}

} // namespace

ShapeState applyGridArray(const ShapeState& input, const GridArraySettings& settings, const GroupContext* group) {
    const ValidationStatus status = validateSettings(settings);
    if (!isOk(status)) {
        PROCGEO_LOG_WARN("grid array: %s", describeStatus(status));
        return input;
    }

    ShapeState out;
    out.instances.reserve(input.instances.size() * settings.rows * settings.columns);

    if (group) {
        const GroupFrame frame = array_detail::makeGroupFrame(*group);
        for (std::uint32_t row = 0; row < settings.rows; ++row) {
            for (std::uint32_t col = 0; col < settings.columns; ++col) {
                const GridCell cell = gridCell(settings, row, col, frame.bounds.width, frame.bounds.height);
                for (std::size_t j = 0; j < input.instances.size(); ++j) {
                    const ShapeInstance& src = input.instances[j];
                    const Point2 c = instanceVisualCenter(src);
                    const Point2 rel = rotateVector(
                        Point2{(c.x - frame.sourceCenter.x) * cell.scale, (c.y - frame.sourceCenter.y) * cell.scale},
                        cell.rotation);
                    const Point2 local{frame.sourceCenter.x + cell.offset.x + rel.x,
                        frame.sourceCenter.y + cell.offset.y + rel.y};
                    ShapeInstance clone = placeClone(
                        src, frame.place(local), src.transform.rotation + cell.rotation + frame.rotation, cell.scale);
                    markCell(clone, cell, j, true);
                    out.instances.push_back(std::move(clone));
                }
            }
        }
    } else {
        for (std::size_t j = 0; j < input.instances.size(); ++j) {
            const ShapeInstance& src = input.instances[j];
            const Size2 size = scaledSize(src);
            const Point2 c = instanceVisualCenter(src);
            for (std::uint32_t row = 0; row < settings.rows; ++row) {
                for (std::uint32_t col = 0; col < settings.columns; ++col) {
                    const GridCell cell = gridCell(settings, row, col, size.width, size.height);
                    const Point2 d = rotateVector(cell.offset, src.transform.rotation);
                    ShapeInstance clone = placeClone(
                        src, Point2{c.x + d.x, c.y + d.y}, src.transform.rotation + cell.rotation, cell.scale);
                    markCell(clone, cell, j, false);
                    out.instances.push_back(std::move(clone));
                }
            }
        }
    }

    reindex(out);
    PROCGEO_LOG_DEBUG("grid array: %zu -> %zu instances", input.instances.size(), out.instances.size());
    return out;
}

} // namespace procgeo
