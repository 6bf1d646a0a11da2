#ifndef PROCGEO_BOOLEAN_POLYGON_TYPES_H
#define PROCGEO_BOOLEAN_POLYGON_TYPES_H

#include "procgeo/core/types.h"

#include <cstdint>
#include <vector>

namespace procgeo {

// Closed point list, first == last.
using Ring = std::vector<Point2>;
// Ring 0 is the outer boundary, the rest are holes.
using Polygon = std::vector<Ring>;
using MultiPolygon = std::vector<Polygon>;

enum class BooleanOp : std::uint8_t {
    Union = 0,
    Subtract = 1,
    Intersect = 2,
    Exclude = 3, // xor
};

const char* booleanOpName(BooleanOp op) noexcept;

// Appends the first point when the ring is not already closed.
void closeRing(Ring& ring);

} // namespace procgeo

#endif // PROCGEO_BOOLEAN_POLYGON_TYPES_H
