#include "procgeo/boolean/polygon_clipper.h"
#include "procgeo/boolean/polygon_types.h"

namespace procgeo {

const char* booleanOpName(BooleanOp op) noexcept {
    switch (op) {
        case BooleanOp::Union: return "union";
        case BooleanOp::Subtract: return "subtract";
        case BooleanOp::Intersect: return "intersect";
        case BooleanOp::Exclude: return "exclude";
    }
    return "unknown";
}

void closeRing(Ring& ring) {
    if (!ring.empty() && ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
}

MultiPolygon PolygonClipper::apply(BooleanOp op, const MultiPolygon& a, const MultiPolygon& b) {
    switch (op) {
        case BooleanOp::Union: return unite(a, b);
        case BooleanOp::Subtract: return subtract(a, b);
        case BooleanOp::Intersect: return intersect(a, b);
        case BooleanOp::Exclude: return exclude(a, b);
    }
    return a;
}

} // namespace procgeo
