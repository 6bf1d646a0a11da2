#ifndef PROCGEO_BOOLEAN_POLYGON_CLIPPER_H
#define PROCGEO_BOOLEAN_POLYGON_CLIPPER_H

#include "procgeo/boolean/polygon_types.h"

namespace procgeo {

// Two-operand polygon clipping primitive. GeometryEngine folds n-ary
// operations over it.
class PolygonClipper {
public:
    virtual ~PolygonClipper() = default;

    virtual MultiPolygon unite(const MultiPolygon& a, const MultiPolygon& b) = 0;
    virtual MultiPolygon subtract(const MultiPolygon& a, const MultiPolygon& b) = 0;
    virtual MultiPolygon intersect(const MultiPolygon& a, const MultiPolygon& b) = 0;
    virtual MultiPolygon exclude(const MultiPolygon& a, const MultiPolygon& b) = 0;

    MultiPolygon apply(BooleanOp op, const MultiPolygon& a, const MultiPolygon& b);
};

} // namespace procgeo

#endif // PROCGEO_BOOLEAN_POLYGON_CLIPPER_H
