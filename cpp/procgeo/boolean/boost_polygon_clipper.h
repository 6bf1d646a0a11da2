#ifndef PROCGEO_BOOLEAN_BOOST_POLYGON_CLIPPER_H
#define PROCGEO_BOOLEAN_BOOST_POLYGON_CLIPPER_H

#include "procgeo/boolean/polygon_clipper.h"

namespace procgeo {

// PolygonClipper backed by Boost.Geometry. Inputs are orientation-corrected
// before every operation, so callers may pass rings in either winding.
class BoostPolygonClipper final : public PolygonClipper {
public:
    MultiPolygon unite(const MultiPolygon& a, const MultiPolygon& b) override;
    MultiPolygon subtract(const MultiPolygon& a, const MultiPolygon& b) override;
    MultiPolygon intersect(const MultiPolygon& a, const MultiPolygon& b) override;
    MultiPolygon exclude(const MultiPolygon& a, const MultiPolygon& b) override;
};

} // namespace procgeo

#endif // PROCGEO_BOOLEAN_BOOST_POLYGON_CLIPPER_H
