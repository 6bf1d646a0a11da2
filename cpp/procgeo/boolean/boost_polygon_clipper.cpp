#include "procgeo/boolean/boost_polygon_clipper.h"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

#include <cstddef>
#include <utility>

namespace procgeo {

namespace {

namespace bg = boost::geometry;

typedef bg::model::d2::point_xy<double> BgPoint;
typedef bg::model::polygon<BgPoint> BgPolygon;
typedef bg::model::multi_polygon<BgPolygon> BgMultiPolygon;

void copyRing(const Ring& src, BgPolygon::ring_type& dst) {
    dst.reserve(src.size() + 1);
    for (const Point2& p : src) {
        dst.push_back(BgPoint(p.x, p.y));
    }
}

BgMultiPolygon toBoost(const MultiPolygon& input) {
    BgMultiPolygon out;
    for (const Polygon& poly : input) {
        if (poly.empty() || poly.front().size() < 3) continue;
        BgPolygon bp;
        copyRing(poly.front(), bp.outer());
        for (std::size_t i = 1; i < poly.size(); ++i) {
            if (poly[i].size() < 3) continue;
            bp.inners().emplace_back();
            copyRing(poly[i], bp.inners().back());
        }
        out.push_back(std::move(bp));
    }
    // Fixes winding and closes rings.
    bg::correct(out);
    return out;
}

Ring fromBoostRing(const BgPolygon::ring_type& ring) {
    Ring out;
    out.reserve(ring.size());
    for (const BgPoint& p : ring) {
        out.push_back(Point2{p.x(), p.y()});
    }
    closeRing(out);
    return out;
}

MultiPolygon fromBoost(const BgMultiPolygon& input) {
    MultiPolygon out;
    out.reserve(input.size());
    for (const BgPolygon& bp : input) {
        Polygon poly;
        poly.push_back(fromBoostRing(bp.outer()));
        for (const auto& inner : bp.inners()) {
            poly.push_back(fromBoostRing(inner));
        }
        out.push_back(std::move(poly));
    }
    return out;
}

} // namespace

MultiPolygon BoostPolygonClipper::unite(const MultiPolygon& a, const MultiPolygon& b) {
    BgMultiPolygon result;
    bg::union_(toBoost(a), toBoost(b), result);
    return fromBoost(result);
}

MultiPolygon BoostPolygonClipper::subtract(const MultiPolygon& a, const MultiPolygon& b) {
    BgMultiPolygon result;
    bg::difference(toBoost(a), toBoost(b), result);
    return fromBoost(result);
}

MultiPolygon BoostPolygonClipper::intersect(const MultiPolygon& a, const MultiPolygon& b) {
    BgMultiPolygon result;
    bg::intersection(toBoost(a), toBoost(b), result);
    return fromBoost(result);
}

MultiPolygon BoostPolygonClipper::exclude(const MultiPolygon& a, const MultiPolygon& b) {
    BgMultiPolygon result;
    bg::sym_difference(toBoost(a), toBoost(b), result);
    return fromBoost(result);
}

} // namespace procgeo
