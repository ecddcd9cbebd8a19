#include "intersect.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace bg = boost::geometry;

using point_2d = bg::model::point<double, 2, bg::cs::cartesian>;
// counter-clockwise and closed (first point == last point), which
// is the order the rings are built in below.
using polygon_2d = bg::model::polygon<point_2d, false, true>;

namespace {

polygon_2d make_polygon(const pyramid::bbox &b) {
  polygon_2d poly;
  bg::append(poly.outer(), bg::make<point_2d>(b.minx, b.miny));
  bg::append(poly.outer(), bg::make<point_2d>(b.maxx, b.miny));
  bg::append(poly.outer(), bg::make<point_2d>(b.maxx, b.maxy));
  bg::append(poly.outer(), bg::make<point_2d>(b.minx, b.maxy));
  bg::append(poly.outer(), bg::make<point_2d>(b.minx, b.miny));
  return poly;
}

} // anonymous namespace

namespace pyramid {

bool tile_intersects_bounds(const bbox &tile, const bbox &target) {
  const polygon_2d a = make_polygon(tile);
  const polygon_2d b = make_polygon(target);

  return bg::intersects(a, b);
}

} // namespace pyramid
