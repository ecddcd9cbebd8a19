#ifndef PYRAMID_UTIL_HPP
#define PYRAMID_UTIL_HPP

namespace pyramid { namespace util {

// radius of the sphere used by spherical (web) mercator.
const double EARTH_RADIUS = 6378137.0;

// width and height of a tile in pixels.
const int TILE_SIZE = 256;

// a location in spherical mercator (EPSG:3857) meters.
struct projected_point {
  projected_point() : x(0), y(0) {}
  projected_point(double x_, double y_) : x(x_), y(y_) {}
  double x, y;
};

// a location in degrees.
struct lnglat {
  lnglat() : lng(0), lat(0) {}
  lnglat(double lng_, double lat_) : lng(lng_), lat(lat_) {}
  double lng, lat;
};

// returns the position in mercator meters of the pixel (px, py) in
// the 256 * 2^z pixel grid covering the world at zoom level z. the
// pixel grid has its origin at the top-left, with y increasing
// downward, whereas mercator meters have y increasing upward.
projected_point pixels_to_meters(int z, double px, double py);

// inverse mercator projection, from meters to degrees.
lnglat meters_to_lnglat(const projected_point &p);

} } // namespace pyramid::util

#endif // PYRAMID_UTIL_HPP
