#ifndef PYRAMID_TILE_HPP
#define PYRAMID_TILE_HPP

#include <stdexcept>
#include <string>

namespace pyramid {

/**
 * Coordinates of a single tile in the conventional z/x/y slippy
 * map scheme. x=0 is west-most and increases heading east, y=0 is
 * north-most and increases heading south. Both range from 0 to
 * 2^z - 1.
 */
struct tile_index {
  tile_index() : z(0), x(0), y(0) {}
  tile_index(int z_, int x_, int y_) : z(z_), x(x_), y(y_) {}

  int z, x, y;
};

inline bool operator==(const tile_index &a, const tile_index &b) {
  return (a.z == b.z) && (a.x == b.x) && (a.y == b.y);
}

inline bool operator!=(const tile_index &a, const tile_index &b) {
  return !(a == b);
}

/**
 * Axis-aligned bounding box. Used both for geographic bounds, in
 * degrees of longitude (x) and latitude (y), and for projected
 * bounds in mercator meters.
 */
struct bbox {
  bbox() : minx(0), miny(0), maxx(0), maxy(0) {}
  bbox(double minx_, double miny_, double maxx_, double maxy_)
    : minx(minx_), miny(miny_), maxx(maxx_), maxy(maxy_) {}

  double minx, miny, maxx, maxy;
};

inline bool operator==(const bbox &a, const bbox &b) {
  return (a.minx == b.minx) && (a.miny == b.miny) &&
    (a.maxx == b.maxx) && (a.maxy == b.maxy);
}

inline bool operator!=(const bbox &a, const bbox &b) {
  return !(a == b);
}

// the whole world, [-180, -90, 180, 90], in degrees.
bbox world_bounds();

/* Thrown when tile geometry is requested for a z/x/y which doesn't
 * exist, i.e: x or y out of the range [0, 2^z).
 */
struct invalid_tile_error : public std::runtime_error {
  invalid_tile_error(int z, int x, int y);
  virtual ~invalid_tile_error() noexcept;
};

} // namespace pyramid

#endif // PYRAMID_TILE_HPP
