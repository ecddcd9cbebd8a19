#include "util.hpp"

#include <cmath>

#define HALF_WORLD_SIZE (M_PI * pyramid::util::EARTH_RADIUS)

namespace pyramid { namespace util {

projected_point pixels_to_meters(int z, double px, double py) {
  const double resolution =
    (2.0 * HALF_WORLD_SIZE / TILE_SIZE) / std::pow(2.0, z);

  return projected_point(
    px * resolution - HALF_WORLD_SIZE,
    -(py * resolution - HALF_WORLD_SIZE));
}

lnglat meters_to_lnglat(const projected_point &p) {
  const double lng = (p.x / HALF_WORLD_SIZE) * 180.0;

  // latitude on the mercator "spherical" plane, which is then
  // un-stretched through the inverse gudermannian.
  const double t = (p.y / HALF_WORLD_SIZE) * 180.0;
  const double lat = 180.0 / M_PI *
    (2.0 * std::atan(std::exp(t * M_PI / 180.0)) - M_PI / 2.0);

  return lnglat(lng, lat);
}

} } // namespace pyramid::util
