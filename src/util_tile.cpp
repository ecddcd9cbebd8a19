#include "util_tile.hpp"

#include <limits>
#include <stdexcept>
#include <boost/format.hpp>

namespace pyramid { namespace util {

bool tile_is_valid(int z, int x, int y) {
  if ((z < 0) || (x < 0) || (y < 0)) {
    return false;
  }
  // past this zoom, 2^z is bigger than any int, so every
  // non-negative x and y is in range.
  if (z >= std::numeric_limits<int>::digits) {
    return true;
  }
  const int size = 1 << z;
  return (x < size) && (y < size);
}

std::pair<projected_point, projected_point> tile_bounds(int z, int x, int y) {
  if (!tile_is_valid(z, x, y)) {
    throw invalid_tile_error(z, x, y);
  }

  // note the y-inversion: the bottom pixel row of the tile is the
  // geometric minimum.
  const double px = double(x) * TILE_SIZE;
  const double py = double(y) * TILE_SIZE;
  projected_point mins = pixels_to_meters(z, px, py + TILE_SIZE);
  projected_point maxs = pixels_to_meters(z, px + TILE_SIZE, py);

  return std::make_pair(mins, maxs);
}

bbox bounds_from_tile(int z, int x, int y) {
  std::pair<projected_point, projected_point> merc = tile_bounds(z, x, y);
  lnglat mins = meters_to_lnglat(merc.first);
  lnglat maxs = meters_to_lnglat(merc.second);

  return bbox(mins.lng, mins.lat, maxs.lng, maxs.lat);
}

std::vector<tile_index> enumerate_zoom(int z) {
  if ((z < 0) || (z > MAX_ENUMERATE_ZOOM)) {
    throw std::length_error((boost::format("Unable to enumerate tiles at zoom %1%, "
                                           "must be between 0 and %2%")
                             % z % MAX_ENUMERATE_ZOOM).str());
  }
  const int size = 1 << z;

  std::vector<tile_index> tiles;
  tiles.reserve(size_t(size) * size_t(size));

  for (int x = 0; x < size; ++x) {
    for (int y = 0; y < size; ++y) {
      tiles.emplace_back(z, x, y);
    }
  }

  return tiles;
}

} } // namespace pyramid::util
