#ifndef PYRAMID_UTIL_TILE_HPP
#define PYRAMID_UTIL_TILE_HPP

#include "tile.hpp"
#include "util.hpp"

#include <utility>
#include <vector>

namespace pyramid { namespace util {

// true if both x and y are in the range [0, 2^z).
bool tile_is_valid(int z, int x, int y);

/* returns the (min, max) corners of the tile in mercator
 * meters. the min corner is the bottom-left of the tile, which
 * is pixel (x, y+1) * TILE_SIZE, as pixel y increases downward.
 *
 * throws invalid_tile_error if the tile is not valid.
 */
std::pair<projected_point, projected_point> tile_bounds(int z, int x, int y);

// returns the bounding box of the tile in degrees.
bbox bounds_from_tile(int z, int x, int y);

inline bbox bounds_from_tile(const tile_index &t) {
  return bounds_from_tile(t.z, t.x, t.y);
}

// the largest zoom at which tile coordinates still fit in an int.
const int MAX_ENUMERATE_ZOOM = 30;

/* returns every tile at zoom z, all 4^z of them, in x-major
 * order. that is, all the tiles in the column x=0 with y
 * ascending, then column x=1, and so on.
 *
 * downstream filtering must keep to this order.
 *
 * throws std::length_error if z is negative or greater than
 * MAX_ENUMERATE_ZOOM.
 */
std::vector<tile_index> enumerate_zoom(int z);

} } // namespace pyramid::util

#endif // PYRAMID_UTIL_TILE_HPP
