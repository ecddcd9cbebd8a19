#ifndef PYRAMID_INTERSECT_HPP
#define PYRAMID_INTERSECT_HPP

#include "tile.hpp"

namespace pyramid {

/* returns true if the two boxes overlap. each box is turned into a
 * closed rectangular polygon and tested with boost::geometry's
 * `intersects`, which includes the boundary: boxes which only touch
 * along an edge, or at a corner, are considered to intersect. this
 * also means a degenerate (zero-area) target box still intersects
 * the tile(s) it lies in.
 */
bool tile_intersects_bounds(const bbox &tile, const bbox &target);

} // namespace pyramid

#endif // PYRAMID_INTERSECT_HPP
