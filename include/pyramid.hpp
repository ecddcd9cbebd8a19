#ifndef PYRAMID_PYRAMID_HPP
#define PYRAMID_PYRAMID_HPP

#include "tile.hpp"

#include <map>
#include <vector>
#include <stdexcept>
#include <string>

namespace pyramid {

/* Thrown when a tile pyramid is constructed or configured with an
 * out-of-range zoom or malformed bounds.
 */
struct configuration_error : public std::runtime_error {
  explicit configuration_error(const std::string &msg);
  virtual ~configuration_error() noexcept;
};

// how the per-tile containment test is run over a zoom level.
enum class execution {
  sequential,
  parallel
};

// zoom level -> tiles at that level, in x-major order.
typedef std::map<int, std::vector<tile_index> > pyramid_result;

/* tests a single tile against the target bounds, returning true if
 * the tile should be kept. this depends only on its arguments, so
 * is safe to call concurrently.
 */
bool tile_in_bounds(const tile_index &t, const bbox &bounds);

/**
 * Generates the tiles, over a range of zoom levels, which cover a
 * bounding box.
 */
class generate_tiles {
public:
  static const int MIN_ZOOM = 1;
  static const int MAX_ZOOM = 20;

  /**
   * Arguments:
   *
   *   min_zoom, max_zoom
   *     Inclusive range of zoom levels to generate, each of which
   *     must be between 1 and 20.
   *
   *   bounds
   *     Geographic bounds [min lng, min lat, max lng, max lat] in
   *     degrees. Defaults to the whole world.
   *
   * Throws configuration_error, describing the first problem found,
   * if any argument is out of range.
   */
  generate_tiles(int min_zoom, int max_zoom,
                 const std::vector<double> &bounds = world_bounds_list());

  /**
   * Generate the tiles for each zoom level. The result contains
   * every zoom level in the range, even if no tiles were found for
   * it, and the tiles in each level are in x-major order whichever
   * strategy is used.
   *
   * Arguments:
   *
   *   strategy
   *     Run the containment tests on this thread, or spread them
   *     across a pool of worker threads.
   *
   *   threads
   *     Number of worker threads for the parallel strategy. Zero
   *     means use the hardware concurrency of the host.
   *
   * If a worker thread fails, the exception is re-thrown here
   * after all the workers have been joined.
   */
  pyramid_result generate(execution strategy = execution::sequential,
                          unsigned int threads = 0) const;

  int min_zoom() const { return m_min_zoom; }
  int max_zoom() const { return m_max_zoom; }
  const bbox &bounds() const { return m_bounds; }

  // true if the bounds are exactly the whole world, in which case
  // no filtering is needed.
  bool covers_world() const;

  static std::vector<double> world_bounds_list();

private:
  std::vector<tile_index> filter_sequential(std::vector<tile_index> &&tiles) const;
  std::vector<tile_index> filter_parallel(std::vector<tile_index> &&tiles,
                                          unsigned int threads) const;

  const int m_min_zoom, m_max_zoom;
  const bbox m_bounds;
};

} // namespace pyramid

#endif // PYRAMID_PYRAMID_HPP
