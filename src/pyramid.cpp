#include "pyramid.hpp"
#include "intersect.hpp"
#include "util_tile.hpp"
#include "parallel_filter.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

namespace pyramid {

namespace {

// checks the configuration in the order the problems are reported,
// returning the bounds as a box if they're all fine.
bbox checked_bounds(int min_zoom, int max_zoom, const std::vector<double> &bounds) {
  if (min_zoom > generate_tiles::MAX_ZOOM) {
    throw configuration_error("min_zoom must be less than or equal to 20");
  }
  if (min_zoom < generate_tiles::MIN_ZOOM) {
    throw configuration_error("min_zoom must be greater than or equal to 1");
  }
  if (max_zoom < generate_tiles::MIN_ZOOM) {
    throw configuration_error("max_zoom must be greater than or equal to 1");
  }
  if (max_zoom > generate_tiles::MAX_ZOOM) {
    throw configuration_error("max_zoom must be less than or equal to 20");
  }
  if (min_zoom > max_zoom) {
    throw configuration_error("min_zoom must be less than or equal to max_zoom");
  }
  if (bounds.size() != 4) {
    throw configuration_error("Incorrect length for bounds. Ex.[-180, -90, 180, 90]");
  }
  if (bounds[0] < -180.0) {
    throw configuration_error("Minimum x bounds must be greater than or equal to -180");
  }
  if (bounds[1] < -90.0) {
    throw configuration_error("Minimum y bounds must be greater than or equal to -90");
  }
  if (bounds[2] > 180.0) {
    throw configuration_error("Maximum x bounds must be less than or equal to 180");
  }
  if (bounds[3] > 90.0) {
    throw configuration_error("Maximum y bounds must be less than or equal to 90");
  }
  if (bounds[0] > bounds[2]) {
    throw configuration_error("Minimum x bounds must be less than maximum x bounds");
  }
  if (bounds[1] > bounds[3]) {
    throw configuration_error("Minimum y bounds must be less than maximum y bounds");
  }

  return bbox(bounds[0], bounds[1], bounds[2], bounds[3]);
}

} // anonymous namespace

configuration_error::configuration_error(const std::string &msg)
  : std::runtime_error(msg) {
}

configuration_error::~configuration_error() noexcept {
}

bool tile_in_bounds(const tile_index &t, const bbox &bounds) {
  return tile_intersects_bounds(util::bounds_from_tile(t), bounds);
}

generate_tiles::generate_tiles(int min_zoom, int max_zoom,
                               const std::vector<double> &bounds)
  : m_min_zoom(min_zoom)
  , m_max_zoom(max_zoom)
  , m_bounds(checked_bounds(min_zoom, max_zoom, bounds)) {
}

std::vector<double> generate_tiles::world_bounds_list() {
  const bbox w = world_bounds();
  return std::vector<double>{w.minx, w.miny, w.maxx, w.maxy};
}

bool generate_tiles::covers_world() const {
  return m_bounds == world_bounds();
}

pyramid_result generate_tiles::generate(execution strategy, unsigned int threads) const {
  pyramid_result result;
  const bool world = covers_world();

  for (int z = m_min_zoom; z <= m_max_zoom; ++z) {
    std::vector<tile_index> tiles = util::enumerate_zoom(z);
    const size_t num_candidates = tiles.size();

    // a query for the whole world must cover every tile, so there's
    // no need to test them.
    if (!world) {
      if (strategy == execution::parallel) {
        tiles = filter_parallel(std::move(tiles), threads);
      } else {
        tiles = filter_sequential(std::move(tiles));
      }
    }

    LOG_DEBUG(boost::format("Zoom %1%: kept %2% of %3% tiles")
              % z % tiles.size() % num_candidates);

    result.insert(std::make_pair(z, std::move(tiles)));
  }

  return result;
}

std::vector<tile_index> generate_tiles::filter_sequential(std::vector<tile_index> &&tiles) const {
  std::vector<tile_index> kept;
  for (const tile_index &t : tiles) {
    if (tile_in_bounds(t, m_bounds)) {
      kept.push_back(t);
    }
  }
  return kept;
}

std::vector<tile_index> generate_tiles::filter_parallel(std::vector<tile_index> &&tiles,
                                                        unsigned int threads) const {
  const bbox &bounds = m_bounds;
  return util::parallel_filter(tiles, [&bounds](const tile_index &t) {
      return tile_in_bounds(t, bounds);
    }, threads);
}

} // namespace pyramid
