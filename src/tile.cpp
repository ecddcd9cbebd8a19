#include "tile.hpp"

#include <boost/format.hpp>

namespace pyramid {

bbox world_bounds() {
  return bbox(-180.0, -90.0, 180.0, 90.0);
}

invalid_tile_error::invalid_tile_error(int z, int x, int y)
  : std::runtime_error((boost::format("Invalid tile %1%/%2%/%3%")
                        % z % x % y).str()) {
}

invalid_tile_error::~invalid_tile_error() noexcept {
}

} // namespace pyramid
