#ifndef PYRAMID_IO_HPP
#define PYRAMID_IO_HPP

#include "tile.hpp"
#include "pyramid.hpp"

#include <ostream>
#include <string>
#include <boost/optional.hpp>

namespace pyramid {

// writes the tile as "z/x/y".
std::ostream &operator<<(std::ostream &out, const tile_index &t);

// writes the box as "[minx, miny, maxx, maxy]".
std::ostream &operator<<(std::ostream &out, const bbox &b);

std::ostream &operator<<(std::ostream &out, execution strategy);

enum class output_format {
  // {"z": [[z, x, y], ...], ...}
  json,
  // one z/x/y per line
  list
};

boost::optional<output_format> output_format_from_string(const std::string &str);

void write_result(std::ostream &out, const pyramid_result &result, output_format format);

} // namespace pyramid

#endif // PYRAMID_IO_HPP
