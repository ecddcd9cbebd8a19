#include "pyramid_io.hpp"

#include <limits>

namespace pyramid {

namespace {

void write_json(std::ostream &out, const pyramid_result &result) {
  out << "{";
  bool first_zoom = true;
  for (auto const &level : result) {
    if (!first_zoom) { out << ","; }
    first_zoom = false;

    out << "\"" << level.first << "\":[";
    bool first_tile = true;
    for (auto const &t : level.second) {
      if (!first_tile) { out << ","; }
      first_tile = false;
      out << "[" << t.z << "," << t.x << "," << t.y << "]";
    }
    out << "]";
  }
  out << "}\n";
}

void write_list(std::ostream &out, const pyramid_result &result) {
  for (auto const &level : result) {
    for (auto const &t : level.second) {
      out << t << "\n";
    }
  }
}

} // anonymous namespace

std::ostream &operator<<(std::ostream &out, const tile_index &t) {
  return out << t.z << "/" << t.x << "/" << t.y;
}

std::ostream &operator<<(std::ostream &out, const bbox &b) {
  const std::streamsize old_precision =
    out.precision(std::numeric_limits<double>::digits10);
  out << "[" << b.minx << ", " << b.miny << ", " << b.maxx << ", " << b.maxy << "]";
  out.precision(old_precision);
  return out;
}

std::ostream &operator<<(std::ostream &out, execution strategy) {
  switch (strategy) {
  case execution::sequential: out << "sequential"; break;
  case execution::parallel:   out << "parallel";   break;
  default:
    out << "*** Unknown strategy ***";
  }
  return out;
}

boost::optional<output_format> output_format_from_string(const std::string &str) {
  if (str == "json") {
    return output_format::json;

  } else if (str == "list") {
    return output_format::list;
  }

  return boost::none;
}

void write_result(std::ostream &out, const pyramid_result &result, output_format format) {
  switch (format) {
  case output_format::json: write_json(out, result); break;
  case output_format::list: write_list(out, result); break;
  }
}

} // namespace pyramid
