#ifndef PYRAMID_CONFIG_HPP
#define PYRAMID_CONFIG_HPP

#include "pyramid.hpp"

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

namespace pyramid {

/**
 * Everything needed to build and run a tile pyramid. This is only
 * a container; the values are checked when a `generate_tiles` is
 * made from it.
 */
struct pyramid_config {
  pyramid_config();

  int min_zoom, max_zoom;
  std::vector<double> bounds;
  execution strategy;
  unsigned int threads;

  generate_tiles make_generator() const;
};

// parses "sequential" or "parallel".
boost::optional<execution> execution_from_string(const std::string &str);

/**
 * Read the configuration from a property tree, usually parsed from
 * a JSON file such as:
 *
 *   { "minzoom": 2, "maxzoom": 8,
 *     "bounds": [-10, 50, 2, 60],
 *     "strategy": "parallel", "threads": 4 }
 *
 * `minzoom` and `maxzoom` are mandatory, the rest default to the
 * whole world, the sequential strategy and hardware concurrency.
 *
 * Missing or unparseable values throw the property tree's own
 * exceptions, an unknown strategy throws configuration_error.
 */
pyramid_config load_config(const boost::property_tree::ptree &conf);

} // namespace pyramid

#endif // PYRAMID_CONFIG_HPP
