#include "pyramid_config.hpp"

namespace pt = boost::property_tree;

namespace pyramid {

pyramid_config::pyramid_config()
  : min_zoom(generate_tiles::MIN_ZOOM)
  , max_zoom(generate_tiles::MIN_ZOOM)
  , bounds(generate_tiles::world_bounds_list())
  , strategy(execution::sequential)
  , threads(0) {
}

generate_tiles pyramid_config::make_generator() const {
  return generate_tiles(min_zoom, max_zoom, bounds);
}

boost::optional<execution> execution_from_string(const std::string &str) {
  if (str == "sequential") {
    return execution::sequential;

  } else if (str == "parallel") {
    return execution::parallel;
  }

  return boost::none;
}

pyramid_config load_config(const pt::ptree &conf) {
  pyramid_config config;

  config.min_zoom = conf.get<int>("minzoom");
  config.max_zoom = conf.get<int>("maxzoom");

  auto bounds_conf = conf.get_child_optional("bounds");
  if (bounds_conf) {
    // JSON lists are children with empty keys. the number of entries
    // isn't checked here, so that it's reported along with the other
    // problems with the bounds.
    config.bounds.clear();
    for (auto const &child : *bounds_conf) {
      config.bounds.push_back(child.second.get_value<double>());
    }
  }

  auto strategy_str = conf.get_optional<std::string>("strategy");
  if (strategy_str) {
    boost::optional<execution> strategy = execution_from_string(*strategy_str);
    if (!strategy) {
      throw configuration_error("Unknown strategy \"" + *strategy_str +
                                "\", expected \"sequential\" or \"parallel\"");
    }
    config.strategy = *strategy;
  }

  config.threads = conf.get<unsigned int>("threads", 0);

  return config;
}

} // namespace pyramid
