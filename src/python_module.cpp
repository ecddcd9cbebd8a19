#include <boost/python.hpp>
#include <stdexcept>

#include "pyramid.hpp"
#include "util_tile.hpp"

using namespace boost::python;
using pyramid::generate_tiles;

namespace {

std::vector<double> to_bounds(object py_bounds) {
  if (py_bounds.is_none()) {
    return generate_tiles::world_bounds_list();
  }

  std::vector<double> bounds;
  const boost::python::ssize_t n = len(py_bounds);
  for (boost::python::ssize_t i = 0; i < n; ++i) {
    extract<double> ex(py_bounds[i]);
    if (!ex.check()) {
      throw pyramid::configuration_error("Bounds must contain only numbers. "
                                         "Ex.[-180, -90, 180, 90]");
    }
    bounds.push_back(ex());
  }
  return bounds;
}

list to_list(const pyramid::tile_index &t) {
  list l;
  l.append(t.z);
  l.append(t.x);
  l.append(t.y);
  return l;
}

list to_list(const pyramid::bbox &b) {
  list l;
  l.append(b.minx);
  l.append(b.miny);
  l.append(b.maxx);
  l.append(b.maxy);
  return l;
}

dict to_dict(const pyramid::pyramid_result &result) {
  dict d;
  for (auto const &level : result) {
    list tiles;
    for (auto const &t : level.second) {
      tiles.append(to_list(t));
    }
    d[level.first] = tiles;
  }
  return d;
}

boost::shared_ptr<generate_tiles> mk_generator(int min_zoom, int max_zoom, object bounds) {
  return boost::shared_ptr<generate_tiles>(
    new generate_tiles(min_zoom, max_zoom, to_bounds(bounds)));
}

dict py_generate(const generate_tiles &g, bool parallel, unsigned int threads) {
  const pyramid::execution strategy =
    parallel ? pyramid::execution::parallel : pyramid::execution::sequential;
  return to_dict(g.generate(strategy, threads));
}

list py_bounds(const generate_tiles &g) {
  return to_list(g.bounds());
}

list pixels_to_meters(int z, double px, double py) {
  pyramid::util::projected_point p = pyramid::util::pixels_to_meters(z, px, py);
  list l;
  l.append(p.x);
  l.append(p.y);
  return l;
}

list meters_to_lat_lng(object coord) {
  const double mx = extract<double>(coord[0]);
  const double my = extract<double>(coord[1]);
  pyramid::util::projected_point p(mx, my);
  pyramid::util::lnglat ll = pyramid::util::meters_to_lnglat(p);
  list l;
  l.append(ll.lng);
  l.append(ll.lat);
  return l;
}

list tile_bounds(int z, int x, int y) {
  auto merc = pyramid::util::tile_bounds(z, x, y);
  list mins, maxs, l;
  mins.append(merc.first.x);
  mins.append(merc.first.y);
  maxs.append(merc.second.x);
  maxs.append(merc.second.y);
  l.append(mins);
  l.append(maxs);
  return l;
}

list bounds_from_tile(int z, int x, int y) {
  return to_list(pyramid::util::bounds_from_tile(z, x, y));
}

list zoom_generator(int z) {
  list tiles;
  for (auto const &t : pyramid::util::enumerate_zoom(z)) {
    tiles.append(to_list(t));
  }
  return tiles;
}

// bad arguments, either to the generator or to the tile functions,
// are reported as ValueError.
void translate_error(const std::exception &e) {
  PyErr_SetString(PyExc_ValueError, e.what());
}

} // anonymous namespace

BOOST_PYTHON_MODULE(pyramid) {
  register_exception_translator<pyramid::configuration_error>(&translate_error);
  register_exception_translator<pyramid::invalid_tile_error>(&translate_error);
  register_exception_translator<std::length_error>(&translate_error);

  class_<generate_tiles, boost::shared_ptr<generate_tiles> >("GenerateTiles", no_init)
    .def("__init__", make_constructor(&mk_generator, default_call_policies(),
                                      (arg("minZoom"),
                                       arg("maxZoom"),
                                       arg("bounds") = object())))
    .def("generate", &py_generate,
         (arg("self"),
          arg("parallel") = false,
          arg("threads") = 0),
         "Generate a dict of zoom level to the list of [z, x, y]\n"
         "tiles at that level which intersect the bounds.\n"
         "\n"
         "Usage:\n"
         ">>> import pyramid\n"
         ">>> g = pyramid.GenerateTiles(1, 1, [-10, -10, 10, 10])\n"
         ">>> g.generate(parallel = True)\n"
         "{1: [[1, 0, 0], [1, 0, 1], [1, 1, 0], [1, 1, 1]]}\n")
    .add_property("minZoom", &generate_tiles::min_zoom)
    .add_property("maxZoom", &generate_tiles::max_zoom)
    .add_property("bounds", &py_bounds)
    ;

  def("pixels_to_meters", pixels_to_meters);
  def("meters_to_lat_lng", meters_to_lat_lng);
  def("tile_is_valid", pyramid::util::tile_is_valid);
  def("tile_bounds", tile_bounds);
  def("bounds_from_tile", bounds_from_tile);
  def("zoom_generator", zoom_generator);
}
