#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/format.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "pyramid.hpp"
#include "pyramid_config.hpp"
#include "pyramid_io.hpp"
#include "util_tile.hpp"
#include "logging/logger.hpp"
#include "config.h"

namespace bpo = boost::program_options;
namespace bpt = boost::property_tree;
namespace bal = boost::algorithm;

namespace {

// parses "minx,miny,maxx,maxy". commas and spaces are both accepted
// as separators, so that the bounds can be pasted from a JSON list.
// the number of values isn't checked here.
std::vector<double> parse_bounds(const std::string &str) {
  std::vector<std::string> parts;
  bal::split(parts, str, bal::is_any_of(", []"), bal::token_compress_on);

  std::vector<double> bounds;
  for (auto const &part : parts) {
    if (!part.empty()) {
      try {
        bounds.push_back(boost::lexical_cast<double>(part));

      } catch (const boost::bad_lexical_cast &) {
        throw std::runtime_error((boost::format("Unable to parse \"%1%\" in bounds "
                                                "\"%2%\" as a number.") % part % str).str());
      }
    }
  }
  return bounds;
}

} // anonymous namespace

int make_pyramid(int argc, char *argv[]) {
  std::string config_file, bounds_str, format_str, output_file;
  unsigned int threads = 0;

  bpo::options_description options(
    "Pyramid " VERSION "\n"
    "\n"
    "  Usage: pyramid generate [options] <min-z> <max-z>\n"
    "\n"
    "Lists the z/x/y tiles for each zoom level from <min-z> to <max-z>, inclusive, "
    "which intersect the bounds. Tiles which only touch the bounds along an edge "
    "or at a corner are included.\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    ("config-file,c", bpo::value<std::string>(&config_file),
     "JSON config file with \"minzoom\", \"maxzoom\" and, optionally, \"bounds\", "
     "\"strategy\" and \"threads\". Options given on the command line take "
     "precedence.")
    ("bounds,b", bpo::value<std::string>(&bounds_str),
     "Bounds in degrees as \"min-lng,min-lat,max-lng,max-lat\". Defaults to the "
     "whole world. Use --bounds=... when the first value is negative.")
    ("parallel,P", "Test tiles against the bounds using a pool of threads.")
    ("threads,j", bpo::value<unsigned int>(&threads),
     "Number of threads to use with --parallel. The default, 0, means to use one "
     "per hardware thread.")
    ("format,f", bpo::value<std::string>(&format_str)->default_value("json"),
     "Output format, either \"json\" or \"list\".")
    ("output-file,o", bpo::value<std::string>(&output_file),
     "File to write the tiles to. Defaults to standard output.")
    ("verbose,v", "Log progress for each zoom level.")
    // positional arguments
    ("min-z", bpo::value<int>(), "Minimum zoom level to generate.")
    ("max-z", bpo::value<int>(), "Maximum zoom level to generate.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("min-z", 1)
    .add("max-z", 1)
    ;

  bpo::variables_map vm;

  try {
    bpo::store(bpo::command_line_parser(argc,argv)
               .options(options)
               .positional(pos_options)
               .run(),
               vm);
    bpo::notify(vm);

  } catch (std::exception & e) {
    std::cerr << "Unable to parse command line options because: " << e.what() << "\n"
              << "This is a bug, please report it at " PACKAGE_BUGREPORT << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  if (vm.count("verbose")) {
    pyramid::logging::set_level(pyramid::logging::level::debug);
  }

  // argument checking and verification. the zoom levels can come
  // from the config file instead.
  if (config_file.empty()) {
    for (auto arg : {"min-z", "max-z"}) {
      if (vm.count(arg) == 0) {
        std::cerr << "The <" << arg << "> argument was not provided, but is mandatory\n\n";
        std::cerr << options << "\n";
        return EXIT_FAILURE;
      }
    }
  }

  boost::optional<pyramid::output_format> format =
    pyramid::output_format_from_string(format_str);
  if (!format) {
    std::cerr << "The string \"" << format_str << "\" was not recognised as a "
              << "valid output format.\n";
    return EXIT_FAILURE;
  }

  pyramid::pyramid_config config;
  if (!config_file.empty()) {
    try {
      bpt::ptree conf;
      bpt::read_json(config_file, conf);
      config = pyramid::load_config(conf);

    } catch (bpt::ptree_error const& e) {
      std::cerr << "Error while parsing config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;

    } catch (std::exception const& e) {
      std::cerr << "Error while loading config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  }

  try {
    if (vm.count("min-z")) { config.min_zoom = vm["min-z"].as<int>(); }
    if (vm.count("max-z")) { config.max_zoom = vm["max-z"].as<int>(); }
    if (vm.count("bounds")) { config.bounds = parse_bounds(bounds_str); }
    if (vm.count("parallel")) { config.strategy = pyramid::execution::parallel; }
    if (vm.count("threads")) { config.threads = threads; }

    pyramid::generate_tiles generator = config.make_generator();

    LOG_INFO(boost::format("Generating zoom levels %1% to %2% within %3% (%4%)")
             % generator.min_zoom() % generator.max_zoom()
             % generator.bounds() % config.strategy);

    pyramid::pyramid_result result = generator.generate(config.strategy, config.threads);

    if (output_file.empty()) {
      pyramid::write_result(std::cout, result, *format);

    } else {
      std::ofstream output(output_file);
      if (!output) {
        throw std::runtime_error((boost::format("Unable to open output file %1%")
                                  % output_file).str());
      }
      pyramid::write_result(output, result, *format);
    }

  } catch (const std::exception &e) {
    std::cerr << "Unable to generate tiles: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

int tile_bounds(int argc, char *argv[]) {
  int z = 0, x = 0, y = 0;

  bpo::options_description options(
    "Pyramid " VERSION "\n"
    "\n"
    "  Usage: pyramid bounds [options] <tile-z> <tile-x> <tile-y>\n"
    "\n"
    "Prints the bounds of the tile in degrees as [min-lng, min-lat, max-lng, max-lat].\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    // positional arguments
    ("tile-z", bpo::value<int>(&z), "Zoom level.")
    ("tile-x", bpo::value<int>(&x), "Tile x coordinate.")
    ("tile-y", bpo::value<int>(&y), "Tile y coordinate.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("tile-z", 1)
    .add("tile-x", 1)
    .add("tile-y", 1)
    ;

  bpo::variables_map vm;

  try {
    bpo::store(bpo::command_line_parser(argc,argv)
               .options(options)
               .positional(pos_options)
               .run(),
               vm);
    bpo::notify(vm);

  } catch (std::exception & e) {
    std::cerr << "Unable to parse command line options because: " << e.what() << "\n"
              << "This is a bug, please report it at " PACKAGE_BUGREPORT << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  for (auto arg : {"tile-z", "tile-x", "tile-y"}) {
    if (vm.count(arg) == 0) {
      std::cerr << "The <" << arg << "> argument was not provided, but is mandatory\n\n";
      std::cerr << options << "\n";
      return EXIT_FAILURE;
    }
  }

  try {
    std::cout << pyramid::util::bounds_from_tile(z, x, y) << "\n";

  } catch (const pyramid::invalid_tile_error &e) {
    std::cerr << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
  if (argc > 1) {
    std::string command = argv[1];

    // drop the command from the arguments, so that the sub-command
    // sees the program name followed by its own options.
    std::vector<char *> new_argv;
    new_argv.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
      new_argv.push_back(argv[i]);
    }
    const int new_argc = int(new_argv.size());

    if (command == "generate") {
      return make_pyramid(new_argc, new_argv.data());

    } else if (command == "bounds") {
      return tile_bounds(new_argc, new_argv.data());

    } else {
      std::cerr << "Unknown command \"" << command << "\".\n";
    }
  }

  std::cerr <<
    "pyramid <command> [command-options]\n"
    "\n"
    "Where command is:\n"
    "  generate: List the tiles covering a bounding box over a\n"
    "            range of zoom levels.\n"
    "  bounds: Print the geographic bounds of a single tile.\n"
    "\n"
    "To get more information on the options available for a\n"
    "particular command, run `pyramid <command> --help`.\n";
  return EXIT_FAILURE;
}
