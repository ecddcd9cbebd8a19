#ifndef PYRAMID_LOGGER_HPP
#define PYRAMID_LOGGER_HPP

#include <string>
#include <boost/format.hpp>
#include <boost/optional.hpp>

namespace pyramid { namespace logging {

enum class level {
  debug = 0,
  info = 1,
  warning = 2,
  error = 3
};

// messages below this level are dropped. the default is
// `level::warning`.
void set_level(level l);
level get_level();

// parses "debug", "info", "warning" or "error".
boost::optional<level> level_from_string(const std::string &str);

bool enabled(level l);

// writes a single line to std::clog, prefixed with the level
// name. lines from different threads are not interleaved.
void log(level l, const std::string &msg);

inline void log(level l, const boost::format &fmt) {
  log(l, fmt.str());
}

} } // namespace pyramid::logging

// the argument is only evaluated if the level is enabled, so it's
// fine to build expensive boost::format objects in log calls.
#define PYRAMID_LOG_AT(lvl, msg) do {                    \
    if (::pyramid::logging::enabled(lvl)) {              \
      ::pyramid::logging::log((lvl), (msg));             \
    }                                                    \
  } while (0)

#define LOG_DEBUG(msg)   PYRAMID_LOG_AT(::pyramid::logging::level::debug, msg)
#define LOG_INFO(msg)    PYRAMID_LOG_AT(::pyramid::logging::level::info, msg)
#define LOG_WARNING(msg) PYRAMID_LOG_AT(::pyramid::logging::level::warning, msg)
#define LOG_ERROR(msg)   PYRAMID_LOG_AT(::pyramid::logging::level::error, msg)

#endif // PYRAMID_LOGGER_HPP
