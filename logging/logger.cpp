#include "logging/logger.hpp"

#include <atomic>
#include <mutex>
#include <iostream>

namespace pyramid { namespace logging {

namespace {

std::atomic<int> current_level(static_cast<int>(level::warning));
std::mutex output_mutex;

const char *level_name(level l) {
  switch (l) {
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  default:
    return "UNKNOWN";
  }
}

} // anonymous namespace

void set_level(level l) {
  current_level.store(static_cast<int>(l));
}

level get_level() {
  return static_cast<level>(current_level.load());
}

boost::optional<level> level_from_string(const std::string &str) {
  if (str == "debug")   { return level::debug; }
  if (str == "info")    { return level::info; }
  if (str == "warning") { return level::warning; }
  if (str == "error")   { return level::error; }
  return boost::none;
}

bool enabled(level l) {
  return static_cast<int>(l) >= current_level.load();
}

void log(level l, const std::string &msg) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::clog << level_name(l) << ": " << msg << std::endl;
}

} } // namespace pyramid::logging
