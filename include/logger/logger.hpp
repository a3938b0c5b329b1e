#ifndef WALLACE_LOGGER_HPP
#define WALLACE_LOGGER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <boost/log/trivial.hpp>

namespace wallace::logger {

using severity_level = boost::log::trivial::severity_level;

class Logger {
public:
  // Installs a rotating file sink and, optionally, a console sink on stderr.
  // Replaces any sinks installed earlier.
  static void init(const std::string& log_file = "wallace.log",
                   severity_level min_level = boost::log::trivial::info,
                   bool console = false);

  // Changes the minimum severity of every sink
  static void set_level(severity_level min_level);

  // "trace", "debug", "info", "warning", "error" or "fatal"
  static std::optional<severity_level> parse_level(std::string_view name);
};

} // namespace wallace::logger

#endif // WALLACE_LOGGER_HPP
