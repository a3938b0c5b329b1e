#ifndef WALLACE_CONFIG_OPTIONS_HPP
#define WALLACE_CONFIG_OPTIONS_HPP

#include <ostream>
#include <string>
#include <vector>
#include "logger/logger.hpp"

namespace wallace::config {

struct ProgramOptions {
  // Volume roots in lookup order; the first one receives insertions
  std::vector<std::string> volumes;
  bool create{false};
  std::string log_file{"wallace.log"};
  logger::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Parses argv; on any error prints a message and usage to err and returns valid == false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace wallace::config

#endif // WALLACE_CONFIG_OPTIONS_HPP
