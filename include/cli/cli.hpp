#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "volume/volume.hpp"

namespace wallace {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR ----
  // The first volume receives insertions; lookups search all in order
  CLI(const std::vector<volume::Volume>& volumes,
      std::istream& input = std::cin, std::ostream& output = std::cout);


  // ---- STARTUP ----
  // Reads commands until "quit" or end of input
  void run();

private:
  // ---- PARAMETERS ----
  bool running_;
  std::vector<const volume::Volume*> volumes_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::string& argument);
  void handle_help_command();
  void handle_list_command();
  void handle_insert_command(const std::string& path);
  void handle_cat_command(const std::string& hash_text);
  void handle_stat_command(const std::string& hash_text);
  void handle_verify_command(const std::string& hash_text);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace wallace
