#include "cli/cli.hpp"
#include "config/options.hpp"
#include "logger/logger.hpp"
#include "volume/volume.hpp"
#include <iostream>
#include <string>
#include <vector>

bool run_shell(const wallace::config::ProgramOptions& options) {
  try {
    wallace::logger::Logger::init(options.log_file, options.log_level);

    std::vector<wallace::volume::Volume> volumes;
    volumes.reserve(options.volumes.size());
    for (const auto& path : options.volumes) {
      if (options.create) {
        wallace::volume::Volume::create(path);
      }
      volumes.push_back(wallace::volume::Volume::open(path));
    }

    wallace::cli::CLI cli(volumes);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to start: " << e.what();
    std::cerr << "Error: Failed to start: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = wallace::config::parse_command_line(argc, argv, std::cerr); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
