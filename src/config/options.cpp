#include "config/options.hpp"
#include <unordered_set>

namespace wallace::config {

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " -v <volume> [-v <volume> ...] [options]\n"
      << "Required arguments:\n"
      << "  -v, --volume     Volume directory (repeatable, searched in order)\n"
      << "Options:\n"
      << "  --create         Create the volumes before opening them\n"
      << "  --log-file       Log file path (default wallace.log)\n"
      << "  --log-level      trace|debug|info|warning|error|fatal (default info)\n"
      << "Example: " << program_name << " -v /srv/wallace/main -v /mnt/archive\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  const std::unordered_set<std::string> value_flags = {
    "-v", "--volume", "--log-file", "--log-level"
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "wallace";

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--create") {
      options.create = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-v" || flag == "--volume") {
      options.volumes.push_back(value);
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "--log-level") {
      auto level = logger::Logger::parse_level(value);
      if (!level) {
        err << "Error: Invalid log level: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.log_level = *level;
    }
  }

  if (options.volumes.empty()) {
    err << "Error: At least one volume is required\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace wallace::config
