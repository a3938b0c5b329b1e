#include "cli/cli.hpp"
#include "volume/union.hpp"
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace wallace {
namespace cli {

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(const std::vector<volume::Volume>& volumes, std::istream& input, std::ostream& output)
  : running_(false)
  , input_(input)
  , output_(output) {
  if (volumes.empty()) {
    throw std::invalid_argument("CLI: at least one volume is required");
  }
  for (const auto& v : volumes) {
    volumes_.push_back(&v);
  }
  BOOST_LOG_TRIVIAL(info) << "CLI: initialized with " << volumes_.size() << " volumes";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "wallace> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command, argument;
    iss >> command;

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (command.empty()) {
      // blank line
    } else if (command == "ls" || command == "help") {
      process_command(command, "");
    } else if (iss >> argument) {
      process_command(command, argument);
    } else {
      output_ << "Invalid input. Usage: <command> [argument]" << std::endl;
    }

    if (running_) {
      output_ << "wallace> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with argument: " << argument;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "insert") {
    handle_insert_command(argument);
  }
  else if (command == "cat") {
    handle_cat_command(argument);
  }
  else if (command == "stat") {
    handle_stat_command(argument);
  }
  else if (command == "verify") {
    handle_verify_command(argument);
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help'" << std::endl;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help              Display this help message" << std::endl;
  output_ << "  ls                List the hashes of all objects" << std::endl;
  output_ << "  insert <path>     Insert a local file into the first volume" << std::endl;
  output_ << "  cat <hash>        Print the contents of an object" << std::endl;
  output_ << "  stat <hash>       Show the size and volume of an object" << std::endl;
  output_ << "  verify <hash>     Check that an object matches its hash" << std::endl;
  output_ << "  quit              Exit the shell" << std::endl;
}

void CLI::handle_list_command() {
  auto all = volume::union_all(volumes_);
  for (;;) {
    try {
      auto hash = all.next();
      if (!hash) {
        break;
      }
      output_ << *hash << std::endl;
    } catch (const std::exception& e) {
      // The enumerator has moved on to the next volume
      log_and_display_error("Error listing volume", e.what());
    }
  }
}

void CLI::handle_insert_command(const std::string& path) {
  try {
    const volume::Hash hash = volumes_.front()->insert_from_path(path);
    output_ << hash << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error inserting file", e.what());
  }
}

void CLI::handle_cat_command(const std::string& hash_text) {
  try {
    const volume::Hash hash = volume::Hash::from_string(hash_text);
    auto reader = volume::union_get(volumes_, hash);
    if (!reader) {
      output_ << "Object not found: " << hash << std::endl;
      return;
    }
    reader->copy_to(output_);
    output_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading object", e.what());
  }
}

void CLI::handle_stat_command(const std::string& hash_text) {
  try {
    const volume::Hash hash = volume::Hash::from_string(hash_text);
    for (std::size_t i = 0; i < volumes_.size(); ++i) {
      if (auto reader = volumes_[i]->get(hash)) {
        output_ << hash << " size " << reader->size() << " volume " << i
                << " (" << volumes_[i]->root_path().string() << ")" << std::endl;
        return;
      }
    }
    output_ << "Object not found: " << hash << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading object", e.what());
  }
}

void CLI::handle_verify_command(const std::string& hash_text) {
  try {
    const volume::Hash hash = volume::Hash::from_string(hash_text);
    for (const volume::Volume* v : volumes_) {
      if (v->verify(hash)) {
        output_ << "OK " << hash << std::endl;
        return;
      }
    }
    output_ << "Object not found: " << hash << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error verifying object", e.what());
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace wallace
