#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <filesystem>
#include <iostream>

namespace wallace::logger {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

//==============================================
// INITIALIZATION
//==============================================

void Logger::init(const std::string& log_file, severity_level min_level, bool console) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    const auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    const std::filesystem::path log_path = std::filesystem::absolute(log_file);
    logging::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::format = format,
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );

    if (console) {
      logging::add_console_log(
        std::clog,
        keywords::format = format,
        keywords::auto_flush = true
      );
    }

    logging::add_common_attributes();
    set_level(min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void Logger::set_level(severity_level min_level) {
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

std::optional<severity_level> Logger::parse_level(std::string_view name) {
  if (name == "trace")   return logging::trivial::trace;
  if (name == "debug")   return logging::trivial::debug;
  if (name == "info")    return logging::trivial::info;
  if (name == "warning") return logging::trivial::warning;
  if (name == "error")   return logging::trivial::error;
  if (name == "fatal")   return logging::trivial::fatal;
  return std::nullopt;
}

} // namespace wallace::logger
