#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace pous::logger {

namespace logging = boost::log;
namespace expr = boost::log::expressions;

//==============================================
// SEVERITY HELPERS
//==============================================

const char* to_string(severity_level level) {
  switch (level) {
    case severity_level::trace:   return "TRACE";
    case severity_level::debug:   return "DEBUG";
    case severity_level::info:    return "INFO";
    case severity_level::warning: return "WARNING";
    case severity_level::error:   return "ERROR";
    case severity_level::fatal:   return "FATAL";
    default:                      return "UNKNOWN";
  }
}

severity_level parse_severity(const std::string& name) {
  if (name == "trace") return severity_level::trace;
  if (name == "debug") return severity_level::debug;
  if (name == "info") return severity_level::info;
  if (name == "warning" || name == "warn") return severity_level::warning;
  if (name == "error") return severity_level::error;
  if (name == "fatal") return severity_level::fatal;
  throw std::invalid_argument("Logger: Unknown severity level: " + name);
}

//==============================================
// SINK SETUP
//==============================================

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<logging::sinks::text_file_backend>();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = logging::sinks::synchronous_sink<logging::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);

    sink->set_formatter(
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "] "
        << expr::smessage
    );

    logging::core::get()->add_sink(sink);
    logging::add_common_attributes();

    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging system initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  logging::core::get()->remove_all_sinks();

  logging::add_console_log(
    std::clog,
    logging::keywords::format = (
      expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f") << "]"
        << " [" << logging::trivial::severity << "] "
        << expr::smessage
    ),
    logging::keywords::auto_flush = true
  );

  logging::add_common_attributes();
  set_log_level(min_level);
  enable_logging();
}

void set_log_level(severity_level min_level) {
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

void enable_logging() {
  logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  logging::core::get()->set_logging_enabled(false);
}

} // namespace pous::logger
