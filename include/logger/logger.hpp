#ifndef POUS_LOGGER_HPP
#define POUS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace pous::logger {

using severity_level = boost::log::trivial::severity_level;

// Convert severity level to string for formatting
const char* to_string(severity_level level);

// Parse a severity name ("trace", "debug", ...), throws std::invalid_argument on unknown names
severity_level parse_severity(const std::string& name);

// Initialize logging system with a synchronous text file sink, replacing existing sinks
void init_logging(const std::string& log_file = "pous.log",
                  severity_level min_level = severity_level::info);

// Initialize logging system with a console sink (used by tests and the shell)
void init_console_logging(severity_level min_level = severity_level::info);

// Adjust the minimum severity of the installed sinks
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

} // namespace pous::logger

#endif // POUS_LOGGER_HPP
