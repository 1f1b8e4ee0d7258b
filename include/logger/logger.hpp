#ifndef BLOBXFER_LOGGER_HPP
#define BLOBXFER_LOGGER_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <string>

namespace blobxfer::logging {

using severity_level = boost::log::trivial::severity_level;

struct LogConfig {
  // Empty file name logs to the console only
  std::string file;
  severity_level min_level = boost::log::trivial::info;
  bool console = true;
  // Rotate the file sink after this many bytes
  std::size_t rotation_size = 10 * 1024 * 1024;
};

// ---- INITIALIZATION ----
// Replaces all sinks with the ones described by config
void init_logging(const LogConfig& config);


// ---- RUNTIME CONTROL ----
void set_log_level(severity_level level);
void enable_logging();
void disable_logging();


// ---- CONVERSION ----
// Parses trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

} // namespace blobxfer::logging

#endif // BLOBXFER_LOGGER_HPP
