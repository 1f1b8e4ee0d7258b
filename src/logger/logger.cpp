#include "logger/logger.hpp"
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace blobxfer::logging {

namespace {

auto make_formatter() {
  namespace expr = boost::log::expressions;
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage;
}

} // namespace

//==============================================
// INITIALIZATION
//==============================================

void init_logging(const LogConfig& config) {
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    if (config.console) {
      boost::log::add_console_log(
        std::clog,
        keywords::format = make_formatter(),
        keywords::auto_flush = true
      );
    }

    if (!config.file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(config.file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      boost::log::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::rotation_size = config.rotation_size,
        keywords::format = make_formatter(),
        keywords::auto_flush = true
      );
    }

    set_log_level(config.min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (config.file.empty() ? std::string() : " with file: " + config.file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}


//==============================================
// RUNTIME CONTROL
//==============================================

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}


//==============================================
// CONVERSION
//==============================================

severity_level parse_severity(const std::string& name) {
  severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

} // namespace blobxfer::logging
