#ifndef TBSTREAM_LOGGER_HPP
#define TBSTREAM_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace tbstream::logging {

// Convert severity level to string for formatting
const char* to_string(boost::log::trivial::severity_level level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
boost::log::trivial::severity_level parse_level(const std::string& name);

// Initialize logging system with a synchronous text file sink
void init_logging(const std::string& log_file = "tbstream.log",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Changes the minimum severity accepted by the core
void set_log_level(boost::log::trivial::severity_level min_level);

// Drops the INFO/WARN chatter the cluster tools print on stderr
std::string clean_hadoop_stderr(const std::string& stderr_text);

} // namespace tbstream::logging

#endif // TBSTREAM_LOGGER_HPP
