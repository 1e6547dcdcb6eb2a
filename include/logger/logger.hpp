#ifndef CLOUDSYNC_LOGGER_HPP
#define CLOUDSYNC_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace cloudsync::logging {

// Call sites log through BOOST_LOG_TRIVIAL; this module owns the sink and filter
using severity_level = boost::log::trivial::severity_level;

// Initialize logging system: installs a synchronous text file sink
void init_logging(const std::string& log_file = "cloudsync.log",
                  severity_level min_level = severity_level::info);

// Changes the minimum severity that reaches the sinks
void set_log_level(severity_level level);

// Toggles the logging core without touching the installed sinks
void enable_logging();
void disable_logging();

} // namespace cloudsync::logging

#endif // CLOUDSYNC_LOGGER_HPP
