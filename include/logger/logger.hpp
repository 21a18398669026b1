#ifndef FSTORE_LOGGER_HPP
#define FSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fstore::logging {

// Maps a config string (trace|debug|info|warning|error|fatal) to a Boost.Log
// severity. Throws std::invalid_argument on anything else.
boost::log::trivial::severity_level parse_severity(const std::string& level);

// Installs a synchronous text file sink and sets the minimum severity.
// Any sinks installed earlier are removed.
void init_logging(const std::string& log_file = "fstore.log",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Changes the severity filter without touching the sinks
void set_log_level(boost::log::trivial::severity_level min_level);

} // namespace fstore::logging

#endif // FSTORE_LOGGER_HPP
