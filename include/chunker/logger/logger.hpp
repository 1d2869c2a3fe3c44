#ifndef CHUNKER_LOGGER_HPP
#define CHUNKER_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace chunker::logging {

using severity_level = boost::log::trivial::severity_level;

struct LogConfig {
    // Empty path disables the file sink
    std::string log_file;
    severity_level min_level = boost::log::trivial::warning;
    bool console = true;
};

// Replace all sinks with a console sink (stderr) and an optional file sink
void init_logging(const LogConfig& config = LogConfig{});

// Only records at or above this severity pass the core filter
void set_log_level(severity_level level);

// Case-insensitive boost::log::trivial::from_string that also accepts "warn".
// Throws std::invalid_argument for anything else.
severity_level parse_severity(const std::string& name);

} // namespace chunker::logging

#endif // CHUNKER_LOGGER_HPP
