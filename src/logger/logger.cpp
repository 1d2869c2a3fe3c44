#include "chunker/logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace chunker::logging {

severity_level parse_severity(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "warn") {
        lowered = "warning";
    }

    severity_level level = boost::log::trivial::info;
    if (!boost::log::trivial::from_string(lowered.c_str(), lowered.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

void set_log_level(severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void init_logging(const LogConfig& config) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    try {
        // Clear any existing sinks so repeated initialisation does not duplicate output
        logging::core::get()->remove_all_sinks();
        logging::add_common_attributes();

        auto format = expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "] "
            << expr::smessage;

        if (config.console) {
            logging::add_console_log(
                std::clog,
                keywords::format = format,
                keywords::auto_flush = true
            );
        }

        if (!config.log_file.empty()) {
            std::filesystem::path log_path = std::filesystem::absolute(config.log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            logging::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::open_mode = std::ios_base::out | std::ios_base::app,
                keywords::format = format,
                keywords::auto_flush = true
            );
        }

        set_log_level(config.min_level);
        logging::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace chunker::logging
