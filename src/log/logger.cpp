#include "stasis/log/logger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <filesystem>
#include <iostream>

namespace logging = boost::log;
namespace sinks = boost::log::sinks;

namespace stasis::log {

LogConfig Logger::config_;

namespace {

logging::trivial::severity_level to_boost_level(LogConfig::LogLevel level) {
    switch (level) {
        case LogConfig::LogLevel::TRACE:
            return logging::trivial::trace;
        case LogConfig::LogLevel::DEBUG:
            return logging::trivial::debug;
        case LogConfig::LogLevel::INFO:
            return logging::trivial::info;
        case LogConfig::LogLevel::WARN:
            return logging::trivial::warning;
        case LogConfig::LogLevel::ERROR:
            return logging::trivial::error;
        case LogConfig::LogLevel::FATAL:
            return logging::trivial::fatal;
        default:
            return logging::trivial::info;
    }
}

void apply_level(LogConfig::LogLevel level) {
    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>(
            "Severity") >= to_boost_level(level));
}

// Rotates by size and daily, keeps at most max_files
void add_file_sink(const LogConfig::FileConfig& file) {
    const std::filesystem::path log_path(file.log_file);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
    }

    logging::add_file_log(
        logging::keywords::file_name = file.log_file,
        logging::keywords::rotation_size = file.max_file_size,
        logging::keywords::time_based_rotation =
            sinks::file::rotation_at_time_point(0, 0, 0),
        logging::keywords::max_files = file.max_files,
        logging::keywords::auto_flush = true,
        logging::keywords::format = logging::parse_formatter(file.pattern));
}

}  // namespace

void Logger::init(const LogConfig& config) {
    config.validate();
    config_ = config;

    if (config.file.enabled) {
        add_file_sink(config.file);
    }
    if (config.console.enabled) {
        logging::add_console_log(
            std::clog, logging::keywords::format =
                           logging::parse_formatter(config.console.pattern));
    }

    logging::add_common_attributes();
    apply_level(config.global_level);

    STASIS_LOG_INFO << "Logger initialized, level "
                    << LogConfig::level_to_string(config.global_level)
                    << (config.dispatch_trace ? ", dispatch tracing on" : "");
}

void Logger::shutdown() {
    STASIS_LOG_INFO << "Logger shutting down";
    logging::core::get()->flush();
    logging::core::get()->remove_all_sinks();
}

LogConfig::LogLevel Logger::level_from_string(const std::string& level_str) {
    return LogConfig::level_from_string(level_str);
}

void Logger::set_level(LogConfig::LogLevel level) {
    config_.global_level = level;
    apply_level(level);
    STASIS_LOG_INFO << "Log level set to: "
                    << LogConfig::level_to_string(level);
}

}  // namespace stasis::log
