#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "stasis/log/log_config.hpp"

namespace stasis::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

    // Whether sessions log each handler dispatch
    static bool dispatch_trace() { return config_.dispatch_trace; }

private:
    static LogConfig config_;
};

}  // namespace stasis::log

#define STASIS_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define STASIS_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define STASIS_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define STASIS_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define STASIS_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define STASIS_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
