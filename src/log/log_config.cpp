#include "stasis/log/log_config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace stasis::log {

namespace {

using LevelName = std::pair<const char*, LogConfig::LogLevel>;

// First entry per level is the canonical name
constexpr std::array<LevelName, 8> LEVEL_NAMES = {{
    {"trace", LogConfig::LogLevel::TRACE},
    {"debug", LogConfig::LogLevel::DEBUG},
    {"info", LogConfig::LogLevel::INFO},
    {"warn", LogConfig::LogLevel::WARN},
    {"warning", LogConfig::LogLevel::WARN},
    {"error", LogConfig::LogLevel::ERROR},
    {"fatal", LogConfig::LogLevel::FATAL},
    {"critical", LogConfig::LogLevel::FATAL},
}};

}  // namespace

void LogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto level_str = get_optional_value<std::string>(pt, "global_level")) {
        global_level = level_from_string(*level_str);
    }
    dispatch_trace = get_value(pt, "dispatch_trace", dispatch_trace);

    if (auto console_pt = pt.get_child_optional("console")) {
        console.enabled = get_value(*console_pt, "enabled", console.enabled);
        console.pattern = get_value(*console_pt, "pattern", console.pattern);
    }

    if (auto file_pt = pt.get_child_optional("file")) {
        file.enabled = get_value(*file_pt, "enabled", file.enabled);
        file.log_file = get_value(*file_pt, "log_file", file.log_file);
        file.max_file_size =
            get_value(*file_pt, "max_file_size", file.max_file_size);
        file.max_files = get_value(*file_pt, "max_files", file.max_files);
        file.pattern = get_value(*file_pt, "pattern", file.pattern);
    }
}

void LogConfig::validate() const {
    if (console.enabled && console.pattern.empty()) {
        throw std::invalid_argument("Console log pattern cannot be empty");
    }

    if (!file.enabled) {
        return;
    }
    if (file.log_file.empty()) {
        throw std::invalid_argument(
            "Log file path cannot be empty when file logging is enabled");
    }
    if (file.max_file_size <= 0 || file.max_files <= 0) {
        throw std::invalid_argument(
            "Log file max_file_size and max_files must be greater than 0");
    }
}

LogConfig::LogLevel LogConfig::level_from_string(const std::string& level_str) {
    std::string name = level_str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = std::find_if(
        LEVEL_NAMES.begin(), LEVEL_NAMES.end(),
        [&name](const LevelName& entry) { return name == entry.first; });
    if (it == LEVEL_NAMES.end()) {
        throw std::invalid_argument("Invalid log level: " + level_str);
    }
    return it->second;
}

std::string LogConfig::level_to_string(LogLevel level) {
    auto it = std::find_if(
        LEVEL_NAMES.begin(), LEVEL_NAMES.end(),
        [level](const LevelName& entry) { return entry.second == level; });
    return it != LEVEL_NAMES.end() ? it->first : "unknown";
}

}  // namespace stasis::log
