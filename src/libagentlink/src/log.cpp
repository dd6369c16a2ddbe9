#include "agentlink/log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace agentlink {
namespace log {

namespace {
    std::atomic<LogLevel> min_level{LogLevel::Info};
    std::mutex write_mutex;

    const char* level_tag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR ";
            default:                return "";
        }
    }
}

void set_level(LogLevel level) {
    min_level = level;
}

LogLevel level() {
    return min_level;
}

LogLevel parse_level(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

void write(LogLevel level, const char* component, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lk(write_mutex);
    std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
    out << level_tag(level) << "[" << component << "] " << message << std::endl;
}

} // namespace log
} // namespace agentlink
