#pragma once

#include <string>
#include <sstream>

namespace agentlink {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

namespace log {

void set_level(LogLevel level);
LogLevel level();

// Accepts DEBUG / INFO / WARNING / WARN / ERROR, case-insensitive. Unknown names map to Info.
LogLevel parse_level(const std::string& name);

// Writes "[component] message". Info and Debug go to stdout, the rest to stderr.
void write(LogLevel level, const char* component, const std::string& message);

inline void debug(const char* component, const std::string& message) { write(LogLevel::Debug, component, message); }
inline void info(const char* component, const std::string& message) { write(LogLevel::Info, component, message); }
inline void warn(const char* component, const std::string& message) { write(LogLevel::Warning, component, message); }
inline void error(const char* component, const std::string& message) { write(LogLevel::Error, component, message); }

} // namespace log

} // namespace agentlink
