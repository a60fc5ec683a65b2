#pragma once

#include <string>
#include <string_view>

namespace resilink::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
// Unknown names fall back to info.
LogLevel parseLogLevel(std::string_view name);
void log(LogLevel level, const std::string& message);

} // namespace resilink::util
