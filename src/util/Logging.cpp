#include "resilink/util/Logging.hpp"
#include "resilink/util/JsonResponse.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace resilink::util {
namespace {

std::atomic<LogLevel> level{LogLevel::info};

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

const char* label(LogLevel value) {
    switch (value) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

} // namespace

void initLogging(LogLevel value) {
    level.store(value);
}

LogLevel currentLogLevel() {
    return level.load();
}

LogLevel parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return LogLevel::info;
}

void log(LogLevel value, const std::string& message) {
    if (static_cast<int>(value) < static_cast<int>(level.load())) {
        return;
    }

    std::ostringstream line;
    line << formatIsoTimestamp(std::chrono::system_clock::now()) << " [" << label(value) << "] "
         << "[" << std::this_thread::get_id() << "] " << message << '\n';

    std::lock_guard lk(sinkMutex());
    auto& sink = value >= LogLevel::warn ? std::cerr : std::clog;
    sink << line.str();
}

} // namespace resilink::util
