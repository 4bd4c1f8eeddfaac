#include "util/logging.h"
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace PulseAnalyzer {
namespace Util {

LogLevel Logger::s_logLevel = LogLevel::Info;
std::ostream* Logger::s_output = nullptr;

namespace {
// Capture thread and processing thread both log
std::mutex g_logMutex;
}

void Logger::setLogLevel(LogLevel level) {
    s_logLevel = level;
}

LogLevel Logger::getLogLevel() {
    return s_logLevel;
}

void Logger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    s_output = out;
}

LogLevel Logger::parseLevel(const std::string& text, LogLevel fallback) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (t == "debug" || t == "0") return LogLevel::Debug;
    if (t == "info" || t == "1") return LogLevel::Info;
    if (t == "warn" || t == "warning" || t == "2") return LogLevel::Warning;
    if (t == "error" || t == "3") return LogLevel::Error;
    if (t == "fatal" || t == "4") return LogLevel::Fatal;
    return fallback;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::Error, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::Fatal, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
        default:                return "UNKN ";
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < s_logLevel) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << "[" << std::put_time(std::localtime(&time), "%H:%M:%S") << "] "
       << levelToString(level) << ": " << message;

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (s_output) {
        *s_output << ss.str() << std::endl;
    } else if (level >= LogLevel::Error) {
        std::cerr << ss.str() << std::endl;
    } else {
        std::cout << ss.str() << std::endl;
    }
}

} // namespace Util
} // namespace PulseAnalyzer
