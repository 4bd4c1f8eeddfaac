#pragma once

#include <string>
#include <iostream>

namespace PulseAnalyzer {
namespace Util {

/**
 * Leveled console logger.
 * Debug/Info/Warning go to stdout, Error/Fatal to stderr.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

class Logger {
public:
    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();

    // Redirect all output (tests). nullptr restores stdout/stderr.
    static void setOutput(std::ostream* out);

    // "debug", "info", "warn", ... or 0-4; unknown -> fallback
    static LogLevel parseLevel(const std::string& text, LogLevel fallback);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

private:
    static LogLevel s_logLevel;
    static std::ostream* s_output;

    static std::string levelToString(LogLevel level);
    static void log(LogLevel level, const std::string& message);
};

} // namespace Util
} // namespace PulseAnalyzer

// Convenience macros
#define LOG_DEBUG(msg) PulseAnalyzer::Util::Logger::debug(msg)
#define LOG_INFO(msg) PulseAnalyzer::Util::Logger::info(msg)
#define LOG_WARN(msg) PulseAnalyzer::Util::Logger::warning(msg)
#define LOG_ERROR(msg) PulseAnalyzer::Util::Logger::error(msg)
#define LOG_FATAL(msg) PulseAnalyzer::Util::Logger::fatal(msg)
