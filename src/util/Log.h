/**
 * SMiner - Logging Utility
 */

#pragma once

#include <string>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <functional>

namespace sminer {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Replacement output for log lines (tests, frontends)
 */
using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * Parse a level name ("debug", "info", "warning", "error")
 *
 * @return false if the name is unknown (level untouched)
 */
inline bool parseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "debug") { level = LogLevel::Debug; return true; }
    if (name == "info") { level = LogLevel::Info; return true; }
    if (name == "warning" || name == "warn") { level = LogLevel::Warning; return true; }
    if (name == "error") { level = LogLevel::Error; return true; }
    return false;
}

/**
 * Simple logging class
 */
class Log {
public:
    /**
     * Set minimum log level
     */
    static void setLevel(LogLevel level) {
        s_level = level;
    }

    /**
     * Get current log level
     */
    static LogLevel getLevel() {
        return s_level;
    }

    /**
     * Enable/disable timestamps
     */
    static void setShowTimestamp(bool show) {
        s_showTimestamp = show;
    }

    /**
     * Route all log lines to a custom sink instead of the console
     */
    static void setSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(s_mutex);
        s_sink = std::move(sink);
    }

    /**
     * Restore console output
     */
    static void resetSink() {
        std::lock_guard<std::mutex> lock(s_mutex);
        s_sink = nullptr;
    }

    static void debug(const std::string& msg) {
        log(LogLevel::Debug, msg);
    }

    static void info(const std::string& msg) {
        log(LogLevel::Info, msg);
    }

    static void warning(const std::string& msg) {
        log(LogLevel::Warning, msg);
    }

    static void error(const std::string& msg) {
        log(LogLevel::Error, msg);
    }

    /**
     * Log a message at specified level
     */
    static void log(LogLevel level, const std::string& msg) {
        if (level < s_level) {
            return;
        }

        std::lock_guard<std::mutex> lock(s_mutex);

        if (s_sink) {
            s_sink(level, msg);
            return;
        }

        std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;

        if (s_showTimestamp) {
            out << getTimestamp() << " ";
        }

        out << getLevelPrefix(level) << " " << msg << std::endl;
    }

private:
    static std::string getTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, "%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* getLevelPrefix(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "[D]";
            case LogLevel::Info:    return "[I]";
            case LogLevel::Warning: return "[W]";
            case LogLevel::Error:   return "[E]";
            default:                return "[?]";
        }
    }

    static inline LogLevel s_level = LogLevel::Info;
    static inline bool s_showTimestamp = true;
    static inline LogSink s_sink;
    static inline std::mutex s_mutex;
};

}  // namespace sminer
