#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace gridsync {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Process-wide logger.
 *
 * Writes to stdout and, once init() is given a path, appends to a log file.
 * Messages are expected to start with a bracketed component tag,
 * e.g. "[Preferences] Saved features.invites".
 */
class Logger {
public:
    static void init(LogLevel level, const std::string& log_file_path = "");
    static void set_level(LogLevel level);
    static LogLevel level();
    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

    // Default log file: $XDG_CACHE_HOME/gridsync/gridsync.log
    static std::string default_log_path();

private:
    static LogLevel current_level;
    static std::ofstream log_file;
    static std::mutex log_mutex;
};

} // namespace gridsync
