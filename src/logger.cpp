#include "logger.hpp"
#include <glib.h>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace gridsync {

LogLevel Logger::current_level = LogLevel::INFO;
std::ofstream Logger::log_file;
std::mutex Logger::log_mutex;

void Logger::init(LogLevel level, const std::string& log_file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!log_file_path.empty()) {
        gchar* dir = g_path_get_dirname(log_file_path.c_str());
        g_mkdir_with_parents(dir, 0700);
        g_free(dir);
        log_file.open(log_file_path, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "Could not open log file " << log_file_path << std::endl;
        }
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

std::string Logger::default_log_path() {
    gchar* path = g_build_filename(g_get_user_cache_dir(), "gridsync", "gridsync.log", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_level) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    const char* level_str = "[INFO] ";
    switch (level) {
        case LogLevel::DEBUG: level_str = "[DEBUG]"; break;
        case LogLevel::INFO:  level_str = "[INFO] "; break;
        case LogLevel::WARN:  level_str = "[WARN] "; break;
        case LogLevel::ERROR: level_str = "[ERROR]"; break;
    }

    if (log_file.is_open()) {
        log_file << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
                 << " " << level_str << " " << message << std::endl;
    }

    std::cout << std::put_time(&local, "%H:%M:%S")
              << " " << level_str << " " << message << std::endl;
}

} // namespace gridsync
