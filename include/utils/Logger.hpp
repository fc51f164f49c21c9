#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace MotifColoc {
namespace Utils {

/**
 * @brief Singleton Logger class for consistent console/file output.
 *
 * Lines carry a timestamp, a thread tag and the level. The thread tag is the
 * name set with set_thread_name() (predictor workers, progress monitor) or,
 * inside an OpenMP region, the OpenMP thread number.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    void set_log_file(const std::string& filename);
    LogLevel get_log_level() const;

    /// Names the calling thread in subsequent log lines.
    static void set_thread_name(const std::string& name);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    std::ofstream log_file_;
    mutable std::mutex mutex_;

    static std::string level_to_string(LogLevel level);
    static std::string get_color_code(LogLevel level);
    static std::string reset_color_code();
    static std::string thread_tag();
};

/**
 * @brief RAII helper to log start and end of a pipeline stage.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace MotifColoc

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) MotifColoc::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) MotifColoc::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) MotifColoc::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) MotifColoc::Utils::Logger::error(msg, __FILE__, __LINE__)
