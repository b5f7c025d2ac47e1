#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace sysflow {
namespace util {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralized diagnostics
 *
 * Writes to std::cerr by default so that command output on stdout
 * stays machine readable.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Helpers
    static std::string levelToString(LogLevel level);

    /**
     * Parse "debug", "info", "warn"/"warning", "error" (case-insensitive)
     * Throws std::invalid_argument for anything else
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    LogLevel m_level = LogLevel::INFO;
    std::ostream* m_output = &std::cerr;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
};

// Convenience macros
#define LOG_DEBUG(msg) sysflow::util::Logger::instance().debug(msg)
#define LOG_INFO(msg) sysflow::util::Logger::instance().info(msg)
#define LOG_WARN(msg) sysflow::util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) sysflow::util::Logger::instance().error(msg)

} // namespace util
} // namespace sysflow
