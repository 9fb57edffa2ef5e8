#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <optional>

namespace util {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralized logging for every module
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
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static std::string formatCount(size_t count, const std::string& noun);

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
#define LOG_DEBUG(msg) util::Logger::instance().debug(msg)
#define LOG_INFO(msg) util::Logger::instance().info(msg)
#define LOG_WARN(msg) util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) util::Logger::instance().error(msg)

} // namespace util
