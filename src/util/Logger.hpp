#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <unordered_map>

namespace issues {
namespace util {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - process-wide log sink
 *
 * Writes to stderr by default so that tool responses on stdout stay clean.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void setLogRequests(bool enabled) { m_logRequests = enabled; }
    void setLogResponses(bool enabled) { m_logResponses = enabled; }

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Tool request/response logging with request ID correlation
    uint64_t logRequest(const std::string& operation, const std::string& params = "");
    void logResponse(uint64_t requestId, bool success, const std::string& body = "");

    // Helpers
    static std::string levelToString(LogLevel level);

    /**
     * Parse "debug", "info", "warn" or "error" (case-sensitive)
     * Throws std::invalid_argument on anything else
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();
    std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cerr;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    bool m_logRequests = true;
    bool m_logResponses = true;

    // Request ID generation and timing
    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) issues::util::Logger::instance().debug(msg)
#define LOG_INFO(msg) issues::util::Logger::instance().info(msg)
#define LOG_WARN(msg) issues::util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) issues::util::Logger::instance().error(msg)

} // namespace util
} // namespace issues
