#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace proctor {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("debug", "INFO", ...). Unknown names map to INFO.
 */
LogLevel logLevelFromString(const std::string& name);

const char* logLevelName(LogLevel level);

/**
 * Process-wide thread-safe logger
 *
 * Console output goes to stderr so that stdout stays free for reports. Lines
 * carry the current session tag when one is set:
 * @code
 * [2025-03-01 10:15:02.118] [INFO] [exam-42] message (SessionAnalyzer.cpp:88)
 * @endcode
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level);

    bool isEnabled(LogLevel level) const;

    void setConsoleOutput(bool enable);

    /**
     * Tag prepended to every line; empty removes it
     */
    void setSessionTag(const std::string& tag);

    /**
     * Open a timestamped log file (log_proctor_<date>_<time>.txt) in a directory
     *
     * Missing parent directories are created.
     * @return false if the directory or the file cannot be created; console
     *         logging continues either way
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * Path of the open log file, empty when logging to console only
     */
    std::string getCurrentLogFile() const;

    void closeLogFile();

    void flush();

    void log(LogLevel level, const std::string& message,
             const char* file = nullptr, int line = 0);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatLine(LogLevel level, const std::string& message,
                           const char* file, int line) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string sessionTag_;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

#define PROCTOR_LOG_AT(level, msg) \
    proctor::core::Logger::getInstance().log(level, msg, __FILE__, __LINE__)

#define LOG_TRACE(msg) PROCTOR_LOG_AT(proctor::core::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) PROCTOR_LOG_AT(proctor::core::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) PROCTOR_LOG_AT(proctor::core::LogLevel::INFO, msg)
#define LOG_WARNING(msg) PROCTOR_LOG_AT(proctor::core::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) PROCTOR_LOG_AT(proctor::core::LogLevel::ERROR, msg)
#define LOG_CRITICAL(msg) PROCTOR_LOG_AT(proctor::core::LogLevel::CRITICAL, msg)

} // namespace core
} // namespace proctor
