#include "proctor/core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace proctor {
namespace core {

namespace {

std::tm localTime(std::time_t t) {
    std::tm result{};
    localtime_r(&t, &result);
    return result;
}

std::string clockStamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

LogLevel logLevelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")    return LogLevel::TRACE;
    if (upper == "DEBUG")    return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR")    return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= minLevel_;
}

void Logger::setConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enable;
}

void Logger::setSessionTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionTag_ = tag;
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;

    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
    if (ec || !std::filesystem::is_directory(logDirectory)) {
        std::cerr << "[Logger] Cannot use log directory " << logDirectory
                  << (ec ? ": " + ec.message() : std::string()) << std::endl;
        return false;
    }

    const std::tm tm = localTime(std::time(nullptr));
    std::ostringstream name;
    name << "log_proctor_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S") << ".txt";
    const std::string path = (std::filesystem::path(logDirectory) / name.str()).string();

    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Cannot open log file " << path << std::endl;
        currentLogFile_.clear();
        return false;
    }
    currentLogFile_ = path;

    logFile_ << "# proctor analysis log, started " << clockStamp()
             << ", level " << logLevelName(level) << std::endl;
    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minLevel_) {
        return;
    }

    const std::string formatted = formatLine(level, message, file, line);
    if (consoleOutput_) {
        std::cerr << formatted << '\n';
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
        if (level >= LogLevel::ERROR) {
            logFile_.flush();
        }
    }
}

std::string Logger::formatLine(LogLevel level, const std::string& message,
                               const char* file, int line) const {
    std::ostringstream oss;
    oss << '[' << clockStamp() << "] [" << logLevelName(level) << "] ";
    if (!sessionTag_.empty()) {
        oss << '[' << sessionTag_ << "] ";
    }
    oss << message;

    if (file != nullptr && line > 0) {
        oss << " (" << std::filesystem::path(file).filename().string() << ':' << line << ')';
    }
    return oss.str();
}

} // namespace core
} // namespace proctor
