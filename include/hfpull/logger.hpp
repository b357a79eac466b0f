#ifndef HFPULL_LOGGER_HPP
#define HFPULL_LOGGER_HPP

#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>
#include <chrono>
#include <iomanip>

namespace hfpull {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Parses "debug", "info", "warn"/"warning" and "error" (any case).
// Unknown names fall back to INFO.
LogLevel parseLogLevel(const std::string& name);

class Logger {
public:
    static Logger& instance();

    // Opens the session log and prunes older hfpull_*.log files in the same
    // directory so that at most `retention` sessions are kept.
    void init(const std::filesystem::path& logPath, bool verbose, size_t retention = 10);
    void log(LogLevel level, const std::string& message);

    void setFileLevel(LogLevel level);
    void setVerbose(bool verbose);

    // Re-runs pruning around the open session log with a new retention.
    void applyRetention(size_t retention);

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    std::filesystem::path logPath_;
    bool verbose_ = false;
    LogLevel fileLevel_ = LogLevel::DEBUG;
    std::mutex mutex_;

    std::string getTimestamp();
    std::string getLevelString(LogLevel level);
    void pruneOldLogs(const std::filesystem::path& logPath, size_t retention);
};

// Convenience macros
#define LOG_DEBUG(msg) hfpull::Logger::instance().log(hfpull::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) hfpull::Logger::instance().log(hfpull::LogLevel::INFO, msg)
#define LOG_WARN(msg) hfpull::Logger::instance().log(hfpull::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) hfpull::Logger::instance().log(hfpull::LogLevel::ERROR, msg)

} // namespace hfpull

#endif // HFPULL_LOGGER_HPP
