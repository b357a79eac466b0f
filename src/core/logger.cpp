#include "hfpull/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace hfpull {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::filesystem::path& logPath, bool verbose, size_t retention) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
    logPath_ = logPath;

    if (logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (!ec) {
            pruneOldLogs(logPath, retention);
        }
    }

    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << logPath << std::endl;
    } else {
        logFile_ << "\n=== hfpull session started: " << getTimestamp() << " ===\n";
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setFileLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    fileLevel_ = level;
}

void Logger::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
}

void Logger::applyRetention(size_t retention) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logPath_.has_parent_path()) {
        pruneOldLogs(logPath_, retention);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string timestamp = getTimestamp();
    std::string levelStr = getLevelString(level);
    std::string formattedMsg = "[" + timestamp + "] [" + levelStr + "] " + message;

    if (logFile_.is_open() && level >= fileLevel_) {
        logFile_ << formattedMsg << std::endl;
    }

    if (verbose_ || level == LogLevel::WARNING || level == LogLevel::ERROR) {
        if (level == LogLevel::ERROR) {
            std::cerr << formattedMsg << std::endl;
        } else {
            std::cout << formattedMsg << std::endl;
        }
    }
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

void Logger::pruneOldLogs(const std::filesystem::path& logPath, size_t retention) {
    // Session logs carry a sortable timestamp in their name, so lexical order
    // is chronological order.
    std::vector<std::filesystem::path> sessions;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(logPath.parent_path(), ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind("hfpull_", 0) == 0 &&
            entry.path().extension() == ".log" && entry.path() != logPath) {
            sessions.push_back(entry.path());
        }
    }
    if (retention == 0 || sessions.size() < retention) return;

    std::sort(sessions.begin(), sessions.end());
    // Keep retention - 1 old logs; the session about to start is the last one.
    size_t excess = sessions.size() - (retention - 1);
    for (size_t i = 0; i < excess; ++i) {
        std::filesystem::remove(sessions[i], ec);
    }
}

} // namespace hfpull
