#include "hfpull/path_manager.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace hfpull {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride) {
    rootDir_ = resolveRoot(rootOverride);
    logsDir_ = rootDir_ / "logs";

    std::filesystem::create_directories(rootDir_);
    std::filesystem::create_directories(logsDir_);

    // Generate path for current session log
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "hfpull_" << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S") << ".log";
    currentLogPath_ = logsDir_ / ss.str();
}

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("HFPULL_PATH");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    // Fallback to XDG / Home
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";

    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && strlen(xdgDataHome) > 0) {
        return std::filesystem::absolute(xdgDataHome) / "hfpull";
    }

    return std::filesystem::path(home) / ".local" / "share" / "hfpull";
}

std::filesystem::path PathManager::defaultSaveDir() const {
    const char* home = std::getenv("HOME");
    if (home && strlen(home) > 0) {
        return std::filesystem::path(home) / "Downloads";
    }
    return std::filesystem::current_path();
}

} // namespace hfpull
