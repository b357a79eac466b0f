#ifndef HFPULL_PATH_MANAGER_HPP
#define HFPULL_PATH_MANAGER_HPP

#include <string>
#include <filesystem>

namespace hfpull {

class PathManager {
public:
    static PathManager& instance();

    // Initializes paths based on optional root override.
    // If rootOverride is empty, it checks HFPULL_PATH env, then XDG defaults.
    void init(const std::string& rootOverride = "");

    std::filesystem::path root() const { return rootDir_; }
    std::filesystem::path logs() const { return logsDir_; }
    std::filesystem::path configFile() const { return rootDir_ / "config.json"; }

    // Returns the path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

    // ~/Downloads, or the working directory when HOME is unset
    std::filesystem::path defaultSaveDir() const;

private:
    PathManager() = default;

    std::filesystem::path rootDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path currentLogPath_;

    std::filesystem::path resolveRoot(const std::string& override);
};

} // namespace hfpull

#endif // HFPULL_PATH_MANAGER_HPP
