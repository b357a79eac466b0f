#ifndef HFPULL_CONFIG_HPP
#define HFPULL_CONFIG_HPP

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hfpull {

struct GeneralConfig {
  std::string saveDir;             // empty = PathManager::defaultSaveDir()
  std::string logLevel = "info";
  int logRetention = 10;
};

struct NetworkConfig {
  std::string endpoint = "https://hf-mirror.com";
  // Hosts whose repository URLs are rewritten to endpoint
  std::vector<std::string> mirrors = {"huggingface.co", "hf-mirror.com"};
  std::string userAgent =
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
  long probeTimeout = 10;
  long connectTimeout = 30;
  long readTimeout = 30;
};

struct TransferConfig {
  size_t chunkSize = 8192;
  int progressIntervalMs = 500;
  int pausePollMs = 100;
};

class Config {
public:
  static Config &instance();

  void load(const std::filesystem::path &configPath);
  void save();

  // Applies HFPULL_ENDPOINT / HF_ENDPOINT and HFPULL_SAVE_DIR. Called by
  // load(); never persisted by save().
  void applyEnvironment();

  // Getters
  GeneralConfig &getGeneral() { return general_; }
  NetworkConfig &getNetwork() { return network_; }
  TransferConfig &getTransfer() { return transfer_; }
  std::recursive_mutex &getMutex() { return mutex_; }

  // Back to built-in defaults, path kept.
  void reset();

  nlohmann::json toJson() const;
  void fromJson(const nlohmann::json &j);

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  GeneralConfig general_;
  NetworkConfig network_;
  TransferConfig transfer_;

  // Values as they were before applyEnvironment(), used by save().
  std::string fileEndpoint_;
  std::string fileSaveDir_;
  bool envApplied_ = false;

  mutable std::recursive_mutex mutex_;
};

} // namespace hfpull

#endif // HFPULL_CONFIG_HPP
