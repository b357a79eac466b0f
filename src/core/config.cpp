#include "hfpull/config.hpp"
#include "hfpull/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

namespace hfpull {

using json = nlohmann::json;

namespace {

const char *nonEmptyEnv(const char *name) {
  const char *value = std::getenv(name);
  return (value && std::strlen(value) > 0) ? value : nullptr;
}

} // namespace

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::reset() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  general_ = GeneralConfig{};
  network_ = NetworkConfig{};
  transfer_ = TransferConfig{};
  envApplied_ = false;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;
  reset();

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    applyEnvironment();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;
    fromJson(j);

    LOG_INFO("Configuration loaded from " + path.string());
    save();
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
    reset();
  }

  applyEnvironment();
}

void Config::fromJson(const json &j) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (j.contains("general")) {
    auto &g = j["general"];
    general_.saveDir = g.value("save_dir", "");
    general_.logLevel = g.value("log_level", "info");
    general_.logRetention = g.value("log_retention", 10);
  }

  if (j.contains("network")) {
    auto &n = j["network"];
    network_.endpoint = n.value("endpoint", "https://hf-mirror.com");
    while (!network_.endpoint.empty() && network_.endpoint.back() == '/')
      network_.endpoint.pop_back();
    if (n.contains("mirrors") && n["mirrors"].is_array()) {
      network_.mirrors.clear();
      for (const auto &m : n["mirrors"]) {
        if (m.is_string())
          network_.mirrors.push_back(m.get<std::string>());
      }
    }
    network_.userAgent = n.value("user_agent", NetworkConfig{}.userAgent);
    network_.probeTimeout = n.value("probe_timeout", 10L);
    network_.connectTimeout = n.value("connect_timeout", 30L);
    network_.readTimeout = n.value("read_timeout", 30L);
  }

  if (j.contains("transfer")) {
    auto &t = j["transfer"];
    transfer_.chunkSize = t.value("chunk_size", static_cast<size_t>(8192));
    if (transfer_.chunkSize == 0)
      transfer_.chunkSize = 8192;
    transfer_.progressIntervalMs = t.value("progress_interval_ms", 500);
    transfer_.pausePollMs = t.value("pause_poll_ms", 100);
  }

  fileEndpoint_ = network_.endpoint;
  fileSaveDir_ = general_.saveDir;
  envApplied_ = false;
}

json Config::toJson() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  json j;

  j["general"] = {{"save_dir", envApplied_ ? fileSaveDir_ : general_.saveDir},
                  {"log_level", general_.logLevel},
                  {"log_retention", general_.logRetention}};

  j["network"] = {
      {"endpoint", envApplied_ ? fileEndpoint_ : network_.endpoint},
      {"mirrors", network_.mirrors},
      {"user_agent", network_.userAgent},
      {"probe_timeout", network_.probeTimeout},
      {"connect_timeout", network_.connectTimeout},
      {"read_timeout", network_.readTimeout}};

  j["transfer"] = {{"chunk_size", transfer_.chunkSize},
                   {"progress_interval_ms", transfer_.progressIntervalMs},
                   {"pause_poll_ms", transfer_.pausePollMs}};
  return j;
}

void Config::applyEnvironment() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (!envApplied_) {
    fileEndpoint_ = network_.endpoint;
    fileSaveDir_ = general_.saveDir;
  }

  const char *endpoint = nonEmptyEnv("HFPULL_ENDPOINT");
  if (!endpoint)
    endpoint = nonEmptyEnv("HF_ENDPOINT");
  if (endpoint) {
    network_.endpoint = endpoint;
    while (!network_.endpoint.empty() && network_.endpoint.back() == '/')
      network_.endpoint.pop_back();
    LOG_INFO("Endpoint overridden by environment: " + network_.endpoint);
  }

  if (const char *saveDir = nonEmptyEnv("HFPULL_SAVE_DIR")) {
    general_.saveDir = saveDir;
    LOG_INFO("Save directory overridden by environment: " + general_.saveDir);
  }

  envApplied_ = true;
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Failed to create config directory: " + ec.message());
      return;
    }
  }

  std::ofstream file(configPath_);
  if (!file) {
    LOG_ERROR("Failed to write config file: " + configPath_.string());
    return;
  }
  file << toJson().dump(4);
  LOG_INFO("Configuration saved to " + configPath_.string());
}

} // namespace hfpull
