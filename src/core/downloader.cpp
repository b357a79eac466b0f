#include "hfpull/downloader.hpp"
#include "hfpull/logger.hpp"
#include "hfpull/path_manager.hpp"
#include <mutex>

namespace hfpull {

namespace {

NetworkConfig networkSnapshot() {
  auto &cfg = Config::instance();
  std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
  return cfg.getNetwork();
}

TransferConfig transferSnapshot() {
  auto &cfg = Config::instance();
  std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
  return cfg.getTransfer();
}

} // namespace

Downloader::Downloader()
    : ownedClient_(std::make_unique<CurlHttpClient>(
          httpOptionsFrom(networkSnapshot(), transferSnapshot()))),
      client_(*ownedClient_) {
  wire(networkSnapshot(), transferSnapshot());
}

Downloader::Downloader(HttpClient &client, const NetworkConfig &network,
                       const TransferConfig &transfer)
    : client_(client) {
  wire(network, transfer);
}

void Downloader::wire(const NetworkConfig &network,
                      const TransferConfig &transfer) {
  classifier_ = UrlClassifier(network.endpoint, network.mirrors);
  lister_ = std::make_unique<RepositoryLister>(client_, classifier_.endpoint());
  engine_ = std::make_unique<TransferEngine>(
      client_, transferOptionsFrom(network, transfer));
  LOG_DEBUG("Downloader ready, endpoint " + classifier_.endpoint());
}

HttpOptions Downloader::httpOptionsFrom(const NetworkConfig &network,
                                        const TransferConfig &transfer) {
  HttpOptions options;
  options.userAgent = network.userAgent;
  options.connectTimeoutSeconds = network.connectTimeout;
  options.requestTimeoutSeconds = network.readTimeout;
  options.readTimeoutSeconds = network.readTimeout;
  options.bufferSize = static_cast<long>(transfer.chunkSize);
  return options;
}

TransferOptions Downloader::transferOptionsFrom(const NetworkConfig &network,
                                                const TransferConfig &transfer) {
  TransferOptions options;
  options.chunkSize = transfer.chunkSize;
  options.progressInterval =
      std::chrono::milliseconds(transfer.progressIntervalMs);
  options.pausePollInterval = std::chrono::milliseconds(transfer.pausePollMs);
  options.probeTimeoutSeconds = network.probeTimeout;
  return options;
}

ClassifiedTarget Downloader::classify(const std::string &address) const {
  return classifier_.classify(address);
}

std::vector<RemoteFileEntry>
Downloader::listFiles(const RepositoryReference &ref) {
  return lister_->listFiles(ref);
}

TransferOutcome Downloader::downloadFile(
    const DownloadTarget &target, const std::filesystem::path &saveDir,
    const std::string &filenameOverride, std::shared_ptr<TransferState> state,
    TransferEngine::ProgressCallback onProgress,
    TransferEngine::StatusCallback onStatus) {
  std::string filename =
      filenameOverride.empty() ? target.filename : filenameOverride;
  if (filename.empty())
    filename = DEFAULT_FILENAME;
  auto destination = containedPath(saveDir, filename);
  return engine_->download(target.url, destination, std::move(state),
                           std::move(onProgress), std::move(onStatus));
}

std::unique_ptr<BatchOrchestrator>
Downloader::makeBatch(const std::filesystem::path &saveDir) {
  return std::make_unique<BatchOrchestrator>(*engine_, saveDir);
}

std::filesystem::path Downloader::resolveSaveDir(const std::string &requested) {
  if (!requested.empty())
    return std::filesystem::absolute(requested);

  std::string configured;
  {
    auto &cfg = Config::instance();
    std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
    configured = cfg.getGeneral().saveDir;
  }
  if (!configured.empty())
    return std::filesystem::absolute(configured);

  return PathManager::instance().defaultSaveDir();
}

} // namespace hfpull
