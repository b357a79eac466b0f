#ifndef HFPULL_DOWNLOADER_HPP
#define HFPULL_DOWNLOADER_HPP

#include "hfpull/batch_orchestrator.hpp"
#include "hfpull/config.hpp"
#include "hfpull/http.hpp"
#include "hfpull/repository_lister.hpp"
#include "hfpull/transfer_engine.hpp"
#include "hfpull/url_classifier.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace hfpull {

// Wires the classifier, lister and transfer engine to one HTTP client built
// from the current Config.
class Downloader {
public:
  // Snapshot of Config::instance() taken at construction.
  Downloader();
  // Uses the given client instead of libcurl; the client must outlive this.
  Downloader(HttpClient &client, const NetworkConfig &network,
             const TransferConfig &transfer);

  ClassifiedTarget classify(const std::string &address) const;

  std::vector<RemoteFileEntry> listFiles(const RepositoryReference &ref);

  // Downloads a single target into saveDir / (filenameOverride or
  // target.filename). Throws TransferError(Filesystem) when that name would
  // land outside saveDir.
  TransferOutcome downloadFile(const DownloadTarget &target,
                               const std::filesystem::path &saveDir,
                               const std::string &filenameOverride,
                               std::shared_ptr<TransferState> state,
                               TransferEngine::ProgressCallback onProgress =
                                   nullptr,
                               TransferEngine::StatusCallback onStatus =
                                   nullptr);

  // New batch bound to this downloader's engine.
  std::unique_ptr<BatchOrchestrator>
  makeBatch(const std::filesystem::path &saveDir);

  TransferEngine &engine() { return *engine_; }
  const UrlClassifier &classifier() const { return classifier_; }
  const std::string &endpoint() const { return classifier_.endpoint(); }

  // Directory to save into: explicit choice, then general.save_dir, then
  // PathManager::defaultSaveDir().
  static std::filesystem::path resolveSaveDir(const std::string &requested);

private:
  std::unique_ptr<HttpClient> ownedClient_;
  HttpClient &client_;
  UrlClassifier classifier_;
  std::unique_ptr<RepositoryLister> lister_;
  std::unique_ptr<TransferEngine> engine_;

  void wire(const NetworkConfig &network, const TransferConfig &transfer);

  static HttpOptions httpOptionsFrom(const NetworkConfig &network,
                                     const TransferConfig &transfer);
  static TransferOptions transferOptionsFrom(const NetworkConfig &network,
                                             const TransferConfig &transfer);
};

} // namespace hfpull

#endif // HFPULL_DOWNLOADER_HPP
