#ifndef HFPULL_TRANSFER_ENGINE_HPP
#define HFPULL_TRANSFER_ENGINE_HPP

#include "hfpull/http.hpp"
#include "hfpull/transfer_state.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace hfpull {

enum class TransferOutcome { Completed, AlreadyComplete, Cancelled };

std::string toString(TransferOutcome outcome);

struct TransferOptions {
  size_t chunkSize = 8192;
  std::chrono::milliseconds progressInterval{500};
  std::chrono::milliseconds pausePollInterval{100};
  long probeTimeoutSeconds = 10;
};

// Resumable single-file download on top of an HttpClient.
//
// The size of the destination file is the resume point: an interrupted,
// cancelled or failed transfer leaves it in place and the next call picks
// up from there with a range request. The file is fsync'd at every progress
// sample, before waiting out a pause, and when the transfer stops, so the
// bytes reported to observers are on disk.
class TransferEngine {
public:
  using ProgressCallback =
      std::function<void(std::uint64_t downloaded, std::uint64_t total,
                         double speed, double percentage)>;
  using StatusCallback = std::function<void(const std::string &message)>;

  explicit TransferEngine(HttpClient &client, TransferOptions options = {});

  // Throws TransferError after reporting the reason through onStatus.
  TransferOutcome download(const std::string &url,
                           const std::filesystem::path &destination,
                           std::shared_ptr<TransferState> state,
                           ProgressCallback onProgress = nullptr,
                           StatusCallback onStatus = nullptr);

  // Remote size from a metadata request, 0 when unknown.
  std::uint64_t probeSize(const std::string &url);

  const TransferOptions &options() const { return options_; }

private:
  HttpClient &client_;
  TransferOptions options_;
};

} // namespace hfpull

#endif // HFPULL_TRANSFER_ENGINE_HPP
