#ifndef HFPULL_BATCH_ORCHESTRATOR_HPP
#define HFPULL_BATCH_ORCHESTRATOR_HPP

#include "hfpull/repository_lister.hpp"
#include "hfpull/transfer_engine.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hfpull {

enum class BatchOutcome { Pending, Completed, Cancelled, Failed };

std::string toString(BatchOutcome outcome);

struct BatchCallbacks {
  // index is 0-based; the queue position shown to users is index + 1.
  std::function<void(size_t index, size_t total, const RemoteFileEntry &entry)>
      onFileStarted;
  TransferEngine::ProgressCallback onProgress;
  TransferEngine::StatusCallback onStatus;
  std::function<void(BatchOutcome outcome)> onFinished;
};

// saveDir / relative, lexically normalised. Throws TransferError(Filesystem)
// when relative is empty, absolute or climbs out of saveDir.
std::filesystem::path containedPath(const std::filesystem::path &saveDir,
                                    const std::string &relative);

// Downloads a selected subset of a listing one file at a time, mirroring the
// repository layout under saveDir. The queue stops at the first failure so
// currentIndex() always counts a contiguous prefix of attempted files.
class BatchOrchestrator {
public:
  BatchOrchestrator(TransferEngine &engine, std::filesystem::path saveDir);

  void setCallbacks(BatchCallbacks callbacks);

  // Queues entries[selectedIndices[0]], entries[selectedIndices[1]], ...
  // Throws std::out_of_range for an index past the end of entries.
  void selectAndQueue(const std::vector<RemoteFileEntry> &entries,
                      const std::vector<size_t> &selectedIndices);

  // Transfers the entry at currentIndex(). Returns true while further entries
  // remain to be attempted.
  bool advance();

  // advance() until the queue is finished or halted.
  BatchOutcome run();

  // Rewinds the cursor to the first entry and clears cancel/pause/outcome.
  void restart();

  void requestPause();
  void requestResume();
  // Stops the current file and the rest of the queue.
  void requestCancel();

  size_t currentIndex() const { return currentIndex_.load(); }
  size_t size() const { return queue_.size(); }
  const std::vector<RemoteFileEntry> &queue() const { return queue_; }
  BatchOutcome outcome() const { return outcome_.load(); }
  std::string lastError() const;
  bool isPaused() const { return pauseRequested_.load(); }

  // State of the file being transferred, null between files.
  std::shared_ptr<TransferState> currentTransfer() const;

  // containedPath(saveDir, entry.relativePath).
  std::filesystem::path destinationFor(const RemoteFileEntry &entry) const;

private:
  TransferEngine &engine_;
  std::filesystem::path saveDir_;
  BatchCallbacks callbacks_;

  std::vector<RemoteFileEntry> queue_;
  std::atomic<size_t> currentIndex_{0};
  std::atomic<BatchOutcome> outcome_{BatchOutcome::Pending};
  std::string lastError_;

  std::atomic<bool> cancelRequested_{false};
  std::atomic<bool> pauseRequested_{false};

  mutable std::mutex mutex_;
  std::shared_ptr<TransferState> current_;

  void finish(BatchOutcome outcome);
  void status(const std::string &message);
};

} // namespace hfpull

#endif // HFPULL_BATCH_ORCHESTRATOR_HPP
