#include "hfpull/batch_orchestrator.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/formatting.hpp"
#include "hfpull/logger.hpp"
#include <stdexcept>
#include <utility>

namespace hfpull {

std::string toString(BatchOutcome outcome) {
  switch (outcome) {
  case BatchOutcome::Pending:
    return "pending";
  case BatchOutcome::Completed:
    return "completed";
  case BatchOutcome::Cancelled:
    return "cancelled";
  case BatchOutcome::Failed:
    return "failed";
  default:
    return "unknown";
  }
}

BatchOrchestrator::BatchOrchestrator(TransferEngine &engine,
                                     std::filesystem::path saveDir)
    : engine_(engine), saveDir_(std::move(saveDir)) {}

void BatchOrchestrator::setCallbacks(BatchCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void BatchOrchestrator::selectAndQueue(
    const std::vector<RemoteFileEntry> &entries,
    const std::vector<size_t> &selectedIndices) {
  std::vector<RemoteFileEntry> queue;
  queue.reserve(selectedIndices.size());
  for (size_t index : selectedIndices) {
    if (index >= entries.size())
      throw std::out_of_range("Selected index " + std::to_string(index) +
                              " is out of range (listing has " +
                              std::to_string(entries.size()) + " entries)");
    queue.push_back(entries[index]);
  }

  queue_ = std::move(queue);
  restart();

  std::uint64_t bytes = 0;
  for (const auto &e : queue_)
    bytes += e.sizeBytes;
  LOG_INFO("Queued " + std::to_string(queue_.size()) + " files (" +
           formatSize(static_cast<double>(bytes)) + ") into " +
           saveDir_.string());
}

void BatchOrchestrator::restart() {
  std::lock_guard<std::mutex> lock(mutex_);
  currentIndex_ = 0;
  outcome_ = BatchOutcome::Pending;
  cancelRequested_ = false;
  pauseRequested_ = false;
  lastError_.clear();
  current_.reset();
}

std::filesystem::path containedPath(const std::filesystem::path &saveDir,
                                    const std::string &relative) {
  std::filesystem::path rel =
      std::filesystem::path(relative).lexically_normal();
  if (rel.empty() || rel == "." || rel.has_root_path() ||
      *rel.begin() == "..") {
    throw TransferError(TransferErrorKind::Filesystem,
                        "Refusing to write outside of " + saveDir.string() +
                            ": " + relative);
  }
  return saveDir / rel;
}

std::filesystem::path
BatchOrchestrator::destinationFor(const RemoteFileEntry &entry) const {
  return containedPath(saveDir_, entry.relativePath);
}

std::string BatchOrchestrator::lastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lastError_;
}

std::shared_ptr<TransferState> BatchOrchestrator::currentTransfer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

bool BatchOrchestrator::advance() {
  if (outcome_ != BatchOutcome::Pending || currentIndex_ >= queue_.size())
    return false;

  if (cancelRequested_) {
    status("Batch download cancelled");
    finish(BatchOutcome::Cancelled);
    return false;
  }

  const size_t index = currentIndex_;
  const RemoteFileEntry &entry = queue_[index];
  if (callbacks_.onFileStarted)
    callbacks_.onFileStarted(index, queue_.size(), entry);
  status("[" + std::to_string(index + 1) + "/" +
         std::to_string(queue_.size()) + "] " + entry.relativePath);

  auto state = std::make_shared<TransferState>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pauseRequested_)
      state->requestPause();
    if (cancelRequested_)
      state->requestCancel();
    current_ = state;
  }

  TransferOutcome result;
  try {
    result = engine_.download(entry.downloadUrl, destinationFor(entry), state,
                              callbacks_.onProgress, callbacks_.onStatus);
  } catch (const TransferError &e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      current_.reset();
      lastError_ = entry.relativePath + ": " + e.what();
    }
    status("Batch halted at " + entry.relativePath + ": " + e.what());
    finish(BatchOutcome::Failed);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
  }

  if (result == TransferOutcome::Cancelled) {
    if (cancelRequested_) {
      ++currentIndex_;
      status("Batch download cancelled");
      finish(BatchOutcome::Cancelled);
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lastError_ = entry.relativePath + ": transfer cancelled";
    }
    status("Batch halted: " + entry.relativePath + " was cancelled");
    finish(BatchOutcome::Failed);
    return false;
  }

  ++currentIndex_;
  if (currentIndex_ >= queue_.size()) {
    status("All files downloaded");
    finish(BatchOutcome::Completed);
    return false;
  }
  return true;
}

BatchOutcome BatchOrchestrator::run() {
  if (queue_.empty() && outcome_ == BatchOutcome::Pending) {
    status("Nothing to download");
    finish(BatchOutcome::Completed);
  }
  while (advance()) {
  }
  return outcome_;
}

void BatchOrchestrator::requestPause() {
  std::lock_guard<std::mutex> lock(mutex_);
  pauseRequested_ = true;
  if (current_)
    current_->requestPause();
}

void BatchOrchestrator::requestResume() {
  std::lock_guard<std::mutex> lock(mutex_);
  pauseRequested_ = false;
  if (current_)
    current_->requestResume();
}

void BatchOrchestrator::requestCancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelRequested_ = true;
  if (current_)
    current_->requestCancel();
}

void BatchOrchestrator::finish(BatchOutcome outcome) {
  outcome_ = outcome;
  LOG_INFO("Batch " + toString(outcome) + " after " +
           std::to_string(currentIndex_.load()) + "/" +
           std::to_string(queue_.size()) + " files");
  if (callbacks_.onFinished)
    callbacks_.onFinished(outcome);
}

void BatchOrchestrator::status(const std::string &message) {
  LOG_INFO(message);
  if (callbacks_.onStatus)
    callbacks_.onStatus(message);
}

} // namespace hfpull
