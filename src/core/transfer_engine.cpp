#include "hfpull/transfer_engine.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/formatting.hpp"
#include "hfpull/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <optional>
#include <unistd.h>

namespace hfpull {

namespace {

// Unbuffered destination file. Every write goes straight to the kernel so
// the on-disk size always matches the byte count we have accounted for.
class OutputFile {
public:
  OutputFile() = default;
  ~OutputFile() { close(); }

  OutputFile(const OutputFile &) = delete;
  OutputFile &operator=(const OutputFile &) = delete;

  bool open(const std::filesystem::path &path, bool append) {
    close();
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (append ? O_APPEND : O_TRUNC);
    fd_ = ::open(path.c_str(), flags, 0644);
    return fd_ >= 0;
  }

  bool write(const char *data, size_t size) {
    while (size > 0) {
      ssize_t n = ::write(fd_, data, size);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        return false;
      }
      data += n;
      size -= static_cast<size_t>(n);
    }
    return true;
  }

  bool sync() { return fd_ < 0 || ::fsync(fd_) == 0; }

  // Flushes to stable storage and closes. Returns false if either failed.
  bool close() {
    if (fd_ < 0)
      return true;
    bool ok = ::fsync(fd_) == 0;
    ok = (::close(fd_) == 0) && ok;
    fd_ = -1;
    return ok;
  }

private:
  int fd_ = -1;
};

struct Attempt {
  bool accepted = false;
  bool rangeRejected = false;
  long rejectedStatus = 0;
  long httpError = 0;
  bool cancelled = false;
  std::string fsError;
  std::exception_ptr callbackError;
};

std::string errnoText() { return std::strerror(errno); }

} // namespace

std::string toString(TransferOutcome outcome) {
  switch (outcome) {
  case TransferOutcome::Completed:
    return "completed";
  case TransferOutcome::AlreadyComplete:
    return "already complete";
  case TransferOutcome::Cancelled:
    return "cancelled";
  default:
    return "unknown";
  }
}

TransferEngine::TransferEngine(HttpClient &client, TransferOptions options)
    : client_(client), options_(options) {
  if (options_.chunkSize == 0)
    options_.chunkSize = 8192;
}

std::uint64_t TransferEngine::probeSize(const std::string &url) {
  try {
    HttpResponse response = client_.head(url, options_.probeTimeoutSeconds);
    if (response.status == 200 && response.contentLength)
      return *response.contentLength;
    LOG_DEBUG("Size probe for " + url + " returned HTTP " +
              std::to_string(response.status));
  } catch (const TransportError &e) {
    LOG_WARN("Size probe failed for " + url + ": " + e.what());
  }
  return 0;
}

TransferOutcome TransferEngine::download(const std::string &url,
                                         const std::filesystem::path &destination,
                                         std::shared_ptr<TransferState> state,
                                         ProgressCallback onProgress,
                                         StatusCallback onStatus) {
  using Clock = std::chrono::steady_clock;

  if (!state)
    state = std::make_shared<TransferState>();

  auto report = [&](const std::string &message) {
    LOG_INFO(message);
    if (onStatus)
      onStatus(message);
  };
  auto failure = [&](TransferErrorKind kind, const std::string &message,
                     long httpStatus = 0) {
    state->setPhase(TransferPhase::FAILED);
    LOG_ERROR(message + " [" + url + "]");
    if (onStatus)
      onStatus(message);
    return TransferError(kind, message, httpStatus);
  };

  LOG_INFO("Transfer " + url + " -> " + destination.string());
  state->setPhase(TransferPhase::REQUESTING);

  std::error_code ec;
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec)
      throw failure(TransferErrorKind::Filesystem,
                    "Cannot create directory " +
                        destination.parent_path().string() + ": " +
                        ec.message());
  }

  std::uint64_t downloaded = 0;
  if (std::filesystem::exists(destination, ec)) {
    downloaded = std::filesystem::file_size(destination, ec);
    if (ec)
      throw failure(TransferErrorKind::Filesystem,
                    "Cannot inspect " + destination.string() + ": " +
                        ec.message());
  }

  if (state->cancelRequested()) {
    state->setPhase(TransferPhase::CANCELLED);
    report("Download cancelled");
    return TransferOutcome::Cancelled;
  }

  const std::uint64_t total = probeSize(url);
  state->setTotalBytes(total);
  state->setDownloadedBytes(downloaded);
  if (total == 0)
    report("Unable to determine file size, downloading without a total");

  if (downloaded > 0 && total > 0 && downloaded == total) {
    report("File already complete, nothing to download");
    if (onProgress)
      onProgress(total, total, 0.0, 100.0);
    state->setPhase(TransferPhase::COMPLETED);
    return TransferOutcome::AlreadyComplete;
  }

  if (downloaded > 0)
    report("Resuming from " + formatSize(static_cast<double>(downloaded)));

  OutputFile file;
  Clock::time_point lastSample = Clock::now();
  std::uint64_t lastSampleBytes = downloaded;

  auto runAttempt = [&](std::optional<std::uint64_t> rangeStart,
                        Attempt &attempt) {
    auto onResponse = [&](long status) {
      try {
        if (rangeStart && status != 206) {
          attempt.rangeRejected = true;
          attempt.rejectedStatus = status;
          return false;
        }
        if (status != 200 && status != 206) {
          attempt.httpError = status;
          return false;
        }
        if (!file.open(destination, rangeStart.has_value())) {
          attempt.fsError =
              "Cannot open " + destination.string() + ": " + errnoText();
          return false;
        }
        attempt.accepted = true;
        state->setPhase(TransferPhase::STREAMING);
        lastSample = Clock::now();
        lastSampleBytes = downloaded;
        return true;
      } catch (...) {
        attempt.callbackError = std::current_exception();
        return false;
      }
    };

    auto onData = [&](const char *data, size_t size) {
      try {
        size_t offset = 0;
        while (offset < size) {
          if (state->pauseRequested() && !file.sync()) {
            attempt.fsError =
                "Failed to flush " + destination.string() + ": " + errnoText();
            return false;
          }
          if (!state->waitWhilePaused(options_.pausePollInterval)) {
            attempt.cancelled = true;
            return false;
          }

          size_t n = std::min(options_.chunkSize, size - offset);
          if (!file.write(data + offset, n)) {
            attempt.fsError =
                "Write to " + destination.string() + " failed: " + errnoText();
            return false;
          }
          offset += n;
          downloaded += n;
          state->setDownloadedBytes(downloaded);

          Clock::time_point now = Clock::now();
          auto elapsed = now - lastSample;
          if (elapsed >= options_.progressInterval) {
            if (!file.sync()) {
              attempt.fsError = "Failed to flush " + destination.string() +
                                ": " + errnoText();
              return false;
            }
            double seconds = std::chrono::duration<double>(elapsed).count();
            double speed =
                seconds > 0 ? static_cast<double>(downloaded - lastSampleBytes) /
                                  seconds
                            : 0.0;
            double percentage =
                total > 0 ? static_cast<double>(downloaded) * 100.0 /
                                static_cast<double>(total)
                          : 0.0;
            if (onProgress)
              onProgress(downloaded, total, speed, percentage);
            lastSample = now;
            lastSampleBytes = downloaded;
          }
        }
        return true;
      } catch (...) {
        attempt.callbackError = std::current_exception();
        return false;
      }
    };

    StreamResult result =
        client_.stream(url, rangeStart, onResponse, onData);
    if (attempt.callbackError)
      std::rethrow_exception(attempt.callbackError);
    return result;
  };

  Attempt attempt;
  StreamResult result;
  try {
    std::optional<std::uint64_t> rangeStart;
    if (downloaded > 0)
      rangeStart = downloaded;
    result = runAttempt(rangeStart, attempt);

    if (attempt.rangeRejected) {
      report("Server does not support resume (HTTP " +
             std::to_string(attempt.rejectedStatus) +
             "), restarting from the beginning");
      downloaded = 0;
      state->setDownloadedBytes(0);
      attempt = Attempt{};
      result = runAttempt(std::nullopt, attempt);
    }
  } catch (const TransportError &e) {
    if (!file.close())
      LOG_WARN("Failed to flush " + destination.string() + ": " + errnoText());
    throw failure(TransferErrorKind::Transport,
                  std::string("Download error: ") + e.what());
  }

  if (!file.close())
    throw failure(TransferErrorKind::Filesystem,
                  "Failed to flush " + destination.string() + ": " +
                      errnoText());

  if (attempt.cancelled) {
    state->setPhase(TransferPhase::CANCELLED);
    report("Download cancelled");
    return TransferOutcome::Cancelled;
  }
  if (!attempt.fsError.empty())
    throw failure(TransferErrorKind::Filesystem, attempt.fsError);
  if (attempt.httpError != 0)
    throw failure(TransferErrorKind::HttpStatus,
                  "Download failed: HTTP " + std::to_string(attempt.httpError),
                  attempt.httpError);
  if (!attempt.accepted)
    throw failure(TransferErrorKind::HttpStatus,
                  "Download failed: HTTP " + std::to_string(result.status),
                  result.status);

  if (onProgress)
    onProgress(downloaded, total, 0.0, 100.0);
  state->setPhase(TransferPhase::COMPLETED);
  report("Download complete: " + destination.filename().string() + " (" +
         formatSize(static_cast<double>(downloaded)) + ")");
  return TransferOutcome::Completed;
}

} // namespace hfpull
