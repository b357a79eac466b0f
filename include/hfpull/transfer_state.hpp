#ifndef HFPULL_TRANSFER_STATE_HPP
#define HFPULL_TRANSFER_STATE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace hfpull {

enum class TransferPhase {
    IDLE,
    REQUESTING,
    STREAMING,
    PAUSED,
    COMPLETED,
    CANCELLED,
    FAILED
};

std::string toString(TransferPhase phase);

// Shared between the thread running a transfer and whoever controls it.
// Only the pause and cancel requests are meant to be written from outside;
// the byte counters and the phase are published by the transfer itself.
class TransferState {
public:
    TransferState() = default;
    TransferState(const TransferState&) = delete;
    TransferState& operator=(const TransferState&) = delete;

    void requestPause();
    void requestResume();
    void requestCancel();

    bool pauseRequested() const { return pauseRequested_.load(); }
    bool cancelRequested() const { return cancelRequested_.load(); }

    // Blocks while a pause is requested, waking at least every pollInterval.
    // Returns false if the transfer was cancelled meanwhile.
    bool waitWhilePaused(std::chrono::milliseconds pollInterval);

    void setPhase(TransferPhase phase) { phase_.store(phase); }
    TransferPhase phase() const { return phase_.load(); }

    void setDownloadedBytes(std::uint64_t bytes) { downloadedBytes_.store(bytes); }
    std::uint64_t downloadedBytes() const { return downloadedBytes_.load(); }

    void setTotalBytes(std::uint64_t bytes) { totalBytes_.store(bytes); }
    std::uint64_t totalBytes() const { return totalBytes_.load(); }

private:
    std::atomic<bool> pauseRequested_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<TransferPhase> phase_{TransferPhase::IDLE};
    std::atomic<std::uint64_t> downloadedBytes_{0};
    std::atomic<std::uint64_t> totalBytes_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace hfpull

#endif // HFPULL_TRANSFER_STATE_HPP
