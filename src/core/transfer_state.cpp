#include "hfpull/transfer_state.hpp"

namespace hfpull {

std::string toString(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::IDLE: return "Idle";
        case TransferPhase::REQUESTING: return "Requesting";
        case TransferPhase::STREAMING: return "Streaming";
        case TransferPhase::PAUSED: return "Paused";
        case TransferPhase::COMPLETED: return "Completed";
        case TransferPhase::CANCELLED: return "Cancelled";
        case TransferPhase::FAILED: return "Failed";
        default: return "Unknown";
    }
}

void TransferState::requestPause() {
    std::lock_guard<std::mutex> lock(mutex_);
    pauseRequested_.store(true);
}

void TransferState::requestResume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pauseRequested_.store(false);
    }
    cv_.notify_all();
}

void TransferState::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelRequested_.store(true);
    }
    cv_.notify_all();
}

bool TransferState::waitWhilePaused(std::chrono::milliseconds pollInterval) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!pauseRequested_.load() || cancelRequested_.load()) {
        return !cancelRequested_.load();
    }

    TransferPhase previous = phase_.exchange(TransferPhase::PAUSED);
    while (pauseRequested_.load() && !cancelRequested_.load()) {
        cv_.wait_for(lock, pollInterval);
    }
    phase_.store(previous);
    return !cancelRequested_.load();
}

} // namespace hfpull
