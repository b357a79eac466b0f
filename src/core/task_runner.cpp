#include "hfpull/task_runner.hpp"
#include "hfpull/logger.hpp"
#include <algorithm>

namespace hfpull {

TaskRunner& TaskRunner::instance() {
    static TaskRunner instance;
    return instance;
}

void TaskRunner::run(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    reapFinished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::jthread([task = std::move(task), done]() {
        task();
        done->store(true);
    });
    workers_.push_back(std::move(worker));
}

size_t TaskRunner::activeCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    reapFinished();
    return workers_.size();
}

void TaskRunner::reapFinished() {
    // Erasing a finished jthread joins it, which returns immediately.
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
                                  [](const Worker& w) { return w.done->load(); }),
                   workers_.end());
}

void TaskRunner::shutdown() {
    std::vector<Worker> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(workers_);
    }
    if (pending.empty()) return;

    LOG_INFO("Shutting down TaskRunner, waiting for " + std::to_string(pending.size()) +
             " background threads...");
    // jthreads request stop and join on destruction
    pending.clear();
    LOG_INFO("TaskRunner shutdown complete.");
}

TaskRunner::~TaskRunner() {
    shutdown();
}

} // namespace hfpull
