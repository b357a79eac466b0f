#ifndef HFPULL_TASK_RUNNER_HPP
#define HFPULL_TASK_RUNNER_HPP

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace hfpull {

class TaskRunner {
public:
    static TaskRunner& instance();

    // Runs a task in a managed jthread
    void run(std::function<void()> task);

    // Runs a task and returns a future for its result. Exceptions thrown by
    // the task are delivered through the future.
    template<typename F, typename... Args>
    auto async(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type> {
        using return_type = typename std::invoke_result<F, Args...>::type;
        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<return_type> res = task->get_future();
        run([task]() { (*task)(); });
        return res;
    }

    // Number of tasks that have not finished yet
    size_t activeCount();

    // Ensures all threads are joined. Called on app shutdown.
    void shutdown();

    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

private:
    TaskRunner() = default;

    struct Worker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    // Joins workers whose task has returned. Caller holds mutex_.
    void reapFinished();

    std::vector<Worker> workers_;
    std::mutex mutex_;
};

} // namespace hfpull

#endif // HFPULL_TASK_RUNNER_HPP
