#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace Lockstep {

/**
 * Fixed-size worker pool returning futures for submitted tasks.
 *
 * Completion order is unspecified; callers that need a stable order keep the
 * futures in submission order and drain them front to back.
 */
class TaskExecutor {
public:
    explicit TaskExecutor(size_t num_threads = 4);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    template<typename Callable>
    auto Submit(Callable&& callable) -> std::future<std::invoke_result_t<Callable>> {
        using ReturnType = std::invoke_result_t<Callable>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::forward<Callable>(callable));
        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return future;
    }

    void Stop();

    size_t num_threads() const { return workers_.size(); }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

} // namespace Lockstep
