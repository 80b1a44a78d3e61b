#include "task_executor.h"

#include <glog/logging.h>

namespace Lockstep {

TaskExecutor::TaskExecutor(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&TaskExecutor::WorkerThread, this);
    }
    VLOG(2) << "[TaskExecutor] started " << num_threads << " workers";
}

TaskExecutor::~TaskExecutor() {
    Stop();
}

void TaskExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TaskExecutor::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // Drain queued work before exiting so no future is left unsatisfied
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace Lockstep
