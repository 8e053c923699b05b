// === Worker Pool =============================================================
//
// Fixed-size thread pool draining a FIFO task queue. The thread count is the
// admission bound: at most that many tasks execute at any instant.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace roar {

class WorkerPool final {
  public:
    using Task = std::function<void()>;

    /** @brief Start `worker_count` threads (at least one). */
    explicit WorkerPool(std::size_t worker_count);
    /** @brief Finish queued tasks, then join every worker. */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** @brief Queue a task. Tasks must not throw. */
    void submit(Task task);
    /** @brief Block until the queue is empty and no task is running. */
    void wait_idle();

    [[nodiscard]] std::size_t worker_count() const noexcept;

  private:
    void worker_loop();

    std::vector<std::thread> list_workers_;
    std::queue<Task> queue_tasks_;
    std::mutex mutex_;
    std::condition_variable task_available_;
    std::condition_variable idle_;
    std::size_t active_count_{0};
    bool stop_requested_{false};
};

}  // namespace roar
