#include "roar/worker_pool.hpp"

#include <algorithm>
#include <utility>

namespace roar {

WorkerPool::WorkerPool(std::size_t worker_count) {
    const std::size_t thread_count = std::max<std::size_t>(1, worker_count);
    list_workers_.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        list_workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::scoped_lock lock(mutex_);
        stop_requested_ = true;
    }
    task_available_.notify_all();
    for (std::thread& worker : list_workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(Task task) {
    {
        std::scoped_lock lock(mutex_);
        queue_tasks_.push(std::move(task));
    }
    task_available_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this]() { return queue_tasks_.empty() && active_count_ == 0; });
}

std::size_t WorkerPool::worker_count() const noexcept {
    return list_workers_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            task_available_.wait(lock, [this]() { return stop_requested_ || !queue_tasks_.empty(); });
            if (queue_tasks_.empty()) {
                return;
            }
            task = std::move(queue_tasks_.front());
            queue_tasks_.pop();
            ++active_count_;
        }

        task();

        {
            std::scoped_lock lock(mutex_);
            --active_count_;
            if (queue_tasks_.empty() && active_count_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

}  // namespace roar
