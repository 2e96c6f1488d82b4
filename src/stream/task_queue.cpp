#include "task_queue.h"

#include <algorithm>

namespace strmatch {

int resolve_worker_count(int requested) {
    if (requested > 0) return requested;
    const unsigned hw = std::thread::hardware_concurrency();
    return std::max(1, static_cast<int>(hw));
}

TaskQueue::TaskQueue(int num_workers) {
    const int n = resolve_worker_count(num_workers);
    workers_.reserve(n);
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back(&TaskQueue::worker_loop, this);
    }
}

TaskQueue::~TaskQueue() {
    close();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

void TaskQueue::close() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void TaskQueue::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_done_.wait(lock, [this]() {
        return pending_ == 0;
    });
}

size_t TaskQueue::size() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskQueue::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return closed_ || !queue_.empty();
            });

            if (queue_.empty()) return;

            task = std::move(queue_.front());
            queue_.pop();
        }

        // packaged_task stores any exception in its future
        task();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            --pending_;
            if (pending_ == 0) {
                cv_done_.notify_all();
            }
        }
    }
}

}  // namespace strmatch
