#ifndef STRMATCH_TASK_QUEUE_H
#define STRMATCH_TASK_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace strmatch {

/**
 * TaskQueue: fixed-size worker pool
 * - 多生产者提交任务，多消费者（workers）执行
 * - submit() returns a future; exceptions thrown by the task surface there
 * - close() stops accepting tasks, queued tasks still run
 * - The destructor closes and joins
 */
class TaskQueue {
public:
    // num_workers <= 0 means hardware concurrency
    explicit TaskQueue(int num_workers = 0);

    ~TaskQueue();

    // 不可复制
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (closed_) {
                throw std::runtime_error("submit on closed TaskQueue");
            }
            queue_.emplace([task]() { (*task)(); });
            ++pending_;
        }
        cv_.notify_one();
        return future;
    }

    void close();

    // Blocks until every submitted task has finished.
    void wait();

    size_t size() const;
    size_t num_workers() const { return workers_.size(); }

private:
    void worker_loop();

    std::queue<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable cv_done_;
    bool closed_ = false;
    size_t pending_ = 0;  // 已提交未完成的任务数
};

// <= 0 resolves to hardware concurrency (at least 1).
int resolve_worker_count(int requested);

}  // namespace strmatch

#endif  // STRMATCH_TASK_QUEUE_H
