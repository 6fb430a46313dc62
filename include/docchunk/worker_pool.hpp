#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "docchunk/config.hpp"
#include "docchunk/errors.hpp"

namespace docchunk {

// Fixed set of threads over a bounded FIFO queue. submit() blocks while the
// queue is full; try_submit() throws QueueFull instead. Results and exceptions
// travel back through the returned future.
class WorkerPool {
public:
    WorkerPool(size_t num_threads, size_t queue_capacity);
    explicit WorkerPool(const Config &cfg);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F &&fn) {
        return enqueue_task(std::forward<F>(fn), true);
    }

    template <typename F>
    std::future<std::invoke_result_t<F>> try_submit(F &&fn) {
        return enqueue_task(std::forward<F>(fn), false);
    }

    // Runs everything already queued, then joins the workers. Idempotent.
    void shutdown();

    struct Stats {
        size_t active_workers = 0;
        size_t queue_size = 0;
        size_t completed_tasks = 0;
        size_t failed_tasks = 0;
    };
    Stats get_stats() const;

    size_t capacity() const { return capacity_; }

private:
    template <typename F>
    std::future<std::invoke_result_t<F>> enqueue_task(F &&fn, bool wait) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(
            [this, f = std::forward<F>(fn)]() mutable -> R {
                try {
                    if constexpr (std::is_void_v<R>) {
                        f();
                        ++completed_;
                    } else {
                        R r = f();
                        ++completed_;
                        return r;
                    }
                } catch (...) {
                    ++failed_;
                    throw;
                }
            });
        std::future<R> fut = task->get_future();
        push([task]() { (*task)(); }, wait);
        return fut;
    }

    void push(std::function<void()> job, bool wait);
    void worker_thread();

    size_t capacity_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;

    std::atomic<size_t> completed_{0};
    std::atomic<size_t> failed_{0};
};

} // namespace docchunk
