#include "docchunk/worker_pool.hpp"

#include "docchunk/log.hpp"

namespace docchunk {

static const char *kComponent = "WorkerPool";

WorkerPool::WorkerPool(size_t num_threads, size_t queue_capacity) : capacity_(queue_capacity) {
    if (num_threads == 0) throw ConfigError("worker pool needs at least one thread");
    if (queue_capacity == 0) throw ConfigError("worker pool queue capacity must be positive");

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_thread, this);
    }
    log_info(kComponent, "Started with ", num_threads, " workers, queue capacity ", queue_capacity);
}

WorkerPool::WorkerPool(const Config &cfg) : WorkerPool(cfg.worker_threads, cfg.queue_capacity) {}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_ && workers_.empty()) return;
        shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    workers_.clear();
}

void WorkerPool::push(std::function<void()> job, bool wait) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (wait) {
            not_full_.wait(lock, [this]() { return shutdown_ || task_queue_.size() < capacity_; });
        } else if (!shutdown_ && task_queue_.size() >= capacity_) {
            throw QueueFull("worker queue is full (" + std::to_string(capacity_) + " pending tasks)");
        }
        if (shutdown_) throw Error("worker pool is shut down");
        task_queue_.push(std::move(job));
    }
    not_empty_.notify_one();
}

WorkerPool::Stats WorkerPool::get_stats() const {
    Stats s;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        s.active_workers = workers_.size();
        s.queue_size = task_queue_.size();
    }
    s.completed_tasks = completed_;
    s.failed_tasks = failed_;
    return s;
}

void WorkerPool::worker_thread() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            not_empty_.wait(lock, [this]() { return shutdown_ || !task_queue_.empty(); });
            if (task_queue_.empty()) break;     // shut down and drained
            job = std::move(task_queue_.front());
            task_queue_.pop();
        }
        not_full_.notify_one();

        // packaged_task stores exceptions in the future; nothing escapes here.
        job();
    }
}

} // namespace docchunk
