#include "worker_pool.h"
#include "logger.h"
#include <chrono>
#include <exception>

namespace call_relay {

WorkerPool::WorkerPool(const std::string& name, size_t workers, size_t max_queued)
    : name_(name), max_queued_(max_queued), running_(true), active_jobs_(0), discarded_(0) {
    if (workers == 0) {
        workers = 1;
    }
    for (size_t i = 0; i < workers; ++i) {
        worker_threads_.emplace_back(&WorkerPool::worker_thread, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool WorkerPool::submit(Job job, Job on_discard) {
    if (!running_) {
        Logger::warn(name_ + " pool is shut down; job rejected");
        return false;
    }

    PendingJob evicted;
    bool did_evict = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (max_queued_ > 0 && queue_.size() >= max_queued_) {
            evicted = std::move(queue_.front());
            queue_.pop_front();
            did_evict = true;
        }
        queue_.push_back(PendingJob{std::move(job), std::move(on_discard)});
    }
    queue_cv_.notify_one();

    if (did_evict) {
        discarded_++;
        Logger::warn(name_ + " queue full (" + std::to_string(max_queued_) + "); discarded oldest job");
        if (evicted.on_discard) {
            evicted.on_discard();
        }
    }
    return true;
}

bool WorkerPool::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.empty() && active_jobs_ == 0;
}

size_t WorkerPool::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size() + active_jobs_;
}

uint64_t WorkerPool::discarded_count() const {
    return discarded_.load();
}

bool WorkerPool::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return queue_.empty() && active_jobs_ == 0; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
}

void WorkerPool::worker_thread() {
    while (true) {
        PendingJob job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !queue_.empty() || !running_;
            });

            if (queue_.empty()) {
                // Only reachable once shut down
                break;
            }

            job = std::move(queue_.front());
            queue_.pop_front();
            active_jobs_++;
        }

        try {
            if (job.run) {
                job.run();
            }
        } catch (const std::exception& e) {
            Logger::error(name_ + " job threw: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_jobs_--;
        }
        idle_cv_.notify_all();
    }
}

} // namespace call_relay
