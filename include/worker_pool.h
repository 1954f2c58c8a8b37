#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <deque>
#include <condition_variable>

namespace call_relay {

/**
 * @brief Fixed set of worker threads fed by a bounded FIFO
 *
 * Used for turn dispatch and for HTTP request handling, so neither the relay
 * receive loop nor the HTTP io threads block on slow work.
 * When the queue is full the oldest pending job is discarded; stale work is
 * worth less than new work.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @param name Used in log lines
     * @param workers Number of worker threads (at least 1)
     * @param max_queued Pending-job cap (0 = unbounded)
     */
    WorkerPool(const std::string& name, size_t workers, size_t max_queued = 0);

    /**
     * @brief Destructor - runs already queued jobs, then joins workers
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a job
     * @param job Work to run on a worker thread
     * @param on_discard Called (on the submitting thread) if this job is later
     *        evicted from a full queue
     * @return false if the pool is shut down
     */
    bool submit(Job job, Job on_discard = nullptr);

    bool is_idle() const;

    /// Queued plus executing jobs
    size_t pending_count() const;

    /// Jobs evicted because the queue was full
    uint64_t discarded_count() const;

    /**
     * @brief Wait for all pending jobs to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting jobs; workers exit once the queue is drained
     */
    void shutdown();

private:
    struct PendingJob {
        Job run;
        Job on_discard;
    };

    void worker_thread();

    std::string name_;
    size_t max_queued_;
    std::atomic<bool> running_;
    size_t active_jobs_;
    std::atomic<uint64_t> discarded_;

    std::deque<PendingJob> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace call_relay
