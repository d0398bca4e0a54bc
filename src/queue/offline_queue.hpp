/**
 * @file offline_queue.hpp
 * @brief Durable, priority-ordered queue of deferred tool invocations.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "network/connectivity.hpp"
#include "queue/job_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hybrid_router {

struct QueueOptions {
    uint32_t worker_count = 1;
    uint32_t max_attempts = 3;
    std::chrono::milliseconds backoff_base{2000};
    std::chrono::milliseconds backoff_cap{300000};
    std::chrono::milliseconds sync_interval{30000};
    uint64_t max_pending_jobs = 1000;
};

/**
 * @brief Job counts per status.
 */
struct QueueStatus {
    size_t queued{0};
    size_t processing{0};
    size_t completed{0};
    size_t failed{0};

    [[nodiscard]] size_t pending() const noexcept { return queued + processing; }
    [[nodiscard]] size_t total() const noexcept { return queued + processing + completed + failed; }
};

/**
 * @brief Lifetime drain statistics.
 */
struct QueueStats {
    uint64_t attempts{0};
    uint64_t succeeded{0};
    uint64_t failed{0};               ///< Jobs that reached the failed state
    std::optional<Timestamp> last_sync_attempt;
    std::optional<Timestamp> last_successful_sync;
    bool draining{false};
};

/**
 * @brief Offline queue with deduplication, retry/backoff and bounded workers.
 *
 * Job state transitions:
 *   queued → processing → completed
 *   queued → processing → queued      (retry after backoff)
 *   queued → processing → failed      (attempts exhausted)
 *   failed → queued                   (operator retry)
 *
 * The job table is guarded by one mutex that is never held while a job
 * executes, so enqueue() is not blocked by an in-progress drain. Only one
 * drain pass runs at a time; a second caller returns immediately.
 */
class OfflineQueue {
public:
    /// Executes one job; provided by the router.
    using Processor = std::function<Result<Json>(const QueuedJob& job)>;
    /// Called after a job reaches completed or failed.
    using FinishedHook = std::function<void(const QueuedJob& job)>;
    /// Called after any change in job counts.
    using StateHook = std::function<void(const QueueStatus& status, std::optional<Timestamp> last_sync)>;
    using Clock = std::function<Timestamp()>;

    OfflineQueue(QueueOptions options, IJobStore& store, ConnectivityMonitor& connectivity,
                 Logger& logger, Clock clock = {});
    ~OfflineQueue();

    OfflineQueue(const OfflineQueue&) = delete;
    OfflineQueue& operator=(const OfflineQueue&) = delete;

    /**
     * @brief Loads persisted jobs. Jobs left in processing by a previous
     *        process are returned to queued.
     */
    Result<void> open();

    void set_processor(Processor processor);
    void set_finished_hook(FinishedHook hook);
    void set_state_hook(StateHook hook);

    /// Starts the periodic timer and the connectivity subscription.
    void start();
    void stop();

    /**
     * @brief Adds a job, or returns the id of an equivalent pending job.
     *
     * Fails with QueueFull past max_pending_jobs, or StorageError if the
     * record cannot be persisted.
     */
    Result<JobId> enqueue(const ToolName& tool, const Json& parameters, Tier tier, int32_t priority);

    /**
     * @brief Runs one drain pass on the calling thread.
     * @return Number of job attempts made; 0 if offline or another pass is running.
     */
    size_t drain();

    /// Wakes the timer thread to drain as soon as possible. Never blocks.
    void request_drain();

    Result<void> retry_job(const JobId& id);
    size_t retry_all_failed();

    /**
     * @brief Deletes a job. A processing job is cancelled: its outcome is
     *        discarded and the record removed once the attempt returns.
     */
    Result<void> remove_job(const JobId& id);

    size_t clear_completed();
    size_t clear_failed();

    [[nodiscard]] QueueStatus status() const;
    [[nodiscard]] QueueStats stats() const;
    [[nodiscard]] std::optional<QueuedJob> find(const JobId& id) const;
    [[nodiscard]] std::vector<QueuedJob> jobs(std::optional<JobStatus> filter = std::nullopt) const;
    [[nodiscard]] bool is_draining() const noexcept { return draining_.load(); }

    /// Backoff before the next attempt once `attempts` attempts have failed.
    [[nodiscard]] std::chrono::milliseconds backoff_for(uint32_t attempts) const noexcept;

private:
    struct Slot {
        QueuedJob job;
        uint64_t sequence{0};
    };

    void timer_loop(std::stop_token stop);
    bool process(const JobId& id);
    size_t clear_with_status(JobStatus status);
    JobId generate_id_locked();
    QueueStatus status_locked() const;
    void persist_locked(const QueuedJob& job);
    void publish_state();

    QueueOptions options_;
    IJobStore& store_;
    ConnectivityMonitor& connectivity_;
    Logger& logger_;
    Clock clock_;

    Processor processor_;
    FinishedHook finished_hook_;
    StateHook state_hook_;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Slot> jobs_;
    std::unordered_set<JobId> cancelled_;
    uint64_t next_sequence_{0};
    std::mt19937_64 rng_;
    QueueStats stats_;

    std::atomic<bool> draining_{false};

    std::mutex timer_mutex_;
    std::condition_variable_any timer_cv_;
    bool drain_requested_{false};
    std::jthread timer_thread_;
    std::optional<ConnectivityMonitor::SubscriptionId> subscription_;

    ThreadPool workers_;
};

}  // namespace hybrid_router
