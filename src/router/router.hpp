/**
 * @file router.hpp
 * @brief Hybrid execution router: cache, tier strategy and offline hand-off.
 */

#pragma once

#include "cache/result_cache.hpp"
#include "classifier/classifier.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/local_executor.hpp"
#include "executor/remote_executor.hpp"
#include "network/connectivity.hpp"
#include "queue/job_store.hpp"
#include "queue/offline_queue.hpp"
#include "telemetry/performance_monitor.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace hybrid_router {

struct RouterOptions {
    bool cache_enabled = true;
    uint64_t cache_max_entries = 1024;
    uint64_t cache_max_bytes = 64ULL * 1024 * 1024;
    std::chrono::milliseconds local_safety_ceiling{30000};
    std::chrono::milliseconds remote_timeout{15000};
    std::chrono::milliseconds maintenance_interval{60000};
    QueueOptions queue;
    size_t max_recent_errors = 50;
    std::filesystem::path metrics_persist_path;
    std::chrono::milliseconds metrics_persist_interval{300000};
};

/// Builds router options from the [router], [cache], [remote], [queue] and [monitor] sections.
[[nodiscard]] RouterOptions make_router_options(const Config& config);

/**
 * @brief What execute() produced: a payload now, or a queued job.
 */
struct ExecutionOutcome {
    enum class Kind : uint8_t { Completed, Deferred };

    Kind kind{Kind::Completed};
    Json payload;
    Route route{Route::Local};
    Duration latency{0};
    bool cached{false};
    JobId job_id;                   ///< Set when deferred

    [[nodiscard]] bool is_deferred() const noexcept { return kind == Kind::Deferred; }

    static ExecutionOutcome completed(Json payload, Route route, Duration latency, bool cached);
    static ExecutionOutcome deferred(JobId id, Duration latency);
};

/**
 * @brief Decides, per invocation, between cache, local, remote and queue.
 *
 * Tier strategy:
 *   simple   local under the safety ceiling; failures go to the caller
 *   medium   local under the tier timeout, then remote, then queue
 *   complex  remote when online, otherwise queue
 *
 * Only UnknownTool, InvalidParameters, simple-tier local failures and
 * queue admission failures (QueueFull, StorageError) reach the caller;
 * every other failure becomes a Deferred outcome.
 */
class Router {
public:
    Router(RouterOptions options, Classifier& classifier, LocalExecutor& local,
           IRemoteExecutor& remote, ConnectivityMonitor& connectivity, IJobStore& store,
           Logger& logger);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// Loads persisted jobs and starts the background threads.
    Result<void> start();
    void stop();

    Result<ExecutionOutcome> execute(const ToolName& tool, const Json& parameters);

    // ── Queue operations ─────────────────────
    [[nodiscard]] QueueStatus queue_status() const;
    [[nodiscard]] QueueStats queue_stats() const;
    [[nodiscard]] std::optional<QueuedJob> find_job(const JobId& id) const;
    [[nodiscard]] std::vector<QueuedJob> jobs(std::optional<JobStatus> filter = std::nullopt) const;
    Result<void> retry_job(const JobId& id);
    size_t retry_all_failed();
    Result<void> remove_job(const JobId& id);
    size_t clear_completed();
    size_t clear_failed();
    /// Runs one drain pass on the calling thread.
    size_t trigger_sync();

    // ── Metrics ──────────────────────────────
    [[nodiscard]] MetricsSnapshot metrics_snapshot() const;
    [[nodiscard]] Result<std::string> export_metrics(ExportFormat format) const;
    void reset_metrics();

    /// Drops the cached result for (tool, parameters). Returns false if nothing was cached.
    bool invalidate(const ToolName& tool, const Json& parameters);

    [[nodiscard]] const ResultCache& cache() const noexcept { return cache_; }

private:
    /// Runs the tier strategy without queue hand-off; records one metric per attempt.
    Result<Json> dispatch(const ToolDescriptor& tool, const Json& parameters, Route& route);
    Result<Json> run_local(const ToolDescriptor& tool, const Json& parameters,
                           std::chrono::milliseconds deadline);
    Result<Json> run_remote(const ToolDescriptor& tool, const Json& parameters);
    Result<Json> process_job(const QueuedJob& job);
    void store_result(const ToolDescriptor& tool, const Fingerprint& key, const Json& payload);
    void maintenance_loop(std::stop_token stop);

    RouterOptions options_;
    Classifier& classifier_;
    LocalExecutor& local_;
    IRemoteExecutor& remote_;
    ConnectivityMonitor& connectivity_;
    Logger& logger_;

    ResultCache cache_;
    PerformanceMonitor monitor_;
    OfflineQueue queue_;

    std::mutex maintenance_mutex_;
    std::condition_variable_any maintenance_cv_;
    std::jthread maintenance_thread_;
};

}  // namespace hybrid_router
