/**
 * @file router.cpp
 * @brief Router implementation.
 */

#include "router/router.hpp"

#include "core/fingerprint.hpp"

#include <algorithm>

namespace hybrid_router {

namespace {

using std::chrono::milliseconds;

Duration elapsed_since(SteadyTime start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

}  // namespace

RouterOptions make_router_options(const Config& config) {
    RouterOptions options;
    options.cache_enabled = config.router.cache_enabled;
    options.cache_max_entries = config.cache.max_entries;
    options.cache_max_bytes = config.cache.max_bytes;
    options.local_safety_ceiling = milliseconds{config.router.local_safety_ceiling_ms};
    options.remote_timeout = milliseconds{config.remote.timeout_ms};
    options.maintenance_interval = milliseconds{config.router.maintenance_interval_ms};
    options.queue = QueueOptions{
        .worker_count = config.queue.worker_count,
        .max_attempts = config.queue.max_attempts,
        .backoff_base = milliseconds{config.queue.backoff_base_ms},
        .backoff_cap = milliseconds{config.queue.backoff_cap_ms},
        .sync_interval = milliseconds{config.queue.sync_interval_ms},
        .max_pending_jobs = config.queue.max_pending_jobs
    };
    options.max_recent_errors = config.monitor.max_recent_errors;
    options.metrics_persist_path = config.monitor.persist_path;
    options.metrics_persist_interval = milliseconds{config.monitor.persist_interval_ms};
    return options;
}

ExecutionOutcome ExecutionOutcome::completed(Json payload, Route route, Duration latency, bool cached) {
    ExecutionOutcome out;
    out.kind = Kind::Completed;
    out.payload = std::move(payload);
    out.route = route;
    out.latency = latency;
    out.cached = cached;
    return out;
}

ExecutionOutcome ExecutionOutcome::deferred(JobId id, Duration latency) {
    ExecutionOutcome out;
    out.kind = Kind::Deferred;
    out.route = Route::Queue;
    out.latency = latency;
    out.job_id = std::move(id);
    return out;
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Router::Router(RouterOptions options, Classifier& classifier, LocalExecutor& local,
               IRemoteExecutor& remote, ConnectivityMonitor& connectivity, IJobStore& store,
               Logger& logger)
    : options_(std::move(options))
    , classifier_(classifier)
    , local_(local)
    , remote_(remote)
    , connectivity_(connectivity)
    , logger_(logger)
    , cache_(options_.cache_max_entries, options_.cache_max_bytes)
    , monitor_(logger, options_.max_recent_errors)
    , queue_(options_.queue, store, connectivity, logger) {
    queue_.set_processor([this](const QueuedJob& job) { return process_job(job); });
    queue_.set_finished_hook([this](const QueuedJob& job) {
        monitor_.record_job_outcome(job.tool, job.status == JobStatus::Completed,
                                    job.last_error.value_or(""));
    });
    queue_.set_state_hook([this](const QueueStatus& status, std::optional<Timestamp> last_sync) {
        monitor_.set_queue_state(status.pending(), last_sync);
    });
}

Router::~Router() {
    stop();
}

Result<void> Router::start() {
    if (auto opened = queue_.open(); !opened) {
        logger_.error("router", "Cannot load offline queue: " + opened.error().message);
        return opened;
    }
    queue_.start();
    monitor_.start_persistence(options_.metrics_persist_path, options_.metrics_persist_interval);
    if (!maintenance_thread_.joinable()) {
        maintenance_thread_ = std::jthread([this](std::stop_token stop) { maintenance_loop(stop); });
    }
    logger_.info("router", "Router started with " + std::to_string(classifier_.size())
                 + " registered tools");
    return Result<void>{};
}

void Router::stop() {
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_cv_.notify_all();
        maintenance_thread_.join();
    }
    queue_.stop();
    monitor_.stop_persistence();
}

void Router::maintenance_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, stop, options_.maintenance_interval, [] { return false; });
        }
        if (stop.stop_requested()) return;

        auto swept = cache_.sweep_expired();
        if (swept > 0) {
            logger_.debug("router", "Swept " + std::to_string(swept) + " expired cache entries");
        }
    }
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<ExecutionOutcome> Router::execute(const ToolName& tool, const Json& parameters) {
    auto start = std::chrono::steady_clock::now();

    auto params = normalize_parameters(parameters);
    if (!params) {
        logger_.warn("router", "Rejected '" + tool + "': " + params.error().message);
        return params.error();
    }

    auto key = compute_fingerprint(tool, *params);
    auto descriptor = classifier_.lookup(tool);

    if (options_.cache_enabled) {
        auto hit = cache_.get(key);
        monitor_.record_cache(hit.has_value());
        // Entries only exist for registered tools.
        if (hit && descriptor) {
            auto latency = elapsed_since(start);
            monitor_.record(Route::Cache, tool, descriptor->tier, latency, true);
            logger_.debug("router", "Cache hit for '" + tool + "' (" + key + ")");
            return ExecutionOutcome::completed(std::move(*hit), Route::Cache, latency, true);
        }
    }

    if (!descriptor) {
        logger_.warn("router", "Unknown tool '" + tool + "'");
        return Error{ErrorKind::UnknownTool, "Tool '" + tool + "' is not registered"};
    }

    for (const auto& name : descriptor->required_parameters) {
        if (!params->contains(name)) {
            return Error{ErrorKind::InvalidParameters,
                         "Tool '" + tool + "' requires parameter '" + name + "'"};
        }
    }

    Route route = Route::Local;
    auto result = dispatch(*descriptor, *params, route);
    if (result) {
        store_result(*descriptor, key, *result);
        return ExecutionOutcome::completed(std::move(*result), route, elapsed_since(start), false);
    }

    if (descriptor->tier == Tier::Simple) {
        logger_.warn("router", "Simple tool '" + tool + "' failed: " + result.error().message);
        return result.error();
    }

    auto job = queue_.enqueue(tool, *params, descriptor->tier, classifier_.priority_for(descriptor->tier));
    auto latency = elapsed_since(start);
    if (!job) {
        monitor_.record(Route::Queue, tool, descriptor->tier, latency, false,
                        job.error().kind, job.error().message);
        return job.error();
    }

    monitor_.record(Route::Queue, tool, descriptor->tier, latency, true);
    logger_.info("router", "Deferred '" + tool + "' as " + *job + ": " + result.error().message);
    return ExecutionOutcome::deferred(*job, latency);
}

Result<Json> Router::dispatch(const ToolDescriptor& tool, const Json& parameters, Route& route) {
    switch (tool.tier) {
        case Tier::Simple: {
            auto deadline = options_.local_safety_ceiling;
            if (tool.local_timeout.count() > 0) deadline = std::min(deadline, tool.local_timeout);
            route = Route::Local;
            return run_local(tool, parameters, deadline);
        }

        case Tier::Medium: {
            route = Route::Local;
            auto local = run_local(tool, parameters, tool.local_timeout);
            if (local) return local;

            if (!connectivity_.is_online()) {
                return local;
            }
            logger_.debug("router", "Falling back to remote for '" + tool.name + "': "
                          + local.error().message);
            route = Route::Remote;
            return run_remote(tool, parameters);
        }

        case Tier::Complex:
            route = Route::Remote;
            if (!connectivity_.is_online()) {
                return Error{ErrorKind::RemoteUnreachable, "Offline"};
            }
            return run_remote(tool, parameters);
    }
    return Error{ErrorKind::UnknownTool, "Unhandled tier"};
}

Result<Json> Router::run_local(const ToolDescriptor& tool, const Json& parameters,
                               std::chrono::milliseconds deadline) {
    auto start = std::chrono::steady_clock::now();
    auto result = local_.invoke(tool.name, parameters, deadline);
    auto latency = elapsed_since(start);

    if (result) {
        monitor_.record(Route::Local, tool.name, tool.tier, latency, true);
    } else {
        monitor_.record(Route::Local, tool.name, tool.tier, latency, false,
                        result.error().kind, result.error().message);
    }
    return result;
}

Result<Json> Router::run_remote(const ToolDescriptor& tool, const Json& parameters) {
    auto start = std::chrono::steady_clock::now();
    auto result = remote_.invoke(tool.name, parameters, options_.remote_timeout);
    auto latency = elapsed_since(start);

    if (result) {
        monitor_.record(Route::Remote, tool.name, tool.tier, latency, true);
    } else {
        monitor_.record(Route::Remote, tool.name, tool.tier, latency, false,
                        result.error().kind, result.error().message);
    }
    return result;
}

Result<Json> Router::process_job(const QueuedJob& job) {
    auto descriptor = classifier_.lookup(job.tool);
    if (!descriptor) {
        return Error{ErrorKind::UnknownTool, "Tool '" + job.tool + "' is no longer registered"};
    }

    Route route = Route::Remote;
    auto result = dispatch(*descriptor, job.parameters, route);
    if (result) {
        store_result(*descriptor, job.fingerprint, *result);
    }
    return result;
}

void Router::store_result(const ToolDescriptor& tool, const Fingerprint& key, const Json& payload) {
    if (!options_.cache_enabled) return;
    auto ttl = std::chrono::duration_cast<milliseconds>(tool.cache_ttl);
    if (!cache_.put(key, payload, ttl)) {
        logger_.debug("router", "Result of '" + tool.name + "' too large to cache");
    }
}

bool Router::invalidate(const ToolName& tool, const Json& parameters) {
    auto params = normalize_parameters(parameters);
    if (!params) return false;
    return cache_.invalidate(compute_fingerprint(tool, *params));
}

// ─────────────────────────────────────────────
// Queue / metrics passthrough
// ─────────────────────────────────────────────

QueueStatus Router::queue_status() const { return queue_.status(); }
QueueStats Router::queue_stats() const { return queue_.stats(); }
std::optional<QueuedJob> Router::find_job(const JobId& id) const { return queue_.find(id); }

std::vector<QueuedJob> Router::jobs(std::optional<JobStatus> filter) const {
    return queue_.jobs(filter);
}

Result<void> Router::retry_job(const JobId& id) { return queue_.retry_job(id); }
size_t Router::retry_all_failed() { return queue_.retry_all_failed(); }
Result<void> Router::remove_job(const JobId& id) { return queue_.remove_job(id); }
size_t Router::clear_completed() { return queue_.clear_completed(); }
size_t Router::clear_failed() { return queue_.clear_failed(); }
size_t Router::trigger_sync() { return queue_.drain(); }

MetricsSnapshot Router::metrics_snapshot() const { return monitor_.snapshot(); }

Result<std::string> Router::export_metrics(ExportFormat format) const {
    return monitor_.export_metrics(format);
}

void Router::reset_metrics() { monitor_.reset(); }

}  // namespace hybrid_router
