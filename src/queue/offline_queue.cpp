/**
 * @file offline_queue.cpp
 * @brief OfflineQueue implementation.
 */

#include "queue/offline_queue.hpp"

#include "core/fingerprint.hpp"

#include <algorithm>
#include <cstdio>
#include <future>

namespace hybrid_router {

OfflineQueue::OfflineQueue(QueueOptions options, IJobStore& store,
                           ConnectivityMonitor& connectivity, Logger& logger, Clock clock)
    : options_(options)
    , store_(store)
    , connectivity_(connectivity)
    , logger_(logger)
    , clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::system_clock::now(); }})
    , rng_(std::random_device{}())
    , workers_(std::max<uint32_t>(options.worker_count, 1)) {}

OfflineQueue::~OfflineQueue() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> OfflineQueue::open() {
    auto loaded = store_.load_all();
    if (!loaded) {
        return loaded.error();
    }

    auto records = std::move(*loaded);
    for (const auto& skipped : store_.skipped_records()) {
        logger_.warn("offline_queue", "Skipped unreadable job record " + skipped);
    }
    std::sort(records.begin(), records.end(), [](const QueuedJob& a, const QueuedJob& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });

    size_t recovered = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto& job : records) {
            if (job.status == JobStatus::Processing) {
                // The previous process died mid-attempt.
                job.status = JobStatus::Queued;
                job.updated_at = clock_();
                persist_locked(job);
                ++recovered;
            }
            auto id = job.id;
            jobs_[id] = Slot{.job = std::move(job), .sequence = next_sequence_++};
        }
    }

    logger_.info("offline_queue", "Loaded " + std::to_string(records.size()) + " jobs ("
                 + std::to_string(recovered) + " recovered from processing)");
    publish_state();
    return Result<void>{};
}

void OfflineQueue::set_processor(Processor processor) { processor_ = std::move(processor); }
void OfflineQueue::set_finished_hook(FinishedHook hook) { finished_hook_ = std::move(hook); }
void OfflineQueue::set_state_hook(StateHook hook) { state_hook_ = std::move(hook); }

void OfflineQueue::start() {
    if (timer_thread_.joinable()) return;

    subscription_ = connectivity_.subscribe([this](bool online) {
        if (online) request_drain();
    });
    timer_thread_ = std::jthread([this](std::stop_token stop) { timer_loop(stop); });

    logger_.info("offline_queue", "Periodic sync started (interval: "
                 + std::to_string(options_.sync_interval.count()) + "ms, workers: "
                 + std::to_string(workers_.thread_count()) + ")");

    if (connectivity_.is_online()) request_drain();
}

void OfflineQueue::stop() {
    if (subscription_) {
        connectivity_.unsubscribe(*subscription_);
        subscription_.reset();
    }
    if (timer_thread_.joinable()) {
        timer_thread_.request_stop();
        timer_cv_.notify_all();
        timer_thread_.join();
        logger_.info("offline_queue", "Periodic sync stopped");
    }
}

void OfflineQueue::request_drain() {
    {
        std::lock_guard lock(timer_mutex_);
        drain_requested_ = true;
    }
    timer_cv_.notify_all();
}

void OfflineQueue::timer_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(timer_mutex_);
            timer_cv_.wait_for(lock, stop, options_.sync_interval,
                               [this] { return drain_requested_; });
            if (stop.stop_requested()) return;
            drain_requested_ = false;
        }

        if (!connectivity_.is_online()) continue;
        if (status().queued == 0) continue;
        drain();
    }
}

// ─────────────────────────────────────────────
// Enqueue
// ─────────────────────────────────────────────

JobId OfflineQueue::generate_id_locked() {
    char buf[24];
    JobId id;
    do {
        std::snprintf(buf, sizeof(buf), "job-%016llx",
                      static_cast<unsigned long long>(rng_()));
        id = buf;
    } while (jobs_.contains(id));
    return id;
}

Result<JobId> OfflineQueue::enqueue(const ToolName& tool, const Json& parameters,
                                    Tier tier, int32_t priority) {
    auto fingerprint = compute_fingerprint(tool, parameters);
    auto now = clock_();
    JobId id;

    {
        std::lock_guard lock(mutex_);

        size_t pending = 0;
        for (const auto& [existing_id, slot] : jobs_) {
            // A cancelled job still in flight will be discarded, so it neither absorbs nor blocks.
            if (!slot.job.is_pending() || cancelled_.contains(existing_id)) continue;
            if (slot.job.fingerprint == fingerprint) {
                logger_.debug("offline_queue", "Deduplicated '" + tool + "' onto " + existing_id);
                return existing_id;
            }
            ++pending;
        }

        if (pending >= options_.max_pending_jobs) {
            logger_.warn("offline_queue", "Rejected '" + tool + "': "
                         + std::to_string(pending) + " jobs pending");
            return Error{ErrorKind::QueueFull,
                         "Offline queue is full (" + std::to_string(options_.max_pending_jobs)
                         + " pending jobs)"};
        }

        id = generate_id_locked();
        QueuedJob job{
            .id = id,
            .fingerprint = fingerprint,
            .tool = tool,
            .parameters = parameters,
            .tier = tier,
            .priority = priority,
            .created_at = now,
            .updated_at = now,
            .next_attempt_at = now,
            .attempts = 0,
            .max_attempts = std::max<uint32_t>(options_.max_attempts, 1),
            .status = JobStatus::Queued
        };

        if (auto saved = store_.upsert(job); !saved) {
            logger_.error("offline_queue", "Cannot persist job for '" + tool + "': "
                          + saved.error().message);
            return saved.error();
        }
        jobs_[id] = Slot{.job = std::move(job), .sequence = next_sequence_++};
    }

    logger_.info("offline_queue", "Queued " + id + " (" + tool + ", priority "
                 + std::to_string(priority) + ")");
    publish_state();
    return id;
}

// ─────────────────────────────────────────────
// Drain
// ─────────────────────────────────────────────

std::chrono::milliseconds OfflineQueue::backoff_for(uint32_t attempts) const noexcept {
    auto delay = options_.backoff_base;
    for (uint32_t i = 0; i < attempts && delay < options_.backoff_cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.backoff_cap);
}

size_t OfflineQueue::drain() {
    if (!processor_) return 0;

    bool expected = false;
    if (!draining_.compare_exchange_strong(expected, true)) {
        logger_.debug("offline_queue", "Drain already in progress");
        return 0;
    }

    struct DrainGuard {
        std::atomic<bool>& flag;
        ~DrainGuard() { flag.store(false); }
    } guard{draining_};

    auto now = clock_();
    std::vector<std::pair<JobId, const Slot*>> ready;
    {
        std::lock_guard lock(mutex_);
        stats_.last_sync_attempt = now;
        for (const auto& [id, slot] : jobs_) {
            if (slot.job.status == JobStatus::Queued && slot.job.next_attempt_at <= now) {
                ready.emplace_back(id, &slot);
            }
        }
        std::sort(ready.begin(), ready.end(), [](const auto& a, const auto& b) {
            const auto& ja = a.second->job;
            const auto& jb = b.second->job;
            if (ja.priority != jb.priority) return ja.priority > jb.priority;
            if (ja.created_at != jb.created_at) return ja.created_at < jb.created_at;
            return a.second->sequence < b.second->sequence;
        });
    }

    if (!connectivity_.is_online()) {
        logger_.debug("offline_queue", "Offline, skipping drain");
        return 0;
    }
    if (ready.empty()) {
        std::lock_guard lock(mutex_);
        stats_.last_successful_sync = now;
        return 0;
    }

    logger_.info("offline_queue", "Draining " + std::to_string(ready.size()) + " jobs");

    std::vector<std::future<bool>> attempts;
    attempts.reserve(ready.size());
    for (const auto& [id, slot] : ready) {
        attempts.push_back(workers_.submit([this, id = id] {
            if (!connectivity_.is_online()) return false;
            return process(id);
        }));
    }

    size_t made = 0;
    for (auto& attempt : attempts) {
        try {
            if (attempt.get()) ++made;
        } catch (const std::future_error& e) {
            logger_.warn("offline_queue", std::string{"Drain interrupted: "} + e.what());
        }
    }

    bool completed_pass = connectivity_.is_online();
    {
        std::lock_guard lock(mutex_);
        if (completed_pass) stats_.last_successful_sync = clock_();
    }
    logger_.info("offline_queue", "Drain pass finished: " + std::to_string(made) + " attempts"
                 + (completed_pass ? "" : " (connection lost)"));
    publish_state();
    return made;
}

bool OfflineQueue::process(const JobId& id) {
    QueuedJob snapshot;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(id);
        // Removed or picked up elsewhere since the pass was planned.
        if (it == jobs_.end() || it->second.job.status != JobStatus::Queued) return false;

        auto& job = it->second.job;
        job.status = JobStatus::Processing;
        job.updated_at = clock_();
        persist_locked(job);
        snapshot = job;
    }
    publish_state();

    logger_.debug("offline_queue", "Processing " + id + ": " + snapshot.tool);
    auto outcome = processor_(snapshot);

    std::optional<QueuedJob> finished;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return true;

        ++stats_.attempts;

        if (cancelled_.erase(id) > 0) {
            jobs_.erase(it);
            if (auto removed = store_.remove(id); !removed) {
                logger_.error("offline_queue", "Cannot remove cancelled job " + id + ": "
                              + removed.error().message);
            }
            logger_.info("offline_queue", "Discarded outcome of cancelled job " + id);
        } else {
            auto& job = it->second.job;
            auto now = clock_();
            job.updated_at = now;
            job.attempts += 1;

            if (outcome) {
                job.status = JobStatus::Completed;
                job.result = std::move(*outcome);
                job.last_error.reset();
                ++stats_.succeeded;
                finished = job;
                logger_.info("offline_queue", "Job " + id + " completed after "
                             + std::to_string(job.attempts) + " attempt(s)");
            } else if (job.attempts < job.max_attempts) {
                auto delay = backoff_for(job.attempts);
                job.status = JobStatus::Queued;
                job.last_error = outcome.error().message;
                job.next_attempt_at = now + delay;
                logger_.warn("offline_queue", "Job " + id + " will retry (attempt "
                             + std::to_string(job.attempts) + "/" + std::to_string(job.max_attempts)
                             + ") in " + std::to_string(delay.count()) + "ms: "
                             + outcome.error().message);
            } else {
                job.status = JobStatus::Failed;
                job.last_error = outcome.error().message;
                ++stats_.failed;
                finished = job;
                logger_.error("offline_queue", "Job " + id + " failed permanently after "
                              + std::to_string(job.attempts) + " attempts: "
                              + outcome.error().message);
            }
            persist_locked(job);
        }
    }

    if (finished && finished_hook_) {
        finished_hook_(*finished);
    }
    publish_state();
    return true;
}

// ─────────────────────────────────────────────
// Operator actions
// ─────────────────────────────────────────────

Result<void> OfflineQueue::retry_job(const JobId& id) {
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return Error{ErrorKind::JobNotFound, "Job " + id + " not found"};
        }
        auto& job = it->second.job;
        if (job.status != JobStatus::Failed) {
            return Error{ErrorKind::InvalidJobState,
                         "Job " + id + " is " + std::string{to_string(job.status)} + ", not failed"};
        }
        for (const auto& [other_id, slot] : jobs_) {
            if (other_id != id && slot.job.is_pending() && !cancelled_.contains(other_id)
                && slot.job.fingerprint == job.fingerprint) {
                return Error{ErrorKind::InvalidJobState,
                             "Equivalent job " + other_id + " is already pending"};
            }
        }

        job.status = JobStatus::Queued;
        job.attempts = 0;
        job.last_error.reset();
        job.updated_at = clock_();
        job.next_attempt_at = job.updated_at;
        persist_locked(job);
    }

    logger_.info("offline_queue", "Job " + id + " queued for retry");
    publish_state();
    request_drain();
    return Result<void>{};
}

size_t OfflineQueue::retry_all_failed() {
    std::vector<JobId> failed;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, slot] : jobs_) {
            if (slot.job.status == JobStatus::Failed) failed.push_back(id);
        }
    }

    size_t requeued = 0;
    for (const auto& id : failed) {
        if (retry_job(id)) ++requeued;
    }
    logger_.info("offline_queue", std::to_string(requeued) + " failed jobs queued for retry");
    return requeued;
}

Result<void> OfflineQueue::remove_job(const JobId& id) {
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return Error{ErrorKind::JobNotFound, "Job " + id + " not found"};
        }

        if (it->second.job.status == JobStatus::Processing) {
            cancelled_.insert(id);
            logger_.info("offline_queue", "Job " + id + " will be cancelled when its attempt returns");
            return Result<void>{};
        }

        if (auto removed = store_.remove(id); !removed) {
            return removed.error();
        }
        jobs_.erase(it);
    }

    logger_.info("offline_queue", "Removed job " + id);
    publish_state();
    return Result<void>{};
}

size_t OfflineQueue::clear_with_status(JobStatus status) {
    size_t cleared = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->second.job.status != status) {
                ++it;
                continue;
            }
            if (auto removed = store_.remove(it->first); !removed) {
                logger_.error("offline_queue", removed.error().message);
                ++it;
                continue;
            }
            it = jobs_.erase(it);
            ++cleared;
        }
    }

    logger_.info("offline_queue", "Cleared " + std::to_string(cleared) + " "
                 + std::string{to_string(status)} + " jobs");
    publish_state();
    return cleared;
}

size_t OfflineQueue::clear_completed() { return clear_with_status(JobStatus::Completed); }
size_t OfflineQueue::clear_failed() { return clear_with_status(JobStatus::Failed); }

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

QueueStatus OfflineQueue::status_locked() const {
    QueueStatus status;
    for (const auto& [id, slot] : jobs_) {
        switch (slot.job.status) {
            case JobStatus::Queued:     ++status.queued; break;
            case JobStatus::Processing: ++status.processing; break;
            case JobStatus::Completed:  ++status.completed; break;
            case JobStatus::Failed:     ++status.failed; break;
        }
    }
    return status;
}

QueueStatus OfflineQueue::status() const {
    std::lock_guard lock(mutex_);
    return status_locked();
}

QueueStats OfflineQueue::stats() const {
    std::lock_guard lock(mutex_);
    auto stats = stats_;
    stats.draining = draining_.load();
    return stats;
}

std::optional<QueuedJob> OfflineQueue::find(const JobId& id) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second.job;
}

std::vector<QueuedJob> OfflineQueue::jobs(std::optional<JobStatus> filter) const {
    std::vector<std::pair<uint64_t, QueuedJob>> ordered;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, slot] : jobs_) {
            if (filter && slot.job.status != *filter) continue;
            ordered.emplace_back(slot.sequence, slot.job);
        }
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<QueuedJob> out;
    out.reserve(ordered.size());
    for (auto& [seq, job] : ordered) out.push_back(std::move(job));
    return out;
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

void OfflineQueue::persist_locked(const QueuedJob& job) {
    if (auto saved = store_.upsert(job); !saved) {
        // In-memory state stays authoritative; the next transition retries the write.
        logger_.error("offline_queue", "Cannot persist job " + job.id + ": " + saved.error().message);
    }
}

void OfflineQueue::publish_state() {
    if (!state_hook_) return;
    QueueStatus status;
    std::optional<Timestamp> last_sync;
    {
        std::lock_guard lock(mutex_);
        status = status_locked();
        last_sync = stats_.last_successful_sync;
    }
    state_hook_(status, last_sync);
}

}  // namespace hybrid_router
