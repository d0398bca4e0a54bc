/**
 * @file job_store.hpp
 * @brief Durable storage of offline queue job records.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hybrid_router {

/**
 * @brief One deferred tool invocation.
 */
struct QueuedJob {
    JobId id;
    Fingerprint fingerprint;
    ToolName tool;
    Json parameters = Json::object();
    Tier tier{Tier::Medium};
    int32_t priority{0};
    Timestamp created_at{};
    Timestamp updated_at{};
    Timestamp next_attempt_at{};        ///< Backoff gate for retried jobs
    uint32_t attempts{0};
    uint32_t max_attempts{3};
    JobStatus status{JobStatus::Queued};
    std::optional<std::string> last_error;
    std::optional<Json> result;         ///< Set once completed

    [[nodiscard]] bool is_pending() const noexcept {
        return status == JobStatus::Queued || status == JobStatus::Processing;
    }
};

[[nodiscard]] Json job_to_json(const QueuedJob& job);
[[nodiscard]] Result<QueuedJob> job_from_json(const Json& doc);

/**
 * @brief Persistent record store; every write is an atomic single-record upsert.
 */
class IJobStore {
public:
    virtual ~IJobStore() = default;

    virtual Result<void> upsert(const QueuedJob& job) = 0;
    virtual Result<void> remove(const JobId& id) = 0;
    virtual Result<std::vector<QueuedJob>> load_all() = 0;

    /// Records the last load_all() found but could not read, each with the reason.
    [[nodiscard]] virtual std::vector<std::string> skipped_records() const { return {}; }
};

/**
 * @brief Keeps records in memory only. Used by tests and ephemeral deployments.
 */
class MemoryJobStore : public IJobStore {
public:
    Result<void> upsert(const QueuedJob& job) override;
    Result<void> remove(const JobId& id) override;
    Result<std::vector<QueuedJob>> load_all() override;

    [[nodiscard]] size_t size() const;

private:
    std::map<JobId, QueuedJob> jobs_;
    mutable std::mutex mutex_;
};

/**
 * @brief One JSON document per job under a directory.
 *
 * Writes go to "<id>.json.tmp" and are renamed over "<id>.json", so a
 * crash leaves either the old or the new record, never a torn one.
 * Leftover temp files are ignored on load; unreadable records are skipped
 * and listed by skipped_records().
 */
class FileJobStore : public IJobStore {
public:
    explicit FileJobStore(std::filesystem::path dir);

    /// Creates the directory if needed.
    Result<void> open();

    Result<void> upsert(const QueuedJob& job) override;
    Result<void> remove(const JobId& id) override;
    Result<std::vector<QueuedJob>> load_all() override;
    [[nodiscard]] std::vector<std::string> skipped_records() const override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

private:
    [[nodiscard]] std::filesystem::path path_for(const JobId& id) const;

    std::filesystem::path dir_;
    std::vector<std::string> skipped_;
    mutable std::mutex mutex_;
};

}  // namespace hybrid_router
