/**
 * @file job_store.cpp
 * @brief Job record serialization and store implementations.
 */

#include "queue/job_store.hpp"

#include <fstream>
#include <system_error>

namespace hybrid_router {

// ─────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────

Json job_to_json(const QueuedJob& job) {
    Json doc = {
        {"id", job.id},
        {"fingerprint", job.fingerprint},
        {"tool", job.tool},
        {"parameters", job.parameters},
        {"tier", std::string{to_string(job.tier)}},
        {"priority", job.priority},
        {"created_at", to_epoch_ms(job.created_at)},
        {"updated_at", to_epoch_ms(job.updated_at)},
        {"next_attempt_at", to_epoch_ms(job.next_attempt_at)},
        {"attempts", job.attempts},
        {"max_attempts", job.max_attempts},
        {"status", std::string{to_string(job.status)}},
        {"last_error", job.last_error ? Json(*job.last_error) : Json(nullptr)},
        {"result", job.result ? *job.result : Json(nullptr)}
    };
    return doc;
}

Result<QueuedJob> job_from_json(const Json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorKind::StorageError, "Job record is not an object"};
    }

    try {
        QueuedJob job;
        job.id = doc.at("id").get<std::string>();
        job.fingerprint = doc.at("fingerprint").get<std::string>();
        job.tool = doc.at("tool").get<std::string>();
        job.parameters = doc.value("parameters", Json::object());
        job.priority = doc.value("priority", 0);
        job.created_at = from_epoch_ms(doc.value("created_at", int64_t{0}));
        job.updated_at = from_epoch_ms(doc.value("updated_at", int64_t{0}));
        job.next_attempt_at = from_epoch_ms(doc.value("next_attempt_at", int64_t{0}));
        job.attempts = doc.value("attempts", 0u);
        job.max_attempts = doc.value("max_attempts", 3u);

        if (!parse_tier(doc.value("tier", std::string{"medium"}), job.tier)) {
            return Error{ErrorKind::StorageError, "Job " + job.id + " has an invalid tier"};
        }
        if (!parse_job_status(doc.at("status").get<std::string>(), job.status)) {
            return Error{ErrorKind::StorageError, "Job " + job.id + " has an invalid status"};
        }
        if (auto it = doc.find("last_error"); it != doc.end() && it->is_string()) {
            job.last_error = it->get<std::string>();
        }
        if (auto it = doc.find("result"); it != doc.end() && !it->is_null()) {
            job.result = *it;
        }
        return job;
    } catch (const Json::exception& e) {
        return Error{ErrorKind::StorageError, std::string{"Malformed job record: "} + e.what()};
    }
}

// ─────────────────────────────────────────────
// MemoryJobStore
// ─────────────────────────────────────────────

Result<void> MemoryJobStore::upsert(const QueuedJob& job) {
    std::lock_guard lock(mutex_);
    jobs_[job.id] = job;
    return Result<void>{};
}

Result<void> MemoryJobStore::remove(const JobId& id) {
    std::lock_guard lock(mutex_);
    jobs_.erase(id);
    return Result<void>{};
}

Result<std::vector<QueuedJob>> MemoryJobStore::load_all() {
    std::lock_guard lock(mutex_);
    std::vector<QueuedJob> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) out.push_back(job);
    return out;
}

size_t MemoryJobStore::size() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

// ─────────────────────────────────────────────
// FileJobStore
// ─────────────────────────────────────────────

FileJobStore::FileJobStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

Result<void> FileJobStore::open() {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return Error{ErrorKind::StorageError,
                     "Cannot create job store " + dir_.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

std::filesystem::path FileJobStore::path_for(const JobId& id) const {
    return dir_ / (id + ".json");
}

Result<void> FileJobStore::upsert(const QueuedJob& job) {
    auto target = path_for(job.id);
    auto temp = target;
    temp += ".tmp";

    std::lock_guard lock(mutex_);
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::StorageError, "Cannot write " + temp.string()};
        }
        out << job_to_json(job).dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
        out.flush();
        if (!out) {
            return Error{ErrorKind::StorageError, "Short write to " + temp.string()};
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return Error{ErrorKind::StorageError,
                     "Cannot commit " + target.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<void> FileJobStore::remove(const JobId& id) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_for(id), ec);
    if (ec) {
        return Error{ErrorKind::StorageError, "Cannot remove job " + id + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<std::vector<QueuedJob>> FileJobStore::load_all() {
    std::lock_guard lock(mutex_);
    std::vector<QueuedJob> jobs;
    skipped_.clear();

    std::error_code ec;
    std::filesystem::directory_iterator it(dir_, ec);
    if (ec) {
        return Error{ErrorKind::StorageError, "Cannot list " + dir_.string() + ": " + ec.message()};
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

        std::ifstream in(entry.path());
        auto doc = Json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            skipped_.push_back(entry.path().filename().string() + ": not valid JSON");
            continue;
        }

        auto job = job_from_json(doc);
        if (!job) {
            skipped_.push_back(entry.path().filename().string() + ": " + job.error().message);
            continue;
        }
        jobs.push_back(std::move(*job));
    }
    return jobs;
}

std::vector<std::string> FileJobStore::skipped_records() const {
    std::lock_guard lock(mutex_);
    return skipped_;
}

}  // namespace hybrid_router
