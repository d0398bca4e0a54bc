/**
 * @file types.hpp
 * @brief Fundamental types used throughout the hybrid router.
 *
 * Defines identifiers, clocks, the tier/route/job-status vocabulary and
 * the parameter/payload representation shared by every module.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hybrid_router {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ToolName = std::string;
using JobId = std::string;
using Fingerprint = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Tool parameters and results. Objects keep their keys sorted, which makes
/// dump() a canonical serialization.
using Json = nlohmann::json;

// ─────────────────────────────────────────────
// Tier
// ─────────────────────────────────────────────

/**
 * @brief Complexity classification that drives the routing strategy.
 */
enum class Tier : uint8_t {
    Simple,     ///< Always local, no retry
    Medium,     ///< Local with timeout, remote fallback
    Complex     ///< Remote preferred, queued when offline
};

[[nodiscard]] constexpr std::string_view to_string(Tier tier) noexcept {
    switch (tier) {
        case Tier::Simple:  return "simple";
        case Tier::Medium:  return "medium";
        case Tier::Complex: return "complex";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool parse_tier(std::string_view text, Tier& out) noexcept {
    if (text == "simple")  { out = Tier::Simple;  return true; }
    if (text == "medium")  { out = Tier::Medium;  return true; }
    if (text == "complex") { out = Tier::Complex; return true; }
    return false;
}

// ─────────────────────────────────────────────
// Route
// ─────────────────────────────────────────────

/**
 * @brief Where an invocation was actually served from.
 */
enum class Route : uint8_t {
    Local,
    Remote,
    Cache,
    Queue
};

inline constexpr size_t kRouteCount = 4;

[[nodiscard]] constexpr std::string_view to_string(Route route) noexcept {
    switch (route) {
        case Route::Local:  return "local";
        case Route::Remote: return "remote";
        case Route::Cache:  return "cache";
        case Route::Queue:  return "queue";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Job Status
// ─────────────────────────────────────────────

enum class JobStatus : uint8_t {
    Queued,        ///< Waiting for a drain pass
    Processing,    ///< Owned by a queue worker slot
    Completed,     ///< Finished successfully
    Failed         ///< Attempts exhausted, needs operator action
};

[[nodiscard]] constexpr std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Queued:     return "queued";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool parse_job_status(std::string_view text, JobStatus& out) noexcept {
    if (text == "queued")     { out = JobStatus::Queued;     return true; }
    if (text == "processing") { out = JobStatus::Processing; return true; }
    if (text == "completed")  { out = JobStatus::Completed;  return true; }
    if (text == "failed")     { out = JobStatus::Failed;     return true; }
    return false;
}

/// Milliseconds since the Unix epoch, the representation used on disk and in exports.
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::milliseconds{ms}};
}

}  // namespace hybrid_router
