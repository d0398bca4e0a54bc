/**
 * @file performance_monitor.hpp
 * @brief Process-wide execution counters with JSON/CSV export.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hybrid_router {

// ─────────────────────────────────────────────
// Snapshot Types
// ─────────────────────────────────────────────

struct RouteStats {
    uint64_t count{0};
    uint64_t success_count{0};
    uint64_t failure_count{0};
    Duration total_latency{0};
    Duration min_latency{0};
    Duration max_latency{0};

    [[nodiscard]] Duration average_latency() const noexcept {
        return count == 0 ? Duration{0} : Duration{total_latency.count() / static_cast<int64_t>(count)};
    }
    [[nodiscard]] double success_rate() const noexcept {
        return count == 0 ? 0.0 : static_cast<double>(success_count) / static_cast<double>(count);
    }
};

struct ToolStats {
    uint64_t count{0};
    uint64_t errors{0};
    Duration total_latency{0};
    std::optional<Timestamp> last_execution;
};

struct TierStats {
    uint64_t count{0};
    uint64_t errors{0};
    Duration total_latency{0};
};

struct ErrorRecord {
    Timestamp at;
    ToolName tool;
    ErrorKind kind;
    std::string message;
};

/**
 * @brief Point-in-time copy of every counter.
 */
struct MetricsSnapshot {
    std::array<RouteStats, kRouteCount> routes{};
    uint64_t cache_hit_count{0};
    uint64_t cache_miss_count{0};
    size_t queue_depth{0};
    std::optional<Timestamp> last_sync_time;

    std::map<ToolName, ToolStats> tools;
    std::array<TierStats, 3> tiers{};
    std::map<ErrorKind, uint64_t> errors_by_kind;
    std::vector<ErrorRecord> recent_errors;     ///< Oldest first
    uint64_t jobs_completed{0};
    uint64_t jobs_failed{0};
    Timestamp session_start{};

    [[nodiscard]] const RouteStats& route(Route r) const noexcept {
        return routes[static_cast<size_t>(r)];
    }
    [[nodiscard]] const TierStats& tier(Tier t) const noexcept {
        return tiers[static_cast<size_t>(t)];
    }
    [[nodiscard]] double cache_hit_rate() const noexcept {
        auto lookups = cache_hit_count + cache_miss_count;
        return lookups == 0 ? 0.0 : static_cast<double>(cache_hit_count) / static_cast<double>(lookups);
    }
};

enum class ExportFormat : uint8_t {
    Json,
    Csv
};

[[nodiscard]] bool parse_export_format(std::string_view text, ExportFormat& out) noexcept;

[[nodiscard]] Json snapshot_to_json(const MetricsSnapshot& snap);
[[nodiscard]] std::string snapshot_to_csv(const MetricsSnapshot& snap);

// ─────────────────────────────────────────────
// PerformanceMonitor
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe counter store.
 *
 * All record_* calls are short locked sections. Optional persistence writes
 * the JSON export to a file on a background thread; write failures are
 * logged and never reach the callers of record_*.
 */
class PerformanceMonitor {
public:
    PerformanceMonitor(Logger& logger, size_t max_recent_errors = 50);
    ~PerformanceMonitor();

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void record(Route route, const ToolName& tool, Tier tier, Duration latency, bool success,
                std::optional<ErrorKind> error = std::nullopt, std::string_view message = {});
    void record_cache(bool hit);
    void record_job_outcome(const ToolName& tool, bool success, std::string_view error = {});
    void set_queue_state(size_t depth, std::optional<Timestamp> last_sync);

    [[nodiscard]] MetricsSnapshot snapshot() const;
    [[nodiscard]] Result<std::string> export_metrics(ExportFormat format) const;
    void reset();

    /// Starts periodic persistence to `path`. An empty path is a no-op.
    void start_persistence(const std::filesystem::path& path, std::chrono::milliseconds interval);
    void stop_persistence();

    /// Writes the JSON export to the persistence path now.
    Result<void> persist_now(const std::filesystem::path& path) const;

private:
    void record_error_locked(const ToolName& tool, ErrorKind kind, std::string_view message);
    void persist_loop(std::stop_token stop, std::filesystem::path path,
                      std::chrono::milliseconds interval);

    Logger& logger_;
    size_t max_recent_errors_;

    mutable std::mutex mutex_;
    MetricsSnapshot data_;

    std::mutex persist_mutex_;
    std::condition_variable_any persist_cv_;
    std::jthread persist_thread_;
};

}  // namespace hybrid_router
