/**
 * @file config.hpp
 * @brief Router configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace hybrid_router {

struct RouterConfig {
    bool cache_enabled = true;
    uint32_t local_safety_ceiling_ms = 30000;   ///< Hard ceiling for simple-tier tools
    uint32_t maintenance_interval_ms = 60000;   ///< Cache sweep period
};

struct ExecutorConfig {
    uint32_t local_threads = 0;                 ///< 0 = hardware_concurrency
};

struct RemoteConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5301;
    uint32_t connect_timeout_ms = 2000;
    uint32_t timeout_ms = 15000;                ///< Per-call network timeout
    uint32_t probe_interval_ms = 0;             ///< 0 = connectivity probing disabled
    bool start_online = true;
};

struct CacheConfig {
    uint64_t max_entries = 1024;
    uint64_t max_bytes = 64ULL * 1024 * 1024;
};

struct QueueConfig {
    std::filesystem::path store_dir = "./queue";
    uint32_t worker_count = 1;
    uint32_t max_attempts = 3;
    uint32_t backoff_base_ms = 2000;
    uint32_t backoff_cap_ms = 300000;
    uint32_t sync_interval_ms = 30000;
    uint64_t max_pending_jobs = 1000;
};

struct MonitorConfig {
    std::filesystem::path persist_path;         ///< Empty = no persistence
    uint32_t persist_interval_ms = 300000;
    uint32_t max_recent_errors = 50;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool log_to_stdout = false;
};

/**
 * @brief Routing policy for one tier.
 *
 * A local_timeout_ms of 0 means "no tier deadline" (simple tools rely on
 * the router's safety ceiling; complex tools never run locally).
 */
struct TierPolicyConfig {
    uint32_t cache_ttl_s = 3600;
    uint32_t local_timeout_ms = 0;
    int32_t priority = 5;
};

struct TierTableConfig {
    TierPolicyConfig simple{.cache_ttl_s = 3600, .local_timeout_ms = 0, .priority = 10};
    TierPolicyConfig medium{.cache_ttl_s = 1800, .local_timeout_ms = 2000, .priority = 5};
    TierPolicyConfig complex{.cache_ttl_s = 7200, .local_timeout_ms = 0, .priority = 1};

    [[nodiscard]] const TierPolicyConfig& for_tier(Tier tier) const noexcept;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    RouterConfig router;
    ExecutorConfig executor;
    RemoteConfig remote;
    CacheConfig cache;
    QueueConfig queue;
    MonitorConfig monitor;
    TelemetryConfig telemetry;
    TierTableConfig tiers;
    std::map<ToolName, Tier> tools;             ///< [tools] name = "tier"
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace hybrid_router
