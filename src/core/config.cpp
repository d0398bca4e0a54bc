/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace hybrid_router {

namespace {

void read_tier(toml::node_view<toml::node> node, TierPolicyConfig& policy) {
    if (!node.is_table()) return;
    policy.cache_ttl_s = static_cast<uint32_t>(
        node["cache_ttl_s"].value_or(int64_t{policy.cache_ttl_s}));
    policy.local_timeout_ms = static_cast<uint32_t>(
        node["local_timeout_ms"].value_or(int64_t{policy.local_timeout_ms}));
    policy.priority = static_cast<int32_t>(
        node["priority"].value_or(int64_t{policy.priority}));
}

}  // anonymous namespace

const TierPolicyConfig& TierTableConfig::for_tier(Tier tier) const noexcept {
    switch (tier) {
        case Tier::Simple:  return simple;
        case Tier::Medium:  return medium;
        case Tier::Complex: return complex;
    }
    return medium;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [router]
        if (auto router = tbl["router"]; router.is_table()) {
            config.router.cache_enabled = router["cache_enabled"].value_or(true);
            config.router.local_safety_ceiling_ms = static_cast<uint32_t>(
                router["local_safety_ceiling_ms"].value_or(int64_t{30000}));
            config.router.maintenance_interval_ms = static_cast<uint32_t>(
                router["maintenance_interval_ms"].value_or(int64_t{60000}));
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.local_threads = static_cast<uint32_t>(
                executor["local_threads"].value_or(int64_t{0}));
        }

        // [remote]
        if (auto remote = tbl["remote"]; remote.is_table()) {
            config.remote.host = remote["host"].value_or(std::string{"127.0.0.1"});
            config.remote.port = static_cast<uint16_t>(
                remote["port"].value_or(int64_t{5301}));
            config.remote.connect_timeout_ms = static_cast<uint32_t>(
                remote["connect_timeout_ms"].value_or(int64_t{2000}));
            config.remote.timeout_ms = static_cast<uint32_t>(
                remote["timeout_ms"].value_or(int64_t{15000}));
            config.remote.probe_interval_ms = static_cast<uint32_t>(
                remote["probe_interval_ms"].value_or(int64_t{0}));
            config.remote.start_online = remote["start_online"].value_or(true);
        }

        // [cache]
        if (auto cache = tbl["cache"]; cache.is_table()) {
            config.cache.max_entries = static_cast<uint64_t>(
                cache["max_entries"].value_or(int64_t{1024}));
            config.cache.max_bytes = static_cast<uint64_t>(
                cache["max_bytes"].value_or(int64_t{64LL * 1024 * 1024}));
        }

        // [queue]
        if (auto queue = tbl["queue"]; queue.is_table()) {
            config.queue.store_dir = queue["store_dir"].value_or(std::string{"./queue"});
            config.queue.worker_count = static_cast<uint32_t>(
                queue["worker_count"].value_or(int64_t{1}));
            config.queue.max_attempts = static_cast<uint32_t>(
                queue["max_attempts"].value_or(int64_t{3}));
            config.queue.backoff_base_ms = static_cast<uint32_t>(
                queue["backoff_base_ms"].value_or(int64_t{2000}));
            config.queue.backoff_cap_ms = static_cast<uint32_t>(
                queue["backoff_cap_ms"].value_or(int64_t{300000}));
            config.queue.sync_interval_ms = static_cast<uint32_t>(
                queue["sync_interval_ms"].value_or(int64_t{30000}));
            config.queue.max_pending_jobs = static_cast<uint64_t>(
                queue["max_pending_jobs"].value_or(int64_t{1000}));
        }

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            config.monitor.persist_path = monitor["persist_path"].value_or(std::string{});
            config.monitor.persist_interval_ms = static_cast<uint32_t>(
                monitor["persist_interval_ms"].value_or(int64_t{300000}));
            config.monitor.max_recent_errors = static_cast<uint32_t>(
                monitor["max_recent_errors"].value_or(int64_t{50}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.log_to_stdout = telemetry["log_to_stdout"].value_or(false);
        }

        // [tiers.simple] / [tiers.medium] / [tiers.complex]
        if (auto tiers = tbl["tiers"]; tiers.is_table()) {
            read_tier(tiers["simple"], config.tiers.simple);
            read_tier(tiers["medium"], config.tiers.medium);
            read_tier(tiers["complex"], config.tiers.complex);
        }

        // [tools] name = "tier"
        if (auto* tools = tbl["tools"].as_table()) {
            for (const auto& [key, value] : *tools) {
                auto tier_name = value.value<std::string>();
                Tier tier{};
                if (!tier_name || !parse_tier(*tier_name, tier)) {
                    return Error{ErrorKind::ConfigError,
                                 "Invalid tier for tool '" + std::string{key.str()} + "'"};
                }
                config.tools[std::string{key.str()}] = tier;
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace hybrid_router
