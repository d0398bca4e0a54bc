/**
 * @file result_cache.hpp
 * @brief TTL + LRU cache for tool results keyed by request fingerprint.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace hybrid_router {

/**
 * @brief In-memory result cache bounded by entry count and byte budget.
 *
 * Entries older than their TTL are treated as misses immediately but are
 * only reclaimed on the next put() or sweep_expired(). When over budget,
 * expired entries go first, then least-recently-used fresh entries.
 *
 * All operations take a short-held mutex; none of them block on I/O.
 */
class ResultCache {
public:
    using Clock = std::function<SteadyTime()>;

    struct Stats {
        size_t entries{0};
        uint64_t bytes{0};
        uint64_t evictions{0};
        uint64_t expirations{0};
    };

    ResultCache(uint64_t max_entries, uint64_t max_bytes, Clock clock = {});

    [[nodiscard]] std::optional<Json> get(const Fingerprint& key);

    /// Returns false when the payload alone exceeds the byte budget.
    bool put(const Fingerprint& key, Json payload, std::chrono::milliseconds ttl);

    bool invalidate(const Fingerprint& key);

    /// Drops every expired entry; returns how many were removed.
    size_t sweep_expired();

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t bytes() const;
    [[nodiscard]] Stats stats() const;

private:
    struct Entry {
        Fingerprint key;
        Json payload;
        SteadyTime stored_at;
        std::chrono::milliseconds ttl;
        uint64_t size_estimate;
    };

    using LruList = std::list<Entry>;

    [[nodiscard]] bool is_fresh(const Entry& entry, SteadyTime now) const noexcept;
    void erase(LruList::iterator it);
    size_t purge_expired_locked(SteadyTime now);
    void evict_to_budget_locked();

    uint64_t max_entries_;
    uint64_t max_bytes_;
    Clock clock_;

    LruList lru_;   ///< Front = most recently used
    std::unordered_map<Fingerprint, LruList::iterator> index_;
    uint64_t bytes_{0};
    uint64_t evictions_{0};
    uint64_t expirations_{0};
    mutable std::mutex mutex_;
};

}  // namespace hybrid_router
