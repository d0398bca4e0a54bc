/**
 * @file result_cache.cpp
 * @brief ResultCache implementation.
 */

#include "cache/result_cache.hpp"

namespace hybrid_router {

ResultCache::ResultCache(uint64_t max_entries, uint64_t max_bytes, Clock clock)
    : max_entries_(max_entries)
    , max_bytes_(max_bytes)
    , clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }}) {}

std::optional<Json> ResultCache::get(const Fingerprint& key) {
    auto now = clock_();
    std::lock_guard lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    if (!is_fresh(*it->second, now)) return std::nullopt;

    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->payload;
}

bool ResultCache::put(const Fingerprint& key, Json payload, std::chrono::milliseconds ttl) {
    uint64_t size = payload.dump(-1, ' ', false, Json::error_handler_t::replace).size() + key.size();
    auto now = clock_();

    std::lock_guard lock(mutex_);

    if (auto it = index_.find(key); it != index_.end()) {
        erase(it->second);
    }
    if (size > max_bytes_ || max_entries_ == 0) {
        return false;
    }

    purge_expired_locked(now);

    lru_.push_front(Entry{
        .key = key,
        .payload = std::move(payload),
        .stored_at = now,
        .ttl = ttl,
        .size_estimate = size
    });
    index_[key] = lru_.begin();
    bytes_ += size;

    evict_to_budget_locked();
    return true;
}

bool ResultCache::invalidate(const Fingerprint& key) {
    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    erase(it->second);
    return true;
}

size_t ResultCache::sweep_expired() {
    auto now = clock_();
    std::lock_guard lock(mutex_);
    return purge_expired_locked(now);
}

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    lru_.clear();
    index_.clear();
    bytes_ = 0;
}

size_t ResultCache::size() const {
    std::lock_guard lock(mutex_);
    return index_.size();
}

uint64_t ResultCache::bytes() const {
    std::lock_guard lock(mutex_);
    return bytes_;
}

ResultCache::Stats ResultCache::stats() const {
    std::lock_guard lock(mutex_);
    return Stats{
        .entries = index_.size(),
        .bytes = bytes_,
        .evictions = evictions_,
        .expirations = expirations_
    };
}

bool ResultCache::is_fresh(const Entry& entry, SteadyTime now) const noexcept {
    return now - entry.stored_at <= entry.ttl;
}

void ResultCache::erase(LruList::iterator it) {
    bytes_ -= it->size_estimate;
    index_.erase(it->key);
    lru_.erase(it);
}

size_t ResultCache::purge_expired_locked(SteadyTime now) {
    size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        auto next = std::next(it);
        if (!is_fresh(*it, now)) {
            erase(it);
            ++removed;
        }
        it = next;
    }
    expirations_ += removed;
    return removed;
}

void ResultCache::evict_to_budget_locked() {
    while (!lru_.empty() && (index_.size() > max_entries_ || bytes_ > max_bytes_)) {
        erase(std::prev(lru_.end()));
        ++evictions_;
    }
}

}  // namespace hybrid_router
