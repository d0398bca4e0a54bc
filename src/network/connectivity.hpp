/**
 * @file connectivity.hpp
 * @brief Online/offline signal shared by the router and the offline queue.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace hybrid_router {

/**
 * @brief Tracks network reachability and notifies subscribers on change.
 *
 * State can be driven externally (set_online) or by an optional probe
 * thread that opens a TCP connection to the backend every interval.
 * Callbacks run on the thread that caused the transition and must not
 * block; the offline queue only signals its timer thread from them.
 */
class ConnectivityMonitor {
public:
    using Callback = std::function<void(bool online)>;
    using SubscriptionId = uint64_t;

    explicit ConnectivityMonitor(bool initially_online, Logger* logger = nullptr);
    ~ConnectivityMonitor();

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    [[nodiscard]] bool is_online() const noexcept { return online_.load(); }

    /// Updates the state; subscribers are called only on an actual transition.
    void set_online(bool online);

    SubscriptionId subscribe(Callback cb);
    void unsubscribe(SubscriptionId id);

    /// Starts probing host:port every interval_ms (no-op if already probing).
    void start_probe(std::string host, uint16_t port, uint32_t interval_ms,
                     uint32_t connect_timeout_ms = 1000);
    void stop_probe();

    [[nodiscard]] Timestamp last_change() const;

private:
    void probe_loop(std::stop_token stop, std::string host, uint16_t port,
                    uint32_t interval_ms, uint32_t connect_timeout_ms);

    std::atomic<bool> online_;
    Logger* logger_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Callback> subscribers_;
    SubscriptionId next_id_{1};
    Timestamp last_change_;

    std::mutex probe_mutex_;
    std::condition_variable_any probe_cv_;
    std::jthread probe_thread_;
};

}  // namespace hybrid_router
