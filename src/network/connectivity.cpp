/**
 * @file connectivity.cpp
 * @brief ConnectivityMonitor implementation.
 */

#include "network/connectivity.hpp"

#include "network/transport.hpp"

#include <chrono>
#include <vector>

namespace hybrid_router {

ConnectivityMonitor::ConnectivityMonitor(bool initially_online, Logger* logger)
    : online_(initially_online)
    , logger_(logger)
    , last_change_(std::chrono::system_clock::now()) {}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop_probe();
}

void ConnectivityMonitor::set_online(bool online) {
    if (online_.exchange(online) == online) return;

    std::vector<Callback> callbacks;
    {
        std::lock_guard lock(mutex_);
        last_change_ = std::chrono::system_clock::now();
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, cb] : subscribers_) callbacks.push_back(cb);
    }

    if (logger_) {
        logger_->info("connectivity", online ? "Connection restored" : "Connection lost");
    }
    for (const auto& cb : callbacks) {
        cb(online);
    }
}

ConnectivityMonitor::SubscriptionId ConnectivityMonitor::subscribe(Callback cb) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    subscribers_.emplace(id, std::move(cb));
    return id;
}

void ConnectivityMonitor::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(id);
}

Timestamp ConnectivityMonitor::last_change() const {
    std::lock_guard lock(mutex_);
    return last_change_;
}

void ConnectivityMonitor::start_probe(std::string host, uint16_t port, uint32_t interval_ms,
                                      uint32_t connect_timeout_ms) {
    if (probe_thread_.joinable() || interval_ms == 0) return;

    if (logger_) {
        logger_->info("connectivity", "Probing " + host + ":" + std::to_string(port)
                      + " every " + std::to_string(interval_ms) + "ms");
    }
    probe_thread_ = std::jthread(
        [this, host = std::move(host), port, interval_ms, connect_timeout_ms](std::stop_token stop) {
            probe_loop(stop, host, port, interval_ms, connect_timeout_ms);
        });
}

void ConnectivityMonitor::stop_probe() {
    if (!probe_thread_.joinable()) return;
    probe_thread_.request_stop();
    probe_cv_.notify_all();
    probe_thread_.join();
}

void ConnectivityMonitor::probe_loop(std::stop_token stop, std::string host, uint16_t port,
                                     uint32_t interval_ms, uint32_t connect_timeout_ms) {
    while (!stop.stop_requested()) {
        set_online(endpoint_reachable(host, port, std::chrono::milliseconds(connect_timeout_ms)));

        std::unique_lock lock(probe_mutex_);
        probe_cv_.wait_for(lock, stop, std::chrono::milliseconds(interval_ms),
                           [] { return false; });
    }
}

}  // namespace hybrid_router
