/**
 * @file transport.hpp
 * @brief Framed request/response exchange between the router and a tool server.
 *
 * One frame per direction per connection: [uint32 big-endian length][payload].
 * Failures are classified so callers can tell an endpoint that cannot be
 * reached from one that accepted the call but did not answer in time.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace hybrid_router {

class ThreadPool;

inline constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;

enum class LinkFailure : uint8_t {
    Connect,   ///< No connection could be established
    Timeout,   ///< Connected, but the peer did not finish its frame in time
    Closed,    ///< Peer reset or closed the connection mid-exchange
    Oversize   ///< Frame length exceeds kMaxFrameSize
};

[[nodiscard]] constexpr std::string_view to_string(LinkFailure failure) noexcept {
    switch (failure) {
        case LinkFailure::Connect:  return "connect";
        case LinkFailure::Timeout:  return "timeout";
        case LinkFailure::Closed:   return "closed";
        case LinkFailure::Oversize: return "oversize";
    }
    return "unknown";
}

struct LinkError {
    LinkFailure failure;
    std::string message;
};

/// Owns a socket descriptor; shuts it down and closes it on destruction.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) noexcept : fd_(fd) {}
    ~Socket() { reset(); }

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    void reset() noexcept;

private:
    int fd_ = -1;
};

/**
 * @brief Client side: one connection, one request frame, one response frame.
 */
class FrameClient {
public:
    Result<void, LinkError> connect(const std::string& host, uint16_t port,
                                    std::chrono::milliseconds timeout);

    /// Sends `request` and reads the reply; `timeout` bounds both directions together.
    Result<std::vector<uint8_t>, LinkError> exchange(const std::vector<uint8_t>& request,
                                                     std::chrono::milliseconds timeout);

    void close() noexcept { socket_.reset(); }
    [[nodiscard]] bool is_connected() const noexcept { return socket_.valid(); }

private:
    Socket socket_;
};

/// True if a TCP connection to host:port completes within `timeout`.
[[nodiscard]] bool endpoint_reachable(const std::string& host, uint16_t port,
                                      std::chrono::milliseconds timeout);

/**
 * @brief Server side: accepts connections and answers each on a worker pool.
 *
 * A slow handler occupies one worker; other callers keep being served as
 * long as workers are free. stop() waits for in-flight answers to finish.
 */
class FrameServer {
public:
    using Handler = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

    static constexpr int DEFAULT_BACKLOG = 16;

    explicit FrameServer(size_t worker_count = 4);
    ~FrameServer();

    FrameServer(const FrameServer&) = delete;
    FrameServer& operator=(const FrameServer&) = delete;

    /// Port 0 binds an ephemeral port. Returns the bound port.
    Result<uint16_t, LinkError> listen(const std::string& bind_address, uint16_t port,
                                       int backlog = DEFAULT_BACKLOG);

    /// Starts accepting. `request_timeout` bounds reading a request and writing its reply.
    void serve(Handler handler, std::chrono::milliseconds request_timeout = std::chrono::seconds(10));
    void stop();

    [[nodiscard]] bool is_listening() const noexcept { return listening_.load(); }
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

    /// Connections closed without a complete request/reply exchange.
    [[nodiscard]] uint64_t dropped_connections() const noexcept { return dropped_.load(); }

private:
    void accept_loop(std::stop_token stop, std::chrono::milliseconds request_timeout);
    void answer(const Socket& conn, std::chrono::milliseconds request_timeout);

    size_t worker_count_;
    Socket listener_;
    uint16_t bound_port_ = 0;
    std::atomic<bool> listening_{false};
    std::atomic<uint64_t> dropped_{0};
    Handler handler_;
    std::unique_ptr<ThreadPool> workers_;
    std::jthread accept_thread_;
};

}  // namespace hybrid_router
