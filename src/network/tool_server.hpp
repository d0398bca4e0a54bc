/**
 * @file tool_server.hpp
 * @brief Backend side of remote execution: serves local tools over TCP.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/local_executor.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace hybrid_router {

/**
 * @brief Exposes a LocalExecutor's registry through the tool call protocol.
 *
 * This is what a router's RemoteExecutor talks to. Each connection is
 * answered on one of `worker_count` server workers, so a slow tool holds
 * up only its own caller.
 */
class ToolServer {
public:
    ToolServer(LocalExecutor& executor, Logger& logger, size_t worker_count = 4);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    Result<void> start(uint16_t port, const std::string& bind_address = "0.0.0.0");
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return server_.is_listening(); }
    [[nodiscard]] uint16_t port() const noexcept { return server_.bound_port(); }
    [[nodiscard]] uint64_t requests_served() const noexcept { return served_.load(); }

    /// Decodes one request frame, runs the tool and encodes the response.
    std::vector<uint8_t> handle(const std::vector<uint8_t>& request);

private:
    LocalExecutor& executor_;
    Logger& logger_;
    FrameServer server_;
    std::atomic<uint64_t> served_{0};
};

}  // namespace hybrid_router
