/**
 * @file remote_executor.hpp
 * @brief Remote tool invocation against a backend service.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace hybrid_router {

/**
 * @brief Abstract remote execution endpoint.
 *
 * Implementations must report connectivity problems as
 * ErrorKind::RemoteUnreachable and tool-level failures as
 * ErrorKind::RemoteExecutionFailed. A backend that accepted the call but
 * did not answer within the timeout is reachable, so it reports the latter. Virtual dispatch here costs nothing
 * next to a network round trip.
 */
class IRemoteExecutor {
public:
    virtual ~IRemoteExecutor() = default;

    virtual Result<Json> invoke(const ToolName& tool, const Json& parameters,
                                std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Talks to a ToolServer over one TCP connection per call.
 *
 * The connect attempt is bounded by min(connect_timeout, timeout); the
 * request and reply frames together are bounded by `timeout`.
 */
class TcpRemoteExecutor : public IRemoteExecutor {
public:
    TcpRemoteExecutor(std::string host, uint16_t port, uint32_t connect_timeout_ms,
                      Logger& logger);

    Result<Json> invoke(const ToolName& tool, const Json& parameters,
                        std::chrono::milliseconds timeout) override;

    [[nodiscard]] uint64_t call_count() const noexcept { return calls_.load(); }

private:
    std::string host_;
    uint16_t port_;
    uint32_t connect_timeout_ms_;
    Logger& logger_;
    std::atomic<uint64_t> calls_{0};
};

}  // namespace hybrid_router
