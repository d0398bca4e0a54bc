/**
 * @file remote_executor.cpp
 * @brief TcpRemoteExecutor implementation.
 */

#include "executor/remote_executor.hpp"

#include "network/tool_call_codec.hpp"
#include "network/transport.hpp"

#include <algorithm>

namespace hybrid_router {

TcpRemoteExecutor::TcpRemoteExecutor(std::string host, uint16_t port,
                                     uint32_t connect_timeout_ms, Logger& logger)
    : host_(std::move(host))
    , port_(port)
    , connect_timeout_ms_(connect_timeout_ms)
    , logger_(logger) {}

Result<Json> TcpRemoteExecutor::invoke(const ToolName& tool, const Json& parameters,
                                       std::chrono::milliseconds timeout) {
    ++calls_;

    auto endpoint = host_ + ":" + std::to_string(port_);
    auto connect_timeout = std::min(std::chrono::milliseconds(connect_timeout_ms_),
                                    std::max(timeout, std::chrono::milliseconds(1)));

    FrameClient client;
    if (auto connected = client.connect(host_, port_, connect_timeout); !connected) {
        return Error{ErrorKind::RemoteUnreachable, endpoint + ": " + connected.error().message};
    }

    auto request = ToolCallCodec::encode_request(ToolCallRequest{.tool = tool, .parameters = parameters});
    auto reply = client.exchange(request, timeout);
    client.close();
    if (!reply) {
        const auto& link = reply.error();
        switch (link.failure) {
            case LinkFailure::Timeout:
                logger_.warn("remote_executor", "Backend " + endpoint + " is slow: no answer for '"
                             + tool + "' within " + std::to_string(timeout.count()) + "ms");
                return Error{ErrorKind::RemoteExecutionFailed,
                             "Backend did not answer '" + tool + "' within "
                             + std::to_string(timeout.count()) + "ms"};
            case LinkFailure::Oversize:
                return Error{ErrorKind::RemoteExecutionFailed, link.message};
            case LinkFailure::Connect:
            case LinkFailure::Closed:
                break;
        }
        return Error{ErrorKind::RemoteUnreachable, endpoint + ": " + link.message};
    }

    ToolCallResponse response;
    if (!ToolCallCodec::decode_response(*reply, response)) {
        return Error{ErrorKind::RemoteExecutionFailed, "Malformed response for '" + tool + "'"};
    }

    switch (response.status) {
        case CallStatus::Ok:
            return std::move(response.result);
        case CallStatus::UnknownTool:
            logger_.warn("remote_executor", "Backend does not know tool '" + tool + "'");
            return Error{ErrorKind::RemoteExecutionFailed,
                         "Backend rejected unknown tool: " + response.error_message};
        case CallStatus::InvalidParameters:
            return Error{ErrorKind::RemoteExecutionFailed,
                         "Backend rejected parameters: " + response.error_message};
        case CallStatus::ExecutionError:
            break;
    }
    return Error{ErrorKind::RemoteExecutionFailed, response.error_message};
}

}  // namespace hybrid_router
