/**
 * @file tool_server.cpp
 * @brief ToolServer implementation.
 */

#include "network/tool_server.hpp"

#include "network/tool_call_codec.hpp"

namespace hybrid_router {

ToolServer::ToolServer(LocalExecutor& executor, Logger& logger, size_t worker_count)
    : executor_(executor), logger_(logger), server_(worker_count) {}

ToolServer::~ToolServer() {
    stop();
}

Result<void> ToolServer::start(uint16_t port, const std::string& bind_address) {
    auto listening = server_.listen(bind_address, port);
    if (!listening) {
        return Error{ErrorKind::ConfigError, "Cannot serve on " + bind_address + ":"
                     + std::to_string(port) + ": " + listening.error().message};
    }

    server_.serve([this](const std::vector<uint8_t>& request) {
        return handle(request);
    });
    logger_.info("tool_server", "Serving " + std::to_string(executor_.tool_names().size())
                 + " tools on " + bind_address + ":" + std::to_string(*listening));
    return Result<void>{};
}

void ToolServer::stop() {
    if (!server_.is_listening()) return;
    server_.stop();
    logger_.info("tool_server", "Stopped after " + std::to_string(served_.load()) + " requests ("
                 + std::to_string(server_.dropped_connections()) + " connections dropped)");
}

std::vector<uint8_t> ToolServer::handle(const std::vector<uint8_t>& request) {
    ++served_;

    ToolCallRequest call;
    if (!ToolCallCodec::decode_request(request, call)) {
        logger_.warn("tool_server", "Rejected malformed request frame");
        return ToolCallCodec::encode_response(ToolCallResponse{
            .status = CallStatus::InvalidParameters,
            .error_message = "Malformed request"
        });
    }

    if (!call.parameters.is_object()) {
        return ToolCallCodec::encode_response(ToolCallResponse{
            .status = CallStatus::InvalidParameters,
            .error_message = "Parameters must be an object"
        });
    }

    logger_.debug("tool_server", "Executing '" + call.tool + "'");
    auto result = executor_.invoke_inline(call.tool, call.parameters);
    if (result) {
        return ToolCallCodec::encode_response(ToolCallResponse{
            .status = CallStatus::Ok,
            .result = std::move(*result)
        });
    }

    const auto& err = result.error();
    CallStatus status = CallStatus::ExecutionError;
    if (err.kind == ErrorKind::UnknownTool) status = CallStatus::UnknownTool;
    if (err.kind == ErrorKind::InvalidParameters) status = CallStatus::InvalidParameters;

    logger_.warn("tool_server", "Tool '" + call.tool + "' failed: " + err.message);
    return ToolCallCodec::encode_response(ToolCallResponse{
        .status = status,
        .error_message = err.message
    });
}

}  // namespace hybrid_router
