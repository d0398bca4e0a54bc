/**
 * @file tool_call_codec.hpp
 * @brief Binary framing of remote tool calls.
 *
 * Carried as the payload of one FrameClient/FrameServer frame. All multi-byte
 * integers are big-endian.
 *
 *   Request:  [4B tool_len][tool][4B params_len][params JSON]
 *   Response: [1B status][4B body_len][body]
 *             status 0 = ok (body is the result JSON),
 *             otherwise body is the error text.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hybrid_router {

enum class CallStatus : uint8_t {
    Ok = 0,
    ExecutionError = 1,
    UnknownTool = 2,
    InvalidParameters = 3
};

struct ToolCallRequest {
    ToolName tool;
    Json parameters;
};

struct ToolCallResponse {
    CallStatus status{CallStatus::Ok};
    Json result;                ///< Valid when status == Ok
    std::string error_message;  ///< Valid otherwise
};

struct ToolCallCodec {
    static std::vector<uint8_t> encode_request(const ToolCallRequest& request);
    static bool decode_request(const std::vector<uint8_t>& data, ToolCallRequest& out);

    static std::vector<uint8_t> encode_response(const ToolCallResponse& response);
    static bool decode_response(const std::vector<uint8_t>& data, ToolCallResponse& out);

    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace hybrid_router
