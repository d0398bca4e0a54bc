/**
 * @file tool_call_codec.cpp
 * @brief ToolCallCodec binary serialization.
 */

#include "network/tool_call_codec.hpp"

namespace hybrid_router {

namespace {

/// Reads a [4B len][bytes] field starting at `offset`; advances it on success.
bool read_field(const std::vector<uint8_t>& data, size_t& offset, std::string& out) {
    if (data.size() < offset + 4) return false;
    uint32_t len = ToolCallCodec::get_u32(data.data() + offset);
    offset += 4;
    if (data.size() - offset < len) return false;
    out.assign(reinterpret_cast<const char*>(data.data() + offset), len);
    offset += len;
    return true;
}

void write_field(std::vector<uint8_t>& buf, const std::string& field) {
    ToolCallCodec::put_u32(buf, static_cast<uint32_t>(field.size()));
    buf.insert(buf.end(), field.begin(), field.end());
}

}  // anonymous namespace

void ToolCallCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint32_t ToolCallCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

std::vector<uint8_t> ToolCallCodec::encode_request(const ToolCallRequest& request) {
    auto params = request.parameters.dump(-1, ' ', false, Json::error_handler_t::replace);

    std::vector<uint8_t> buf;
    buf.reserve(8 + request.tool.size() + params.size());
    write_field(buf, request.tool);
    write_field(buf, params);
    return buf;
}

bool ToolCallCodec::decode_request(const std::vector<uint8_t>& data, ToolCallRequest& out) {
    size_t offset = 0;
    std::string tool;
    std::string params;
    if (!read_field(data, offset, tool)) return false;
    if (!read_field(data, offset, params)) return false;
    if (offset != data.size() || tool.empty()) return false;

    auto parsed = Json::parse(params, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return false;

    out.tool = std::move(tool);
    out.parameters = std::move(parsed);
    return true;
}

// ─────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────

std::vector<uint8_t> ToolCallCodec::encode_response(const ToolCallResponse& response) {
    std::string body = response.status == CallStatus::Ok
        ? response.result.dump(-1, ' ', false, Json::error_handler_t::replace)
        : response.error_message;

    std::vector<uint8_t> buf;
    buf.reserve(5 + body.size());
    buf.push_back(static_cast<uint8_t>(response.status));
    write_field(buf, body);
    return buf;
}

bool ToolCallCodec::decode_response(const std::vector<uint8_t>& data, ToolCallResponse& out) {
    if (data.empty()) return false;
    uint8_t status = data[0];
    if (status > static_cast<uint8_t>(CallStatus::InvalidParameters)) return false;

    size_t offset = 1;
    std::string body;
    if (!read_field(data, offset, body)) return false;
    if (offset != data.size()) return false;

    out.status = static_cast<CallStatus>(status);
    if (out.status == CallStatus::Ok) {
        auto parsed = Json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded()) return false;
        out.result = std::move(parsed);
        out.error_message.clear();
    } else {
        out.result = Json{};
        out.error_message = std::move(body);
    }
    return true;
}

}  // namespace hybrid_router
