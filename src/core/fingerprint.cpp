/**
 * @file fingerprint.cpp
 * @brief Fingerprint computation.
 */

#include "core/fingerprint.hpp"

#include <cstdio>

namespace hybrid_router {

namespace {

constexpr std::string_view kSchemaTag = "InvocationRequest/v1";
constexpr uint8_t kFieldSeparator = 0x1F;

}  // anonymous namespace

Result<Json> normalize_parameters(const Json& parameters) {
    if (parameters.is_null()) {
        return Json::object();
    }
    if (!parameters.is_object()) {
        return Error{ErrorKind::InvalidParameters,
                     std::string{"parameters must be an object, got "} + parameters.type_name()};
    }
    return parameters;
}

std::string canonical_serialization(const Json& parameters) {
    // nlohmann::json objects are std::map backed, so keys are already ordered.
    // Invalid UTF-8 is replaced rather than thrown on.
    return parameters.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Fingerprint compute_fingerprint(std::string_view tool, const Json& parameters) {
    Fnv1a64 hasher;
    hasher.update(kSchemaTag);
    hasher.update_u8(kFieldSeparator);
    hasher.update(tool);
    hasher.update_u8(kFieldSeparator);
    hasher.update(canonical_serialization(parameters));

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(hasher.value()));
    return Fingerprint{buf};
}

}  // namespace hybrid_router
