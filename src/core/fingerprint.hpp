/**
 * @file fingerprint.hpp
 * @brief Deterministic fingerprints for (tool, parameters) pairs.
 *
 * The fingerprint keys the result cache and deduplicates offline queue
 * jobs, so it must be stable across processes: FNV-1a 64 over a tagged,
 * canonical serialization of the request.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string_view>

namespace hybrid_router {

/**
 * @brief Incremental 64-bit FNV-1a hasher.
 */
class Fnv1a64 {
public:
    static constexpr uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr uint64_t kPrime = 0x100000001b3ULL;

    void update(std::string_view bytes) noexcept {
        for (unsigned char c : bytes) {
            state_ ^= c;
            state_ *= kPrime;
        }
    }

    void update_u8(uint8_t byte) noexcept {
        state_ ^= byte;
        state_ *= kPrime;
    }

    [[nodiscard]] uint64_t value() const noexcept { return state_; }

private:
    uint64_t state_{kOffsetBasis};
};

/**
 * @brief Normalizes a parameter value: null becomes an empty object.
 *
 * Returns InvalidParameters for anything that is not a JSON object.
 */
[[nodiscard]] Result<Json> normalize_parameters(const Json& parameters);

/**
 * @brief Canonical text form of a parameter object (sorted keys, compact).
 */
[[nodiscard]] std::string canonical_serialization(const Json& parameters);

/**
 * @brief Computes the 16-hex-digit fingerprint of a request.
 */
[[nodiscard]] Fingerprint compute_fingerprint(std::string_view tool, const Json& parameters);

}  // namespace hybrid_router
