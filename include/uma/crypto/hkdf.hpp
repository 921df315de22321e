#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace uma::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF.
 *
 * Used by ECIES to turn the ephemeral public key and the shared point into
 * an AES-256 key.
 */
class Hkdf {
public:
    static Result<Unit, UmaFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, UmaFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace uma::protocol::crypto
