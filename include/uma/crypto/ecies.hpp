#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace uma::protocol::crypto {

/**
 * ECIES over secp256k1, byte compatible with the eciesrs layout:
 *
 *   ephemeral_public_key (65) || nonce (16) || tag (16) || ciphertext
 *
 * The AES-256-GCM key is HKDF-SHA256(ephemeral_public_key || shared_point)
 * with both points uncompressed, no salt and no info.
 */
class Ecies {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> recipient_public_key);

    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> Decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> recipient_private_key);

private:
    Ecies() = delete;
};

}
