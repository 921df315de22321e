#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace uma::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Output of Encrypt is `ciphertext || tag` (16 byte tag). The nonce length is
 * taken from the nonce span; ECIES payloads use 16 byte nonces.
 *
 * The caller must never reuse a (key, nonce) pair. Every ECIES payload
 * derives a fresh key from a fresh ephemeral key pair, so reuse cannot
 * happen there.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
