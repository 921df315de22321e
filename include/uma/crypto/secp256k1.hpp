#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace uma::protocol::crypto {

struct Secp256k1KeyPair {
    std::vector<uint8_t> private_key;
    std::vector<uint8_t> public_key;
};

/**
 * @brief ECDSA and point arithmetic on secp256k1 through OpenSSL 3.
 *
 * Private keys are 32 byte big-endian scalars. Public keys are accepted in
 * compressed (33 byte) or uncompressed (65 byte) SEC1 form and always
 * returned uncompressed.
 *
 * Signatures are DER encoded ECDSA over SHA-256 of the message and are
 * normalized to low-S, so verifiers that reject malleable signatures accept
 * them.
 */
class Secp256k1 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> DerivePublicKey(
        std::span<const uint8_t> private_key);

    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> NormalizePublicKey(
        std::span<const uint8_t> public_key);

    [[nodiscard]] static Result<Secp256k1KeyPair, UmaFailure> GenerateKeyPair();

    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> Sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> private_key);

    /// Returns false for malformed keys or signatures as well as for a
    /// signature that does not match.
    [[nodiscard]] static bool Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> der_signature,
        std::span<const uint8_t> public_key);

    /// Multiplies the peer point by the private scalar; returns the full
    /// uncompressed shared point.
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> ComputeSharedPoint(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

private:
    Secp256k1() = delete;
};

}
