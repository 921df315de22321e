#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/**
 * @brief Body served at `/.well-known/lnurlpubkey`
 *
 * A VASP publishes either PEM certificate chains or raw uncompressed
 * secp256k1 keys (hex on the wire). When a chain is present its leaf
 * certificate is authoritative for the key bytes.
 */
class PubKeyResponse {
public:
    PubKeyResponse() = default;

    [[nodiscard]] static PubKeyResponse FromKeys(
        std::vector<uint8_t> signing_pub_key,
        std::vector<uint8_t> encryption_pub_key,
        std::optional<int64_t> expiration_timestamp = std::nullopt);

    [[nodiscard]] static PubKeyResponse FromCertificates(
        std::string signing_cert_chain,
        std::string encryption_cert_chain,
        std::optional<int64_t> expiration_timestamp = std::nullopt);

    /// Derived from the signing certificate when present, otherwise the raw
    /// key. INVALID_PUBKEY_FORMAT when neither is available.
    [[nodiscard]] Result<std::vector<uint8_t>, UmaFailure> GetSigningPublicKey() const;
    [[nodiscard]] Result<std::vector<uint8_t>, UmaFailure> GetEncryptionPublicKey() const;

    [[nodiscard]] const std::optional<std::string>& SigningCertChain() const noexcept { return signing_cert_chain_; }
    [[nodiscard]] const std::optional<std::string>& EncryptionCertChain() const noexcept {
        return encryption_cert_chain_;
    }
    [[nodiscard]] const std::optional<int64_t>& ExpirationTimestamp() const noexcept {
        return expiration_timestamp_;
    }

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const;
    [[nodiscard]] static Result<PubKeyResponse, UmaFailure> FromJson(std::string_view json);

    bool operator==(const PubKeyResponse&) const = default;

private:
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> ResolveKey(
        const std::optional<std::string>& cert_chain,
        const std::optional<std::vector<uint8_t>>& raw_key,
        std::string_view purpose);

    std::optional<std::string> signing_cert_chain_;
    std::optional<std::string> encryption_cert_chain_;
    std::optional<std::vector<uint8_t>> signing_pub_key_;
    std::optional<std::vector<uint8_t>> encryption_pub_key_;
    std::optional<int64_t> expiration_timestamp_;
};

} // namespace uma::protocol
