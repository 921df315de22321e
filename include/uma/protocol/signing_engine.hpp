#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/protocol/backing_signature.hpp"
#include "uma/protocol/invoice.hpp"
#include "uma/protocol/lnurlp_request.hpp"
#include "uma/protocol/lnurlp_response.hpp"
#include "uma/protocol/pay_req_response.hpp"
#include "uma/protocol/pay_request.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/**
 * @brief Signatures, travel-rule encryption and backing-signature chains
 *
 * Signatures are hex-encoded DER ECDSA over SHA-256 of the canonical
 * payload, on secp256k1. A backing signature covers exactly the payload of
 * the primary signature; earlier backing signatures are never part of it.
 *
 * @code
 *   auto signature = SigningEngine::Sign(request.SignablePayload(), private_key);
 *   auto signed_request = request.SignedWith(std::move(signature).Unwrap());
 *   bool valid = SigningEngine::Verify(signed_request.SignablePayload(),
 *       signed_request.signature, sender_public_key);
 * @endcode
 */
class SigningEngine {
public:
    using PublicKeyLookup = std::function<Result<std::vector<uint8_t>, UmaFailure>(std::string_view domain)>;

    [[nodiscard]] static Result<std::string, UmaFailure> Sign(
        std::string_view payload,
        std::span<const uint8_t> private_key);

    /// False for a mismatching signature and for malformed hex, signature
    /// or key material alike.
    [[nodiscard]] static bool Verify(
        std::string_view payload,
        std::string_view hex_signature,
        std::span<const uint8_t> public_key);

    /// ECIES to the receiver's encryption key; hex ciphertext.
    [[nodiscard]] static Result<std::string, UmaFailure> EncryptCompliancePayload(
        std::string_view plaintext,
        std::span<const uint8_t> recipient_public_key);

    [[nodiscard]] static Result<std::string, UmaFailure> DecryptCompliancePayload(
        std::string_view hex_ciphertext,
        std::span<const uint8_t> recipient_private_key);

    [[nodiscard]] static Result<UmaLnurlpRequest, UmaFailure> AppendBackingSignature(
        const UmaLnurlpRequest& request,
        std::span<const uint8_t> private_key,
        std::string_view domain);

    [[nodiscard]] static Result<UmaLnurlpResponse, UmaFailure> AppendBackingSignature(
        const UmaLnurlpResponse& response,
        std::span<const uint8_t> private_key,
        std::string_view domain);

    /// V1 only; the entry lands in payerData.compliance.backingSignatures.
    [[nodiscard]] static Result<PayRequest, UmaFailure> AppendBackingSignature(
        const PayRequest& request,
        std::span<const uint8_t> private_key,
        std::string_view domain);

    /// V1 only; the entry lands in payeeData.compliance.backingSignatures.
    [[nodiscard]] static Result<PayReqResponse, UmaFailure> AppendBackingSignature(
        const PayReqResponse& response,
        std::span<const uint8_t> private_key,
        std::string_view domain,
        std::string_view payer_identifier);

    /**
     * @brief Checks every backing signature against `payload`
     *
     * Ok(false) as soon as one entry fails to verify. Key lookup failures
     * are returned unchanged. An empty chain is valid.
     */
    [[nodiscard]] static Result<bool, UmaFailure> VerifyBackingSignatures(
        std::string_view payload,
        std::span<const BackingSignature> backing_signatures,
        const PublicKeyLookup& lookup);

    /// Signs the invoice TLV stream without its signature record.
    [[nodiscard]] static Result<Invoice, UmaFailure> SignInvoice(
        const Invoice& invoice,
        std::span<const uint8_t> private_key);

    [[nodiscard]] static Result<bool, UmaFailure> VerifyInvoiceSignature(
        const Invoice& invoice,
        std::span<const uint8_t> public_key);

private:
    SigningEngine() = delete;

    [[nodiscard]] static std::span<const uint8_t> AsBytes(std::string_view text) noexcept;
};

} // namespace uma::protocol
