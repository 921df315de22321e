#include "uma/protocol/signing_engine.hpp"
#include "uma/crypto/ecies.hpp"
#include "uma/crypto/secp256k1.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "uma/debug/protocol_logger.hpp"

namespace uma::protocol {

    using crypto::Ecies;
    using crypto::Secp256k1;
    using crypto::SodiumInterop;

    std::span<const uint8_t> SigningEngine::AsBytes(const std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Result<std::string, UmaFailure> SigningEngine::Sign(
        const std::string_view payload,
        const std::span<const uint8_t> private_key) {
        UMA_TRY_ASSIGN(const auto der, Secp256k1::Sign(AsBytes(payload), private_key));
        return Result<std::string, UmaFailure>::Ok(SodiumInterop::ToHex(der));
    }

    bool SigningEngine::Verify(
        const std::string_view payload,
        const std::string_view hex_signature,
        const std::span<const uint8_t> public_key) {
        auto der = SodiumInterop::FromHex(hex_signature);
        if (der.IsErr()) {
            debug::LogSignatureCheck(payload, hex_signature, false);
            return false;
        }
        const bool valid = Secp256k1::Verify(AsBytes(payload), der.Unwrap(), public_key);
        debug::LogSignatureCheck(payload, hex_signature, valid);
        return valid;
    }

    Result<std::string, UmaFailure> SigningEngine::EncryptCompliancePayload(
        const std::string_view plaintext,
        const std::span<const uint8_t> recipient_public_key) {
        UMA_TRY_ASSIGN(const auto ciphertext, Ecies::Encrypt(AsBytes(plaintext), recipient_public_key));
        return Result<std::string, UmaFailure>::Ok(SodiumInterop::ToHex(ciphertext));
    }

    Result<std::string, UmaFailure> SigningEngine::DecryptCompliancePayload(
        const std::string_view hex_ciphertext,
        const std::span<const uint8_t> recipient_private_key) {
        UMA_TRY_ASSIGN(const auto ciphertext, SodiumInterop::FromHex(hex_ciphertext));
        UMA_TRY_ASSIGN(auto plaintext, Ecies::Decrypt(ciphertext, recipient_private_key));
        std::string text(plaintext.begin(), plaintext.end());
        if (auto wipe = SodiumInterop::SecureWipe(plaintext); wipe.IsErr()) {
            return Result<std::string, UmaFailure>::Err(UmaFailure::FromSodiumFailure(wipe.UnwrapErr()));
        }
        return Result<std::string, UmaFailure>::Ok(std::move(text));
    }

    Result<UmaLnurlpRequest, UmaFailure> SigningEngine::AppendBackingSignature(
        const UmaLnurlpRequest& request,
        const std::span<const uint8_t> private_key,
        const std::string_view domain) {
        UMA_TRY_ASSIGN(auto signature, Sign(request.SignablePayload(), private_key));
        return Result<UmaLnurlpRequest, UmaFailure>::Ok(
            request.WithBackingSignature(BackingSignature{std::string(domain), std::move(signature)}));
    }

    Result<UmaLnurlpResponse, UmaFailure> SigningEngine::AppendBackingSignature(
        const UmaLnurlpResponse& response,
        const std::span<const uint8_t> private_key,
        const std::string_view domain) {
        UMA_TRY_ASSIGN(auto signature, Sign(response.SignablePayload(), private_key));
        return Result<UmaLnurlpResponse, UmaFailure>::Ok(
            response.WithBackingSignature(BackingSignature{std::string(domain), std::move(signature)}));
    }

    Result<PayRequest, UmaFailure> SigningEngine::AppendBackingSignature(
        const PayRequest& request,
        const std::span<const uint8_t> private_key,
        const std::string_view domain) {
        if (request.IsV0()) {
            return Result<PayRequest, UmaFailure>::Err(
                UmaFailure::InvalidInput("Legacy pay requests do not carry backing signatures"));
        }
        UMA_TRY_ASSIGN(const auto payload, request.SignablePayload());
        UMA_TRY_ASSIGN(auto signature, Sign(payload, private_key));

        const PayerData& payer_data = *request.GetPayerData();
        CompliancePayerData compliance = *payer_data.Compliance();
        if (!compliance.backing_signatures.has_value()) {
            compliance.backing_signatures.emplace();
        }
        compliance.backing_signatures->push_back(BackingSignature{std::string(domain), std::move(signature)});
        return Result<PayRequest, UmaFailure>::Ok(
            request.WithPayerData(payer_data.WithCompliance(std::move(compliance))));
    }

    Result<PayReqResponse, UmaFailure> SigningEngine::AppendBackingSignature(
        const PayReqResponse& response,
        const std::span<const uint8_t> private_key,
        const std::string_view domain,
        const std::string_view payer_identifier) {
        if (response.IsV0()) {
            return Result<PayReqResponse, UmaFailure>::Err(
                UmaFailure::InvalidInput("Legacy pay responses do not carry backing signatures"));
        }
        UMA_TRY_ASSIGN(const auto payload, response.SignablePayload(payer_identifier));
        UMA_TRY_ASSIGN(auto signature, Sign(payload, private_key));

        CompliancePayeeData compliance = *response.AsV1().payee_data->Compliance();
        if (!compliance.backing_signatures.has_value()) {
            compliance.backing_signatures.emplace();
        }
        compliance.backing_signatures->push_back(BackingSignature{std::string(domain), std::move(signature)});
        return response.WithPayeeCompliance(std::move(compliance));
    }

    Result<bool, UmaFailure> SigningEngine::VerifyBackingSignatures(
        const std::string_view payload,
        const std::span<const BackingSignature> backing_signatures,
        const PublicKeyLookup& lookup) {
        for (const auto& backing : backing_signatures) {
            UMA_TRY_ASSIGN(const auto public_key, lookup(backing.domain));
            if (!Verify(payload, backing.signature, public_key)) {
                UMA_LOG_VALUE(debug::Component::Signing, "BACKING", "rejected domain", backing.domain);
                return Result<bool, UmaFailure>::Ok(false);
            }
        }
        return Result<bool, UmaFailure>::Ok(true);
    }

    Result<Invoice, UmaFailure> SigningEngine::SignInvoice(
        const Invoice& invoice,
        const std::span<const uint8_t> private_key) {
        UMA_TRY_ASSIGN(const auto payload, invoice.SignablePayload());
        UMA_TRY_ASSIGN(auto signature, Secp256k1::Sign(payload, private_key));
        return Result<Invoice, UmaFailure>::Ok(invoice.WithSignature(std::move(signature)));
    }

    Result<bool, UmaFailure> SigningEngine::VerifyInvoiceSignature(
        const Invoice& invoice,
        const std::span<const uint8_t> public_key) {
        if (!invoice.Signature().has_value()) {
            return Result<bool, UmaFailure>::Err(UmaFailure::InvoiceMissingFields({"signature"}));
        }
        UMA_TRY_ASSIGN(const auto payload, invoice.SignablePayload());
        return Result<bool, UmaFailure>::Ok(Secp256k1::Verify(payload, *invoice.Signature(), public_key));
    }

}
