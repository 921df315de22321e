#include "uma/protocol/pub_key_response.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "uma/crypto/x509_certificate.hpp"
#include "uma/core/format.hpp"

namespace uma::protocol {

    using crypto::SodiumInterop;
    using crypto::X509Certificate;
    using utilities::Json;
    using utilities::JsonObject;

    namespace {

        constexpr ErrorCode kParseError = ErrorCode::CounterpartyPubkeyFetchError;

        Result<std::optional<std::vector<uint8_t>>, UmaFailure> OptionalHexKey(
            const JsonObject& object, const std::string_view key) {
            using OptionalKey = std::optional<std::vector<uint8_t>>;
            UMA_TRY_ASSIGN(const auto hex, Json::GetOptionalString(object, key, kParseError));
            if (!hex.has_value()) {
                return Result<OptionalKey, UmaFailure>::Ok(std::nullopt);
            }
            auto bytes = SodiumInterop::FromHex(*hex);
            if (bytes.IsErr()) {
                return Result<OptionalKey, UmaFailure>::Err(UmaFailure::InvalidPubKeyFormat(
                    compat::format("{} is not valid hex", key)));
            }
            return Result<OptionalKey, UmaFailure>::Ok(std::move(bytes).Unwrap());
        }

    }

    PubKeyResponse PubKeyResponse::FromKeys(
        std::vector<uint8_t> signing_pub_key,
        std::vector<uint8_t> encryption_pub_key,
        const std::optional<int64_t> expiration_timestamp) {
        PubKeyResponse response;
        response.signing_pub_key_ = std::move(signing_pub_key);
        response.encryption_pub_key_ = std::move(encryption_pub_key);
        response.expiration_timestamp_ = expiration_timestamp;
        return response;
    }

    PubKeyResponse PubKeyResponse::FromCertificates(
        std::string signing_cert_chain,
        std::string encryption_cert_chain,
        const std::optional<int64_t> expiration_timestamp) {
        PubKeyResponse response;
        response.signing_cert_chain_ = std::move(signing_cert_chain);
        response.encryption_cert_chain_ = std::move(encryption_cert_chain);
        response.expiration_timestamp_ = expiration_timestamp;
        return response;
    }

    Result<std::vector<uint8_t>, UmaFailure> PubKeyResponse::ResolveKey(
        const std::optional<std::string>& cert_chain,
        const std::optional<std::vector<uint8_t>>& raw_key,
        const std::string_view purpose) {
        if (cert_chain.has_value()) {
            return X509Certificate::ExtractLeafPublicKey(*cert_chain);
        }
        if (raw_key.has_value()) {
            return Result<std::vector<uint8_t>, UmaFailure>::Ok(*raw_key);
        }
        return Result<std::vector<uint8_t>, UmaFailure>::Err(
            UmaFailure::InvalidPubKeyFormat(compat::format("No {} public key", purpose)));
    }

    Result<std::vector<uint8_t>, UmaFailure> PubKeyResponse::GetSigningPublicKey() const {
        return ResolveKey(signing_cert_chain_, signing_pub_key_, "signing");
    }

    Result<std::vector<uint8_t>, UmaFailure> PubKeyResponse::GetEncryptionPublicKey() const {
        return ResolveKey(encryption_cert_chain_, encryption_pub_key_, "encryption");
    }

    JsonObject PubKeyResponse::ToJsonObject() const {
        JsonObject object;
        if (signing_cert_chain_.has_value()) {
            Json::SetString(object, "signingCertificate", *signing_cert_chain_);
        }
        if (encryption_cert_chain_.has_value()) {
            Json::SetString(object, "encryptionCertificate", *encryption_cert_chain_);
        }
        if (signing_pub_key_.has_value()) {
            Json::SetString(object, "signingPubKey", SodiumInterop::ToHex(*signing_pub_key_));
        }
        if (encryption_pub_key_.has_value()) {
            Json::SetString(object, "encryptionPubKey", SodiumInterop::ToHex(*encryption_pub_key_));
        }
        if (expiration_timestamp_.has_value()) {
            Json::SetInt64(object, "expirationTimestamp", *expiration_timestamp_);
        }
        return object;
    }

    Result<std::string, UmaFailure> PubKeyResponse::ToJson() const {
        return Json::Serialize(ToJsonObject());
    }

    Result<PubKeyResponse, UmaFailure> PubKeyResponse::FromJson(const std::string_view json) {
        UMA_TRY_ASSIGN(const auto object, Json::ParseObject(json, kParseError));
        PubKeyResponse response;
        UMA_TRY_ASSIGN(response.signing_cert_chain_,
            Json::GetOptionalString(object, "signingCertificate", kParseError));
        UMA_TRY_ASSIGN(response.encryption_cert_chain_,
            Json::GetOptionalString(object, "encryptionCertificate", kParseError));
        UMA_TRY_ASSIGN(response.signing_pub_key_, OptionalHexKey(object, "signingPubKey"));
        UMA_TRY_ASSIGN(response.encryption_pub_key_, OptionalHexKey(object, "encryptionPubKey"));
        UMA_TRY_ASSIGN(response.expiration_timestamp_,
            Json::GetOptionalInt64(object, "expirationTimestamp", kParseError));
        return Result<PubKeyResponse, UmaFailure>::Ok(std::move(response));
    }

}
