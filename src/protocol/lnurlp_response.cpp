#include "uma/protocol/lnurlp_response.hpp"
#include "uma/protocol/canonical_payload.hpp"
#include "uma/protocol/constants.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    namespace {

        constexpr ErrorCode kParseError = ErrorCode::ParseLnurlpResponseError;

    }

    std::string LnurlComplianceResponse::SignablePayload() const {
        return CanonicalPayload::ForLnurlpComplianceResponse(receiver_identifier, signature_nonce, signature_timestamp);
    }

    LnurlComplianceResponse LnurlComplianceResponse::SignedWith(std::string new_signature) const {
        LnurlComplianceResponse copy = *this;
        copy.signature = std::move(new_signature);
        return copy;
    }

    JsonObject LnurlComplianceResponse::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "kycStatus", KycStatusToString(kyc_status));
        Json::SetString(object, "signature", signature);
        Json::SetString(object, "signatureNonce", signature_nonce);
        Json::SetInt64(object, "signatureTimestamp", signature_timestamp);
        Json::SetBool(object, "isSubjectToTravelRule", is_subject_to_travel_rule);
        Json::SetString(object, "receiverIdentifier", receiver_identifier);
        return object;
    }

    Result<LnurlComplianceResponse, UmaFailure> LnurlComplianceResponse::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        LnurlComplianceResponse compliance;
        UMA_TRY_ASSIGN(const std::string kyc, Json::GetString(object, "kycStatus", error_code));
        compliance.kyc_status = KycStatusFromString(kyc);
        UMA_TRY_ASSIGN(compliance.signature, Json::GetString(object, "signature", error_code));
        UMA_TRY_ASSIGN(compliance.signature_nonce, Json::GetString(object, "signatureNonce", error_code));
        UMA_TRY_ASSIGN(compliance.signature_timestamp, Json::GetInt64(object, "signatureTimestamp", error_code));
        UMA_TRY_ASSIGN(compliance.is_subject_to_travel_rule,
            Json::GetBool(object, "isSubjectToTravelRule", error_code));
        UMA_TRY_ASSIGN(compliance.receiver_identifier, Json::GetString(object, "receiverIdentifier", error_code));
        return Result<LnurlComplianceResponse, UmaFailure>::Ok(std::move(compliance));
    }

    bool LnurlpResponse::IsUmaResponse() const noexcept {
        return currencies.has_value() && required_payer_data.has_value() &&
               compliance.has_value() && uma_version.has_value();
    }

    Result<UmaLnurlpResponse, UmaFailure> LnurlpResponse::ToStrict() const {
        std::vector<std::string> missing;
        if (!currencies.has_value()) {
            missing.emplace_back("currencies");
        }
        if (!required_payer_data.has_value()) {
            missing.emplace_back("payerData");
        }
        if (!compliance.has_value()) {
            missing.emplace_back("compliance");
        }
        if (!uma_version.has_value()) {
            missing.emplace_back("umaVersion");
        }
        if (!missing.empty()) {
            return Result<UmaLnurlpResponse, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields(std::move(missing)));
        }
        UmaLnurlpResponse strict;
        strict.callback = callback;
        strict.min_sendable = min_sendable;
        strict.max_sendable = max_sendable;
        strict.encoded_metadata = encoded_metadata;
        strict.currencies = *currencies;
        strict.required_payer_data = *required_payer_data;
        strict.compliance = *compliance;
        strict.uma_version = *uma_version;
        strict.comment_chars_allowed = comment_chars_allowed;
        strict.nostr_pubkey = nostr_pubkey;
        strict.allows_nostr = allows_nostr;
        strict.backing_signatures = backing_signatures;
        strict.settlement_options = settlement_options;
        return Result<UmaLnurlpResponse, UmaFailure>::Ok(std::move(strict));
    }

    JsonObject LnurlpResponse::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "callback", callback);
        Json::SetInt64(object, "minSendable", min_sendable);
        Json::SetInt64(object, "maxSendable", max_sendable);
        Json::SetString(object, "metadata", encoded_metadata);
        if (currencies.has_value()) {
            std::vector<JsonObject> currency_objects;
            currency_objects.reserve(currencies->size());
            for (const auto& currency : *currencies) {
                currency_objects.push_back(currency.ToJsonObject());
            }
            Json::SetObjectList(object, "currencies", std::move(currency_objects));
        }
        if (required_payer_data.has_value()) {
            Json::SetObject(object, "payerData", CounterPartyData::ToJsonObject(*required_payer_data));
        }
        if (compliance.has_value()) {
            Json::SetObject(object, "compliance", compliance->ToJsonObject());
        }
        if (uma_version.has_value()) {
            Json::SetString(object, "umaVersion", *uma_version);
        }
        if (comment_chars_allowed.has_value()) {
            Json::SetInt64(object, "commentAllowed", *comment_chars_allowed);
        }
        if (nostr_pubkey.has_value()) {
            Json::SetString(object, "nostrPubkey", *nostr_pubkey);
        }
        if (allows_nostr.has_value()) {
            Json::SetBool(object, "allowsNostr", *allows_nostr);
        }
        Json::SetString(object, "tag", kPayRequestTag);
        BackingSignature::ListToJson(object, "backingSignatures", backing_signatures);
        if (settlement_options.has_value()) {
            std::vector<JsonObject> option_objects;
            option_objects.reserve(settlement_options->size());
            for (const auto& option : *settlement_options) {
                option_objects.push_back(option.ToJsonObject());
            }
            Json::SetObjectList(object, "settlementOptions", std::move(option_objects));
        }
        return object;
    }

    Result<std::string, UmaFailure> LnurlpResponse::ToJson() const {
        return Json::Serialize(ToJsonObject());
    }

    Result<LnurlpResponse, UmaFailure> LnurlpResponse::FromJsonObject(const JsonObject& object) {
        LnurlpResponse response;
        UMA_TRY_ASSIGN(response.callback, Json::GetString(object, "callback", kParseError));
        UMA_TRY_ASSIGN(response.min_sendable, Json::GetInt64(object, "minSendable", kParseError));
        UMA_TRY_ASSIGN(response.max_sendable, Json::GetInt64(object, "maxSendable", kParseError));
        UMA_TRY_ASSIGN(response.encoded_metadata, Json::GetString(object, "metadata", kParseError));

        if (Json::Has(object, "currencies")) {
            UMA_TRY_ASSIGN(const auto currency_objects, Json::GetObjectList(object, "currencies", kParseError));
            std::vector<Currency> parsed;
            parsed.reserve(currency_objects.size());
            for (const auto& currency_object : currency_objects) {
                UMA_TRY_ASSIGN(auto currency, Currency::FromJsonObject(currency_object, kParseError));
                parsed.push_back(std::move(currency));
            }
            response.currencies = std::move(parsed);
        }
        UMA_TRY_ASSIGN(response.required_payer_data,
            CounterPartyData::OptionalFromJson(object, "payerData", kParseError));
        UMA_TRY_ASSIGN(const auto compliance, Json::GetOptionalObject(object, "compliance", kParseError));
        if (compliance.has_value()) {
            UMA_TRY_ASSIGN(response.compliance, LnurlComplianceResponse::FromJsonObject(*compliance, kParseError));
        }
        UMA_TRY_ASSIGN(response.uma_version, Json::GetOptionalString(object, "umaVersion", kParseError));
        UMA_TRY_ASSIGN(const auto comment_allowed, Json::GetOptionalInt64(object, "commentAllowed", kParseError));
        if (comment_allowed.has_value()) {
            response.comment_chars_allowed = static_cast<int>(*comment_allowed);
        }
        UMA_TRY_ASSIGN(response.nostr_pubkey, Json::GetOptionalString(object, "nostrPubkey", kParseError));
        UMA_TRY_ASSIGN(response.allows_nostr, Json::GetOptionalBool(object, "allowsNostr", kParseError));
        UMA_TRY_ASSIGN(response.backing_signatures,
            BackingSignature::ListFromJson(object, "backingSignatures", kParseError));
        if (Json::Has(object, "settlementOptions")) {
            UMA_TRY_ASSIGN(const auto option_objects, Json::GetObjectList(object, "settlementOptions", kParseError));
            std::vector<SettlementOption> options;
            options.reserve(option_objects.size());
            for (const auto& option_object : option_objects) {
                UMA_TRY_ASSIGN(auto option, SettlementOption::FromJsonObject(option_object, kParseError));
                options.push_back(std::move(option));
            }
            response.settlement_options = std::move(options);
        }
        return Result<LnurlpResponse, UmaFailure>::Ok(std::move(response));
    }

    Result<LnurlpResponse, UmaFailure> LnurlpResponse::FromJson(const std::string_view json) {
        UMA_TRY_ASSIGN(const auto object, Json::ParseObject(json, kParseError));
        return FromJsonObject(object);
    }

    LnurlpResponse UmaLnurlpResponse::ToLoose() const {
        LnurlpResponse loose;
        loose.callback = callback;
        loose.min_sendable = min_sendable;
        loose.max_sendable = max_sendable;
        loose.encoded_metadata = encoded_metadata;
        loose.currencies = currencies;
        loose.required_payer_data = required_payer_data;
        loose.compliance = compliance;
        loose.uma_version = uma_version;
        loose.comment_chars_allowed = comment_chars_allowed;
        loose.nostr_pubkey = nostr_pubkey;
        loose.allows_nostr = allows_nostr;
        loose.backing_signatures = backing_signatures;
        loose.settlement_options = settlement_options;
        return loose;
    }

    Result<UmaLnurlpResponse, UmaFailure> UmaLnurlpResponse::FromJson(const std::string_view json) {
        UMA_TRY_ASSIGN(const auto loose, LnurlpResponse::FromJson(json));
        return loose.ToStrict();
    }

    UmaLnurlpResponse UmaLnurlpResponse::WithBackingSignature(BackingSignature backing) const {
        UmaLnurlpResponse copy = *this;
        if (!copy.backing_signatures.has_value()) {
            copy.backing_signatures.emplace();
        }
        copy.backing_signatures->push_back(std::move(backing));
        return copy;
    }

}
