#include "uma/protocol/payer_data.hpp"
#include "uma/protocol/constants.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    std::string TravelRuleFormat::ToString() const {
        if (!version.has_value()) {
            return type;
        }
        return type + "@" + *version;
    }

    TravelRuleFormat TravelRuleFormat::Parse(std::string_view value) {
        const auto at = value.find('@');
        if (at == std::string_view::npos) {
            return TravelRuleFormat{std::string(value), std::nullopt};
        }
        const auto second = value.find('@', at + 1);
        const std::string_view version = second == std::string_view::npos
            ? value.substr(at + 1)
            : value.substr(at + 1, second - at - 1);
        return TravelRuleFormat{std::string(value.substr(0, at)), std::string(version)};
    }

    CompliancePayerData CompliancePayerData::SignedWith(std::string new_signature) const {
        CompliancePayerData signed_data = *this;
        signed_data.signature = std::move(new_signature);
        return signed_data;
    }

    JsonObject CompliancePayerData::ToJsonObject() const {
        JsonObject object;
        Json::SetStringList(object, "utxos", utxos);
        if (node_pub_key.has_value()) {
            Json::SetString(object, "nodePubKey", *node_pub_key);
        }
        Json::SetString(object, "kycStatus", KycStatusToString(kyc_status));
        if (encrypted_travel_rule_info.has_value()) {
            Json::SetString(object, "encryptedTravelRuleInfo", *encrypted_travel_rule_info);
        }
        Json::SetString(object, "utxoCallback", utxo_callback);
        Json::SetString(object, "signature", signature);
        Json::SetString(object, "signatureNonce", signature_nonce);
        Json::SetInt64(object, "signatureTimestamp", signature_timestamp);
        if (travel_rule_format.has_value()) {
            Json::SetString(object, "travelRuleFormat", travel_rule_format->ToString());
        }
        BackingSignature::ListToJson(object, "backingSignatures", backing_signatures);
        return object;
    }

    Result<CompliancePayerData, UmaFailure> CompliancePayerData::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        std::vector<std::string> missing;
        for (const char* key : {"kycStatus", "signature", "signatureNonce", "signatureTimestamp"}) {
            if (!Json::Has(object, key)) {
                missing.emplace_back(key);
            }
        }
        if (!missing.empty()) {
            return Result<CompliancePayerData, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields(std::move(missing)));
        }

        CompliancePayerData data;
        if (Json::Has(object, "utxos")) {
            UMA_TRY_ASSIGN(data.utxos, Json::GetStringList(object, "utxos", error_code));
        }
        UMA_TRY_ASSIGN(data.node_pub_key, Json::GetOptionalString(object, "nodePubKey", error_code));
        UMA_TRY_ASSIGN(const std::string kyc, Json::GetString(object, "kycStatus", error_code));
        data.kyc_status = KycStatusFromString(kyc);
        UMA_TRY_ASSIGN(data.encrypted_travel_rule_info,
            Json::GetOptionalString(object, "encryptedTravelRuleInfo", error_code));
        UMA_TRY_ASSIGN(const auto callback, Json::GetOptionalString(object, "utxoCallback", error_code));
        data.utxo_callback = callback.value_or("");
        UMA_TRY_ASSIGN(data.signature, Json::GetString(object, "signature", error_code));
        UMA_TRY_ASSIGN(data.signature_nonce, Json::GetString(object, "signatureNonce", error_code));
        UMA_TRY_ASSIGN(data.signature_timestamp, Json::GetInt64(object, "signatureTimestamp", error_code));
        UMA_TRY_ASSIGN(const auto format, Json::GetOptionalString(object, "travelRuleFormat", error_code));
        if (format.has_value()) {
            data.travel_rule_format = TravelRuleFormat::Parse(*format);
        }
        UMA_TRY_ASSIGN(data.backing_signatures,
            BackingSignature::ListFromJson(object, "backingSignatures", error_code));
        return Result<CompliancePayerData, UmaFailure>::Ok(std::move(data));
    }

    PayerData PayerData::Create(
        std::string identifier,
        std::optional<CompliancePayerData> compliance,
        std::optional<std::string> name,
        std::optional<std::string> email) {
        PayerData data;
        data.identifier_ = std::move(identifier);
        data.compliance_ = std::move(compliance);
        data.name_ = std::move(name);
        data.email_ = std::move(email);
        return data;
    }

    PayerData PayerData::WithCompliance(CompliancePayerData compliance) const {
        PayerData copy = *this;
        copy.compliance_ = std::move(compliance);
        return copy;
    }

    void PayerData::SetExtra(std::string_view key, utilities::JsonValue value) {
        Json::SetValue(extra_, key, std::move(value));
    }

    JsonObject PayerData::ToJsonObject() const {
        JsonObject object = extra_;
        if (identifier_.has_value()) {
            Json::SetString(object, kPayerDataIdentifierKey, *identifier_);
        }
        if (name_.has_value()) {
            Json::SetString(object, kPayerDataNameKey, *name_);
        }
        if (email_.has_value()) {
            Json::SetString(object, kPayerDataEmailKey, *email_);
        }
        if (compliance_.has_value()) {
            Json::SetObject(object, kPayerDataComplianceKey, compliance_->ToJsonObject());
        }
        return object;
    }

    Result<PayerData, UmaFailure> PayerData::FromJsonObject(const JsonObject& object, const ErrorCode error_code) {
        PayerData data;
        UMA_TRY_ASSIGN(data.identifier_, Json::GetOptionalString(object, kPayerDataIdentifierKey, error_code));
        UMA_TRY_ASSIGN(data.name_, Json::GetOptionalString(object, kPayerDataNameKey, error_code));
        UMA_TRY_ASSIGN(data.email_, Json::GetOptionalString(object, kPayerDataEmailKey, error_code));
        UMA_TRY_ASSIGN(const auto compliance, Json::GetOptionalObject(object, kPayerDataComplianceKey, error_code));
        if (compliance.has_value()) {
            UMA_TRY_ASSIGN(data.compliance_, CompliancePayerData::FromJsonObject(*compliance, error_code));
        }
        for (const auto& [key, value] : object.fields()) {
            if (key == kPayerDataIdentifierKey || key == kPayerDataNameKey ||
                key == kPayerDataEmailKey || key == kPayerDataComplianceKey) {
                continue;
            }
            Json::SetValue(data.extra_, key, value);
        }
        return Result<PayerData, UmaFailure>::Ok(std::move(data));
    }

    bool PayerData::operator==(const PayerData& other) const {
        return identifier_ == other.identifier_ &&
               name_ == other.name_ &&
               email_ == other.email_ &&
               compliance_ == other.compliance_ &&
               Json::Equals(extra_, other.extra_);
    }

}
