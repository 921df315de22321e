#include "uma/protocol/payee_data.hpp"
#include "uma/protocol/constants.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    CompliancePayeeData CompliancePayeeData::SignedWith(std::string new_signature) const {
        CompliancePayeeData signed_data = *this;
        signed_data.signature = std::move(new_signature);
        return signed_data;
    }

    JsonObject CompliancePayeeData::ToJsonObject() const {
        JsonObject object;
        Json::SetStringList(object, "utxos", utxos);
        if (node_pub_key.has_value()) {
            Json::SetString(object, "nodePubKey", *node_pub_key);
        }
        Json::SetString(object, "utxoCallback", utxo_callback);
        Json::SetString(object, "signature", signature);
        Json::SetString(object, "signatureNonce", signature_nonce);
        Json::SetInt64(object, "signatureTimestamp", signature_timestamp);
        BackingSignature::ListToJson(object, "backingSignatures", backing_signatures);
        return object;
    }

    Result<CompliancePayeeData, UmaFailure> CompliancePayeeData::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        std::vector<std::string> missing;
        for (const char* key : {"signature", "signatureNonce", "signatureTimestamp"}) {
            if (!Json::Has(object, key)) {
                missing.emplace_back(key);
            }
        }
        if (!missing.empty()) {
            return Result<CompliancePayeeData, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields(std::move(missing)));
        }

        CompliancePayeeData data;
        if (Json::Has(object, "utxos")) {
            UMA_TRY_ASSIGN(data.utxos, Json::GetStringList(object, "utxos", error_code));
        }
        UMA_TRY_ASSIGN(data.node_pub_key, Json::GetOptionalString(object, "nodePubKey", error_code));
        UMA_TRY_ASSIGN(const auto callback, Json::GetOptionalString(object, "utxoCallback", error_code));
        data.utxo_callback = callback.value_or("");
        UMA_TRY_ASSIGN(data.signature, Json::GetString(object, "signature", error_code));
        UMA_TRY_ASSIGN(data.signature_nonce, Json::GetString(object, "signatureNonce", error_code));
        UMA_TRY_ASSIGN(data.signature_timestamp, Json::GetInt64(object, "signatureTimestamp", error_code));
        UMA_TRY_ASSIGN(data.backing_signatures,
            BackingSignature::ListFromJson(object, "backingSignatures", error_code));
        return Result<CompliancePayeeData, UmaFailure>::Ok(std::move(data));
    }

    PayeeData PayeeData::Create(
        std::optional<CompliancePayeeData> compliance,
        std::optional<std::string> identifier,
        std::optional<std::string> name,
        std::optional<std::string> email) {
        PayeeData data;
        data.compliance_ = std::move(compliance);
        data.identifier_ = std::move(identifier);
        data.name_ = std::move(name);
        data.email_ = std::move(email);
        return data;
    }

    PayeeData PayeeData::WithCompliance(CompliancePayeeData compliance) const {
        PayeeData copy = *this;
        copy.compliance_ = std::move(compliance);
        return copy;
    }

    void PayeeData::SetExtra(std::string_view key, utilities::JsonValue value) {
        Json::SetValue(extra_, key, std::move(value));
    }

    JsonObject PayeeData::ToJsonObject() const {
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

    Result<PayeeData, UmaFailure> PayeeData::FromJsonObject(const JsonObject& object, const ErrorCode error_code) {
        PayeeData data;
        UMA_TRY_ASSIGN(data.identifier_, Json::GetOptionalString(object, kPayerDataIdentifierKey, error_code));
        UMA_TRY_ASSIGN(data.name_, Json::GetOptionalString(object, kPayerDataNameKey, error_code));
        UMA_TRY_ASSIGN(data.email_, Json::GetOptionalString(object, kPayerDataEmailKey, error_code));
        UMA_TRY_ASSIGN(const auto compliance, Json::GetOptionalObject(object, kPayerDataComplianceKey, error_code));
        if (compliance.has_value()) {
            UMA_TRY_ASSIGN(data.compliance_, CompliancePayeeData::FromJsonObject(*compliance, error_code));
        }
        for (const auto& [key, value] : object.fields()) {
            if (key == kPayerDataIdentifierKey || key == kPayerDataNameKey ||
                key == kPayerDataEmailKey || key == kPayerDataComplianceKey) {
                continue;
            }
            Json::SetValue(data.extra_, key, value);
        }
        return Result<PayeeData, UmaFailure>::Ok(std::move(data));
    }

    bool PayeeData::operator==(const PayeeData& other) const {
        return identifier_ == other.identifier_ &&
               name_ == other.name_ &&
               email_ == other.email_ &&
               compliance_ == other.compliance_ &&
               Json::Equals(extra_, other.extra_);
    }

}
