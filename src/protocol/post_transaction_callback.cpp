#include "uma/protocol/post_transaction_callback.hpp"
#include "uma/protocol/canonical_payload.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    namespace {

        constexpr ErrorCode kParseError = ErrorCode::ParseUtxoCallbackError;

    }

    std::string PostTransactionCallback::SignablePayload() const {
        return CanonicalPayload::ForPostTransactionCallback(signature_nonce, signature_timestamp);
    }

    PostTransactionCallback PostTransactionCallback::SignedWith(std::string new_signature) const {
        PostTransactionCallback copy = *this;
        copy.signature = std::move(new_signature);
        return copy;
    }

    JsonObject PostTransactionCallback::ToJsonObject() const {
        JsonObject object;
        std::vector<JsonObject> utxo_objects;
        utxo_objects.reserve(utxos.size());
        for (const auto& utxo : utxos) {
            JsonObject utxo_object;
            Json::SetString(utxo_object, "utxo", utxo.utxo);
            Json::SetInt64(utxo_object, "amountMsats", utxo.amount_msats);
            utxo_objects.push_back(std::move(utxo_object));
        }
        Json::SetObjectList(object, "utxos", std::move(utxo_objects));
        Json::SetString(object, "vaspDomain", vasp_domain);
        Json::SetString(object, "signature", signature);
        Json::SetString(object, "signatureNonce", signature_nonce);
        Json::SetInt64(object, "signatureTimestamp", signature_timestamp);
        return object;
    }

    Result<std::string, UmaFailure> PostTransactionCallback::ToJson() const {
        return Json::Serialize(ToJsonObject());
    }

    Result<PostTransactionCallback, UmaFailure> PostTransactionCallback::FromJson(const std::string_view json) {
        UMA_TRY_ASSIGN(const auto object, Json::ParseObject(json, kParseError));
        PostTransactionCallback callback;
        UMA_TRY_ASSIGN(const auto utxo_objects, Json::GetObjectList(object, "utxos", kParseError));
        for (const auto& utxo_object : utxo_objects) {
            UtxoWithAmount utxo;
            UMA_TRY_ASSIGN(utxo.utxo, Json::GetString(utxo_object, "utxo", kParseError));
            UMA_TRY_ASSIGN(utxo.amount_msats, Json::GetInt64(utxo_object, "amountMsats", kParseError));
            callback.utxos.push_back(std::move(utxo));
        }
        UMA_TRY_ASSIGN(callback.vasp_domain, Json::GetString(object, "vaspDomain", kParseError));
        UMA_TRY_ASSIGN(callback.signature, Json::GetString(object, "signature", kParseError));
        UMA_TRY_ASSIGN(callback.signature_nonce, Json::GetString(object, "signatureNonce", kParseError));
        UMA_TRY_ASSIGN(callback.signature_timestamp, Json::GetInt64(object, "signatureTimestamp", kParseError));
        return Result<PostTransactionCallback, UmaFailure>::Ok(std::move(callback));
    }

}
