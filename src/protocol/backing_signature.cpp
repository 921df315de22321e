#include "uma/protocol/backing_signature.hpp"
#include "uma/protocol/constants.hpp"
#include "uma/utilities/url.hpp"
#include "uma/core/format.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    JsonObject BackingSignature::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "domain", domain);
        Json::SetString(object, "signature", signature);
        return object;
    }

    Result<BackingSignature, UmaFailure> BackingSignature::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        BackingSignature backing;
        UMA_TRY_ASSIGN(backing.domain, Json::GetString(object, "domain", error_code));
        UMA_TRY_ASSIGN(backing.signature, Json::GetString(object, "signature", error_code));
        return Result<BackingSignature, UmaFailure>::Ok(std::move(backing));
    }

    Result<std::optional<std::vector<BackingSignature>>, UmaFailure> BackingSignature::ListFromJson(
        const JsonObject& parent, std::string_view key, const ErrorCode error_code) {
        using ListResult = Result<std::optional<std::vector<BackingSignature>>, UmaFailure>;
        if (!Json::Has(parent, key)) {
            return ListResult::Ok(std::nullopt);
        }
        UMA_TRY_ASSIGN(const auto objects, Json::GetObjectList(parent, key, error_code));
        std::vector<BackingSignature> signatures;
        signatures.reserve(objects.size());
        for (const auto& object : objects) {
            UMA_TRY_ASSIGN(auto signature, FromJsonObject(object, error_code));
            signatures.push_back(std::move(signature));
        }
        return ListResult::Ok(std::move(signatures));
    }

    void BackingSignature::ListToJson(
        JsonObject& parent,
        std::string_view key,
        const std::optional<std::vector<BackingSignature>>& signatures) {
        if (!signatures.has_value()) {
            return;
        }
        std::vector<JsonObject> objects;
        objects.reserve(signatures->size());
        for (const auto& signature : *signatures) {
            objects.push_back(signature.ToJsonObject());
        }
        Json::SetObjectList(parent, key, std::move(objects));
    }

    std::string BackingSignature::EncodeQueryValue(const std::vector<BackingSignature>& signatures) {
        std::string encoded;
        for (const auto& signature : signatures) {
            if (!encoded.empty()) {
                encoded.push_back(kBackingSignatureListDelimiter);
            }
            encoded += signature.domain;
            encoded.push_back(kBackingSignatureDelimiter);
            encoded += signature.signature;
        }
        return encoded;
    }

    Result<std::vector<BackingSignature>, UmaFailure> BackingSignature::DecodeQueryValue(
        std::string_view value, const ErrorCode error_code) {
        using ListResult = Result<std::vector<BackingSignature>, UmaFailure>;
        std::vector<BackingSignature> signatures;
        size_t start = 0;
        while (start <= value.size()) {
            auto end = value.find(kBackingSignatureListDelimiter, start);
            if (end == std::string_view::npos) {
                end = value.size();
            }
            auto decoded = utilities::Url::Decode(value.substr(start, end - start));
            if (decoded.IsErr()) {
                return ListResult::Err(UmaFailure::Of(error_code, decoded.UnwrapErr().message));
            }
            const std::string& pair = decoded.Unwrap();
            const auto colon = pair.rfind(kBackingSignatureDelimiter);
            if (colon == std::string::npos) {
                return ListResult::Err(UmaFailure::Of(
                    error_code, compat::format("Invalid backing signature format: {}", pair)));
            }
            signatures.push_back(BackingSignature{pair.substr(0, colon), pair.substr(colon + 1)});
            start = end + 1;
        }
        return ListResult::Ok(std::move(signatures));
    }

}
