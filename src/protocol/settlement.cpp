#include "uma/protocol/settlement.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    JsonObject SettlementInfo::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "layer", layer);
        Json::SetString(object, "assetIdentifier", asset_identifier);
        return object;
    }

    Result<SettlementInfo, UmaFailure> SettlementInfo::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        SettlementInfo info;
        UMA_TRY_ASSIGN(info.layer, Json::GetString(object, "layer", error_code));
        UMA_TRY_ASSIGN(info.asset_identifier, Json::GetString(object, "assetIdentifier", error_code));
        return Result<SettlementInfo, UmaFailure>::Ok(std::move(info));
    }

    JsonObject SettlementAsset::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "identifier", identifier);
        JsonObject rates;
        for (const auto& [code, multiplier] : multipliers) {
            Json::SetDouble(rates, code, multiplier);
        }
        Json::SetObject(object, "multipliers", std::move(rates));
        return object;
    }

    Result<SettlementAsset, UmaFailure> SettlementAsset::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        SettlementAsset asset;
        UMA_TRY_ASSIGN(asset.identifier, Json::GetString(object, "identifier", error_code));
        UMA_TRY_ASSIGN(const auto rates, Json::GetObject(object, "multipliers", error_code));
        for (const auto& entry : rates.fields()) {
            UMA_TRY_ASSIGN(const double multiplier, Json::GetDouble(rates, entry.first, error_code));
            asset.multipliers.emplace(entry.first, multiplier);
        }
        return Result<SettlementAsset, UmaFailure>::Ok(std::move(asset));
    }

    JsonObject SettlementOption::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "settlementLayer", settlement_layer);
        std::vector<JsonObject> asset_objects;
        asset_objects.reserve(assets.size());
        for (const auto& asset : assets) {
            asset_objects.push_back(asset.ToJsonObject());
        }
        Json::SetObjectList(object, "assets", std::move(asset_objects));
        return object;
    }

    Result<SettlementOption, UmaFailure> SettlementOption::FromJsonObject(
        const JsonObject& object, const ErrorCode error_code) {
        SettlementOption option;
        UMA_TRY_ASSIGN(option.settlement_layer, Json::GetString(object, "settlementLayer", error_code));
        UMA_TRY_ASSIGN(const auto asset_objects, Json::GetObjectList(object, "assets", error_code));
        for (const auto& asset_object : asset_objects) {
            UMA_TRY_ASSIGN(auto asset, SettlementAsset::FromJsonObject(asset_object, error_code));
            option.assets.push_back(std::move(asset));
        }
        return Result<SettlementOption, UmaFailure>::Ok(std::move(option));
    }

}
