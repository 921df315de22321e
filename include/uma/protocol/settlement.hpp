#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"

#include <map>
#include <string>
#include <vector>

namespace uma::protocol {

/// Settlement layer and asset the sender chose, e.g. {"ln", "BTC"}.
struct SettlementInfo {
    std::string layer;
    std::string asset_identifier;

    bool operator==(const SettlementInfo&) const = default;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<SettlementInfo, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);
};

/// Multipliers map a currency code to smallest asset units per smallest
/// currency unit.
struct SettlementAsset {
    std::string identifier;
    std::map<std::string, double> multipliers;

    bool operator==(const SettlementAsset&) const = default;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<SettlementAsset, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);
};

struct SettlementOption {
    std::string settlement_layer;
    std::vector<SettlementAsset> assets;

    bool operator==(const SettlementOption&) const = default;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<SettlementOption, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);
};

} // namespace uma::protocol
