#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace uma::protocol {

struct CounterPartyDataOption {
    bool mandatory = false;

    bool operator==(const CounterPartyDataOption&) const = default;
};

/// Field name to option. Ordered so the invoice encoding is deterministic.
using CounterPartyDataOptions = std::map<std::string, CounterPartyDataOption>;

class CounterPartyData {
public:
    [[nodiscard]] static CounterPartyDataOptions CreateOptions(const std::map<std::string, bool>& fields);

    /// `{"name": {"mandatory": false}, ...}`
    [[nodiscard]] static utilities::JsonObject ToJsonObject(const CounterPartyDataOptions& options);

    [[nodiscard]] static Result<CounterPartyDataOptions, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);

    [[nodiscard]] static Result<std::optional<CounterPartyDataOptions>, UmaFailure> OptionalFromJson(
        const utilities::JsonObject& parent, std::string_view key, ErrorCode error_code);

    /// `identifier:1,name:0`: sorted by key, 1 for mandatory.
    [[nodiscard]] static std::string EncodeCompact(const CounterPartyDataOptions& options);

    /// Entries without exactly one ':' are skipped.
    [[nodiscard]] static CounterPartyDataOptions DecodeCompact(std::string_view encoded);

private:
    CounterPartyData() = delete;
};

} // namespace uma::protocol
