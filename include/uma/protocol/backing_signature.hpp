#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/// Attestation by the VASP operating `domain` over the same payload as the
/// primary signature. The verifier fetches the domain's keys independently.
struct BackingSignature {
    std::string domain;
    std::string signature;

    bool operator==(const BackingSignature&) const = default;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;

    [[nodiscard]] static Result<BackingSignature, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);

    [[nodiscard]] static Result<std::optional<std::vector<BackingSignature>>, UmaFailure> ListFromJson(
        const utilities::JsonObject& parent, std::string_view key, ErrorCode error_code);

    static void ListToJson(
        utilities::JsonObject& parent,
        std::string_view key,
        const std::optional<std::vector<BackingSignature>>& signatures);

    /// `domain:signature` pairs joined with ','. The URL layer percent-encodes
    /// the whole value.
    [[nodiscard]] static std::string EncodeQueryValue(const std::vector<BackingSignature>& signatures);

    /// Each pair is percent-decoded once more, then split on its last ':' so
    /// domains carrying a port survive.
    [[nodiscard]] static Result<std::vector<BackingSignature>, UmaFailure> DecodeQueryValue(
        std::string_view value, ErrorCode error_code);
};

} // namespace uma::protocol
