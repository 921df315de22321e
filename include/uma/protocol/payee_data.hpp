#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"
#include "uma/protocol/backing_signature.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/// Receiver compliance block carried under payeeData.compliance.
struct CompliancePayeeData {
    std::vector<std::string> utxos;
    std::optional<std::string> node_pub_key;
    std::string utxo_callback;
    std::string signature;
    std::string signature_nonce;
    int64_t signature_timestamp = 0;
    std::optional<std::vector<BackingSignature>> backing_signatures;

    bool operator==(const CompliancePayeeData&) const = default;

    [[nodiscard]] CompliancePayeeData SignedWith(std::string new_signature) const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<CompliancePayeeData, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);
};

/// Data the receiver shares about the payee. Same open-map shape as
/// PayerData: reserved keys are typed, the rest is kept in Extra().
class PayeeData {
public:
    PayeeData() = default;

    [[nodiscard]] static PayeeData Create(
        std::optional<CompliancePayeeData> compliance = std::nullopt,
        std::optional<std::string> identifier = std::nullopt,
        std::optional<std::string> name = std::nullopt,
        std::optional<std::string> email = std::nullopt);

    [[nodiscard]] const std::optional<std::string>& Identifier() const noexcept { return identifier_; }
    [[nodiscard]] const std::optional<std::string>& Name() const noexcept { return name_; }
    [[nodiscard]] const std::optional<std::string>& Email() const noexcept { return email_; }
    [[nodiscard]] const std::optional<CompliancePayeeData>& Compliance() const noexcept { return compliance_; }
    [[nodiscard]] const utilities::JsonObject& Extra() const noexcept { return extra_; }

    [[nodiscard]] PayeeData WithCompliance(CompliancePayeeData compliance) const;

    void SetExtra(std::string_view key, utilities::JsonValue value);

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<PayeeData, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);

    [[nodiscard]] bool operator==(const PayeeData& other) const;

private:
    std::optional<std::string> identifier_;
    std::optional<std::string> name_;
    std::optional<std::string> email_;
    std::optional<CompliancePayeeData> compliance_;
    utilities::JsonObject extra_;
};

} // namespace uma::protocol
