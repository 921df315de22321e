#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"
#include "uma/protocol/backing_signature.hpp"
#include "uma/protocol/kyc_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/// Standardized travel rule payload format, serialized "type@version" or
/// just "type" when unversioned.
struct TravelRuleFormat {
    std::string type;
    std::optional<std::string> version;

    bool operator==(const TravelRuleFormat&) const = default;

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] static TravelRuleFormat Parse(std::string_view value);
};

/**
 * @brief Sender compliance block carried under payerData.compliance
 *
 * `utxos` and `utxoCallback` default to empty when a peer omits them;
 * the kyc status and signature fields are required.
 */
struct CompliancePayerData {
    std::vector<std::string> utxos;
    std::optional<std::string> node_pub_key;
    KycStatus kyc_status = KycStatus::Unknown;
    std::optional<std::string> encrypted_travel_rule_info;
    std::string utxo_callback;
    std::string signature;
    std::string signature_nonce;
    int64_t signature_timestamp = 0;
    std::optional<TravelRuleFormat> travel_rule_format;
    std::optional<std::vector<BackingSignature>> backing_signatures;

    bool operator==(const CompliancePayerData&) const = default;

    [[nodiscard]] CompliancePayerData SignedWith(std::string new_signature) const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<CompliancePayerData, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);
};

/**
 * @brief Data the sender shares about the payer
 *
 * The wire form is an open JSON object. The reserved keys `identifier`,
 * `name`, `email` and `compliance` are decoded into typed fields; any other
 * key is kept verbatim in the extra map and written back on encode.
 */
class PayerData {
public:
    PayerData() = default;

    [[nodiscard]] static PayerData Create(
        std::string identifier,
        std::optional<CompliancePayerData> compliance = std::nullopt,
        std::optional<std::string> name = std::nullopt,
        std::optional<std::string> email = std::nullopt);

    [[nodiscard]] const std::optional<std::string>& Identifier() const noexcept { return identifier_; }
    [[nodiscard]] const std::optional<std::string>& Name() const noexcept { return name_; }
    [[nodiscard]] const std::optional<std::string>& Email() const noexcept { return email_; }
    [[nodiscard]] const std::optional<CompliancePayerData>& Compliance() const noexcept { return compliance_; }
    [[nodiscard]] const utilities::JsonObject& Extra() const noexcept { return extra_; }

    [[nodiscard]] PayerData WithCompliance(CompliancePayerData compliance) const;

    void SetExtra(std::string_view key, utilities::JsonValue value);

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<PayerData, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);

    [[nodiscard]] bool operator==(const PayerData& other) const;

private:
    std::optional<std::string> identifier_;
    std::optional<std::string> name_;
    std::optional<std::string> email_;
    std::optional<CompliancePayerData> compliance_;
    utilities::JsonObject extra_;
};

} // namespace uma::protocol
