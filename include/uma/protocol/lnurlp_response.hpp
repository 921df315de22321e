#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"
#include "uma/protocol/backing_signature.hpp"
#include "uma/protocol/counter_party_data.hpp"
#include "uma/protocol/currency.hpp"
#include "uma/protocol/kyc_status.hpp"
#include "uma/protocol/settlement.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/// Receiver compliance block of an lnurlp response.
struct LnurlComplianceResponse {
    KycStatus kyc_status = KycStatus::Unknown;
    std::string signature;
    std::string signature_nonce;
    int64_t signature_timestamp = 0;
    bool is_subject_to_travel_rule = false;
    std::string receiver_identifier;

    bool operator==(const LnurlComplianceResponse&) const = default;

    [[nodiscard]] std::string SignablePayload() const;
    [[nodiscard]] LnurlComplianceResponse SignedWith(std::string new_signature) const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] static Result<LnurlComplianceResponse, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);
};

struct UmaLnurlpResponse;

/**
 * @brief Receiver's answer to an lnurlp request
 *
 * Plain LNURL fields are always present. currencies, payerData, compliance
 * and umaVersion are only set for UMA counterparties; ToStrict() requires
 * all four.
 */
struct LnurlpResponse {
    std::string callback;
    int64_t min_sendable = 0;
    int64_t max_sendable = 0;
    std::string encoded_metadata;
    std::optional<std::vector<Currency>> currencies;
    std::optional<CounterPartyDataOptions> required_payer_data;
    std::optional<LnurlComplianceResponse> compliance;
    std::optional<std::string> uma_version;
    std::optional<int> comment_chars_allowed;
    std::optional<std::string> nostr_pubkey;
    std::optional<bool> allows_nostr;
    std::optional<std::vector<BackingSignature>> backing_signatures;
    std::optional<std::vector<SettlementOption>> settlement_options;

    bool operator==(const LnurlpResponse&) const = default;

    [[nodiscard]] bool IsUmaResponse() const noexcept;

    [[nodiscard]] Result<UmaLnurlpResponse, UmaFailure> ToStrict() const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const;

    [[nodiscard]] static Result<LnurlpResponse, UmaFailure> FromJsonObject(const utilities::JsonObject& object);
    [[nodiscard]] static Result<LnurlpResponse, UmaFailure> FromJson(std::string_view json);
};

struct UmaLnurlpResponse {
    std::string callback;
    int64_t min_sendable = 0;
    int64_t max_sendable = 0;
    std::string encoded_metadata;
    std::vector<Currency> currencies;
    CounterPartyDataOptions required_payer_data;
    LnurlComplianceResponse compliance;
    std::string uma_version;
    std::optional<int> comment_chars_allowed;
    std::optional<std::string> nostr_pubkey;
    std::optional<bool> allows_nostr;
    std::optional<std::vector<BackingSignature>> backing_signatures;
    std::optional<std::vector<SettlementOption>> settlement_options;

    bool operator==(const UmaLnurlpResponse&) const = default;

    [[nodiscard]] LnurlpResponse ToLoose() const;

    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const { return ToLoose().ToJson(); }

    /// Strict parse: fails when any UMA field is missing.
    [[nodiscard]] static Result<UmaLnurlpResponse, UmaFailure> FromJson(std::string_view json);

    [[nodiscard]] std::string SignablePayload() const { return compliance.SignablePayload(); }

    [[nodiscard]] UmaLnurlpResponse WithBackingSignature(BackingSignature backing) const;
};

} // namespace uma::protocol
