#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/protocol/counter_party_data.hpp"
#include "uma/protocol/kyc_status.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/// Currency descriptor nested inside an invoice as its own TLV stream.
/// `decimals` stays -1 when the stream omits it.
struct InvoiceCurrency {
    std::string code;
    std::string name;
    std::string symbol;
    int decimals = -1;

    bool operator==(const InvoiceCurrency&) const = default;

    [[nodiscard]] Result<std::vector<uint8_t>, UmaFailure> ToTlv() const;
    [[nodiscard]] static Result<InvoiceCurrency, UmaFailure> FromTlv(std::span<const uint8_t> bytes);
};

/**
 * @brief Immutable receiver-issued invoice
 *
 * Serialized as a stream of `[tag][length][value]` records and carried as
 * a bech32 string with the "uma" prefix. Construct through InvoiceBuilder,
 * which rejects an invoice missing any mandatory field.
 */
class Invoice {
public:
    [[nodiscard]] const std::string& ReceiverUma() const noexcept { return receiver_uma_; }
    [[nodiscard]] const std::string& InvoiceUuid() const noexcept { return invoice_uuid_; }
    [[nodiscard]] int64_t Amount() const noexcept { return amount_; }
    [[nodiscard]] const InvoiceCurrency& ReceivingCurrency() const noexcept { return receiving_currency_; }
    [[nodiscard]] int64_t Expiration() const noexcept { return expiration_; }
    [[nodiscard]] bool IsSubjectToTravelRule() const noexcept { return is_subject_to_travel_rule_; }
    [[nodiscard]] const std::optional<CounterPartyDataOptions>& RequiredPayerData() const noexcept {
        return required_payer_data_;
    }
    [[nodiscard]] const std::string& UmaVersion() const noexcept { return uma_version_; }
    [[nodiscard]] std::optional<int> CommentCharsAllowed() const noexcept { return comment_chars_allowed_; }
    [[nodiscard]] const std::optional<std::string>& SenderUma() const noexcept { return sender_uma_; }
    [[nodiscard]] std::optional<int64_t> InvoiceLimit() const noexcept { return invoice_limit_; }
    [[nodiscard]] std::optional<KycStatus> GetKycStatus() const noexcept { return kyc_status_; }
    [[nodiscard]] const std::string& Callback() const noexcept { return callback_; }
    [[nodiscard]] const std::optional<std::vector<uint8_t>>& Signature() const noexcept { return signature_; }

    [[nodiscard]] Invoice WithSignature(std::vector<uint8_t> signature) const;

    /// TLV stream without the signature record; the bytes a receiver signs.
    [[nodiscard]] Result<std::vector<uint8_t>, UmaFailure> SignablePayload() const;

    [[nodiscard]] Result<std::vector<uint8_t>, UmaFailure> ToTlv() const;
    [[nodiscard]] Result<std::string, UmaFailure> ToBech32() const;

    /// Unknown tags are skipped. Truncated or ill-sized records fail with
    /// the Structure kind, absent mandatory fields with MissingField.
    [[nodiscard]] static Result<Invoice, UmaFailure> FromTlv(std::span<const uint8_t> bytes);

    /// A corrupted character fails with the Checksum kind.
    [[nodiscard]] static Result<Invoice, UmaFailure> FromBech32(std::string_view token);

    bool operator==(const Invoice&) const = default;

private:
    friend class InvoiceBuilder;

    Invoice() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, UmaFailure> Encode(bool include_signature) const;

    std::string receiver_uma_;
    std::string invoice_uuid_;
    int64_t amount_ = 0;
    InvoiceCurrency receiving_currency_;
    int64_t expiration_ = 0;
    bool is_subject_to_travel_rule_ = false;
    std::optional<CounterPartyDataOptions> required_payer_data_;
    std::string uma_version_;
    std::optional<int> comment_chars_allowed_;
    std::optional<std::string> sender_uma_;
    std::optional<int64_t> invoice_limit_;
    std::optional<KycStatus> kyc_status_;
    std::string callback_;
    std::optional<std::vector<uint8_t>> signature_;
};

class InvoiceBuilder {
public:
    InvoiceBuilder& SetReceiverUma(std::string value);
    InvoiceBuilder& SetInvoiceUuid(std::string value);
    InvoiceBuilder& SetAmount(int64_t value);
    InvoiceBuilder& SetReceivingCurrency(InvoiceCurrency value);
    InvoiceBuilder& SetExpiration(int64_t value);
    InvoiceBuilder& SetIsSubjectToTravelRule(bool value);
    InvoiceBuilder& SetRequiredPayerData(CounterPartyDataOptions value);
    InvoiceBuilder& SetUmaVersion(std::string value);
    InvoiceBuilder& SetCommentCharsAllowed(int value);
    InvoiceBuilder& SetSenderUma(std::string value);
    InvoiceBuilder& SetInvoiceLimit(int64_t value);
    InvoiceBuilder& SetKycStatus(KycStatus value);
    InvoiceBuilder& SetCallback(std::string value);
    InvoiceBuilder& SetSignature(std::vector<uint8_t> value);

    /// Fails with INVALID_INVOICE (MissingField) listing every absent
    /// mandatory field.
    [[nodiscard]] Result<Invoice, UmaFailure> Build() const;

private:
    std::optional<std::string> receiver_uma_;
    std::optional<std::string> invoice_uuid_;
    std::optional<int64_t> amount_;
    std::optional<InvoiceCurrency> receiving_currency_;
    std::optional<int64_t> expiration_;
    std::optional<bool> is_subject_to_travel_rule_;
    std::optional<CounterPartyDataOptions> required_payer_data_;
    std::optional<std::string> uma_version_;
    std::optional<int> comment_chars_allowed_;
    std::optional<std::string> sender_uma_;
    std::optional<int64_t> invoice_limit_;
    std::optional<KycStatus> kyc_status_;
    std::optional<std::string> callback_;
    std::optional<std::vector<uint8_t>> signature_;
};

} // namespace uma::protocol
