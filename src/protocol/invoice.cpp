#include "uma/protocol/invoice.hpp"
#include "uma/protocol/constants.hpp"
#include "uma/utilities/bech32.hpp"
#include "uma/utilities/tlv.hpp"
#include "uma/debug/protocol_logger.hpp"
#include "uma/core/format.hpp"

namespace uma::protocol {

    using utilities::Bech32;
    using utilities::TlvReader;
    using utilities::TlvWriter;

    Result<std::vector<uint8_t>, UmaFailure> InvoiceCurrency::ToTlv() const {
        TlvWriter writer;
        UMA_TRY(writer.PutString(invoice_tags::kCurrencyCode, code));
        UMA_TRY(writer.PutString(invoice_tags::kCurrencyName, name));
        UMA_TRY(writer.PutString(invoice_tags::kCurrencySymbol, symbol));
        UMA_TRY(writer.PutNumber(invoice_tags::kCurrencyDecimals, decimals));
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(writer.TakeBytes());
    }

    Result<InvoiceCurrency, UmaFailure> InvoiceCurrency::FromTlv(const std::span<const uint8_t> bytes) {
        InvoiceCurrency currency;
        TlvReader reader(bytes);
        while (reader.HasNext()) {
            UMA_TRY_ASSIGN(const auto record, reader.Next());
            switch (record.tag) {
                case invoice_tags::kCurrencyCode:
                    currency.code = TlvReader::ReadString(record);
                    break;
                case invoice_tags::kCurrencyName:
                    currency.name = TlvReader::ReadString(record);
                    break;
                case invoice_tags::kCurrencySymbol:
                    currency.symbol = TlvReader::ReadString(record);
                    break;
                case invoice_tags::kCurrencyDecimals: {
                    UMA_TRY_ASSIGN(const int64_t decimals, TlvReader::ReadNumber(record));
                    currency.decimals = static_cast<int>(decimals);
                    break;
                }
                default:
                    break;
            }
        }
        return Result<InvoiceCurrency, UmaFailure>::Ok(std::move(currency));
    }

    Invoice Invoice::WithSignature(std::vector<uint8_t> signature) const {
        Invoice copy = *this;
        copy.signature_ = std::move(signature);
        return copy;
    }

    Result<std::vector<uint8_t>, UmaFailure> Invoice::Encode(const bool include_signature) const {
        TlvWriter writer;
        UMA_TRY(writer.PutString(invoice_tags::kReceiverUma, receiver_uma_));
        UMA_TRY(writer.PutString(invoice_tags::kInvoiceUuid, invoice_uuid_));
        UMA_TRY(writer.PutNumber(invoice_tags::kAmount, amount_));
        UMA_TRY_ASSIGN(const auto currency, receiving_currency_.ToTlv());
        UMA_TRY(writer.PutBytes(invoice_tags::kReceivingCurrency, currency));
        UMA_TRY(writer.PutNumber(invoice_tags::kExpiration, expiration_));
        UMA_TRY(writer.PutBool(invoice_tags::kIsSubjectToTravelRule, is_subject_to_travel_rule_));
        if (required_payer_data_.has_value()) {
            UMA_TRY(writer.PutString(
                invoice_tags::kRequiredPayerData, CounterPartyData::EncodeCompact(*required_payer_data_)));
        }
        UMA_TRY(writer.PutString(invoice_tags::kUmaVersion, uma_version_));
        if (comment_chars_allowed_.has_value()) {
            UMA_TRY(writer.PutNumber(invoice_tags::kCommentCharsAllowed, *comment_chars_allowed_));
        }
        if (sender_uma_.has_value()) {
            UMA_TRY(writer.PutString(invoice_tags::kSenderUma, *sender_uma_));
        }
        if (invoice_limit_.has_value()) {
            UMA_TRY(writer.PutNumber(invoice_tags::kInvoiceLimit, *invoice_limit_));
        }
        if (kyc_status_.has_value()) {
            UMA_TRY(writer.PutString(invoice_tags::kKycStatus, KycStatusToString(*kyc_status_)));
        }
        UMA_TRY(writer.PutString(invoice_tags::kCallback, callback_));
        if (include_signature && signature_.has_value()) {
            UMA_TRY(writer.PutBytes(invoice_tags::kSignature, *signature_));
        }
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(writer.TakeBytes());
    }

    Result<std::vector<uint8_t>, UmaFailure> Invoice::SignablePayload() const {
        return Encode(false);
    }

    Result<std::vector<uint8_t>, UmaFailure> Invoice::ToTlv() const {
        return Encode(true);
    }

    Result<std::string, UmaFailure> Invoice::ToBech32() const {
        UMA_TRY_ASSIGN(const auto tlv, ToTlv());
        return Result<std::string, UmaFailure>::Ok(Bech32::Encode(kInvoiceHumanReadablePrefix, tlv));
    }

    Result<Invoice, UmaFailure> Invoice::FromTlv(const std::span<const uint8_t> bytes) {
        InvoiceBuilder builder;
        TlvReader reader(bytes);
        while (reader.HasNext()) {
            UMA_TRY_ASSIGN(const auto record, reader.Next());
            switch (record.tag) {
                case invoice_tags::kReceiverUma:
                    builder.SetReceiverUma(TlvReader::ReadString(record));
                    break;
                case invoice_tags::kInvoiceUuid:
                    builder.SetInvoiceUuid(TlvReader::ReadString(record));
                    break;
                case invoice_tags::kAmount: {
                    UMA_TRY_ASSIGN(const int64_t amount, TlvReader::ReadNumber(record));
                    builder.SetAmount(amount);
                    break;
                }
                case invoice_tags::kReceivingCurrency: {
                    UMA_TRY_ASSIGN(auto currency, InvoiceCurrency::FromTlv(record.value));
                    builder.SetReceivingCurrency(std::move(currency));
                    break;
                }
                case invoice_tags::kExpiration: {
                    UMA_TRY_ASSIGN(const int64_t expiration, TlvReader::ReadNumber(record));
                    builder.SetExpiration(expiration);
                    break;
                }
                case invoice_tags::kIsSubjectToTravelRule: {
                    UMA_TRY_ASSIGN(const bool travel_rule, TlvReader::ReadBool(record));
                    builder.SetIsSubjectToTravelRule(travel_rule);
                    break;
                }
                case invoice_tags::kRequiredPayerData:
                    builder.SetRequiredPayerData(CounterPartyData::DecodeCompact(TlvReader::ReadString(record)));
                    break;
                case invoice_tags::kUmaVersion:
                    builder.SetUmaVersion(TlvReader::ReadString(record));
                    break;
                case invoice_tags::kCommentCharsAllowed: {
                    UMA_TRY_ASSIGN(const int64_t comment_chars, TlvReader::ReadNumber(record));
                    builder.SetCommentCharsAllowed(static_cast<int>(comment_chars));
                    break;
                }
                case invoice_tags::kSenderUma:
                    builder.SetSenderUma(TlvReader::ReadString(record));
                    break;
                case invoice_tags::kInvoiceLimit: {
                    UMA_TRY_ASSIGN(const int64_t limit, TlvReader::ReadNumber(record));
                    builder.SetInvoiceLimit(limit);
                    break;
                }
                case invoice_tags::kKycStatus:
                    builder.SetKycStatus(KycStatusFromString(TlvReader::ReadString(record)));
                    break;
                case invoice_tags::kCallback:
                    builder.SetCallback(TlvReader::ReadString(record));
                    break;
                case invoice_tags::kSignature:
                    builder.SetSignature(TlvReader::ReadBytes(record));
                    break;
                default:
                    break;
            }
        }
        return builder.Build();
    }

    Result<Invoice, UmaFailure> Invoice::FromBech32(const std::string_view token) {
        auto decoded = Bech32::Decode(token);
        if (decoded.IsErr()) {
            debug::LogInvoiceDecodeFailure(decoded.UnwrapErr().message);
            return Result<Invoice, UmaFailure>::Err(std::move(decoded).UnwrapErr());
        }
        const auto data = std::move(decoded).Unwrap();
        if (data.hrp != kInvoiceHumanReadablePrefix) {
            debug::LogInvoiceDecodeFailure("unexpected prefix " + data.hrp);
            return Result<Invoice, UmaFailure>::Err(UmaFailure::InvoiceStructure(
                compat::format("Unexpected invoice prefix '{}'", data.hrp)));
        }
        return FromTlv(data.data);
    }

    InvoiceBuilder& InvoiceBuilder::SetReceiverUma(std::string value) {
        receiver_uma_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetInvoiceUuid(std::string value) {
        invoice_uuid_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetAmount(const int64_t value) {
        amount_ = value;
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetReceivingCurrency(InvoiceCurrency value) {
        receiving_currency_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetExpiration(const int64_t value) {
        expiration_ = value;
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetIsSubjectToTravelRule(const bool value) {
        is_subject_to_travel_rule_ = value;
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetRequiredPayerData(CounterPartyDataOptions value) {
        required_payer_data_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetUmaVersion(std::string value) {
        uma_version_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetCommentCharsAllowed(const int value) {
        comment_chars_allowed_ = value;
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetSenderUma(std::string value) {
        sender_uma_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetInvoiceLimit(const int64_t value) {
        invoice_limit_ = value;
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetKycStatus(const KycStatus value) {
        kyc_status_ = value;
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetCallback(std::string value) {
        callback_ = std::move(value);
        return *this;
    }

    InvoiceBuilder& InvoiceBuilder::SetSignature(std::vector<uint8_t> value) {
        signature_ = std::move(value);
        return *this;
    }

    Result<Invoice, UmaFailure> InvoiceBuilder::Build() const {
        std::vector<std::string> missing;
        if (!receiver_uma_.has_value()) {
            missing.emplace_back("receiverUma");
        }
        if (!invoice_uuid_.has_value()) {
            missing.emplace_back("invoiceUUID");
        }
        if (!amount_.has_value()) {
            missing.emplace_back("amount");
        }
        if (!receiving_currency_.has_value()) {
            missing.emplace_back("receivingCurrency");
        }
        if (!expiration_.has_value()) {
            missing.emplace_back("expiration");
        }
        if (!is_subject_to_travel_rule_.has_value()) {
            missing.emplace_back("isSubjectToTravelRule");
        }
        if (!uma_version_.has_value()) {
            missing.emplace_back("umaVersion");
        }
        if (!callback_.has_value()) {
            missing.emplace_back("callback");
        }
        if (!missing.empty()) {
            return Result<Invoice, UmaFailure>::Err(UmaFailure::InvoiceMissingFields(std::move(missing)));
        }

        Invoice invoice;
        invoice.receiver_uma_ = *receiver_uma_;
        invoice.invoice_uuid_ = *invoice_uuid_;
        invoice.amount_ = *amount_;
        invoice.receiving_currency_ = *receiving_currency_;
        invoice.expiration_ = *expiration_;
        invoice.is_subject_to_travel_rule_ = *is_subject_to_travel_rule_;
        invoice.required_payer_data_ = required_payer_data_;
        invoice.uma_version_ = *uma_version_;
        invoice.comment_chars_allowed_ = comment_chars_allowed_;
        invoice.sender_uma_ = sender_uma_;
        invoice.invoice_limit_ = invoice_limit_;
        invoice.kyc_status_ = kyc_status_;
        invoice.callback_ = *callback_;
        invoice.signature_ = signature_;
        return Result<Invoice, UmaFailure>::Ok(std::move(invoice));
    }

}
