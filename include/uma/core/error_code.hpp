#pragma once
#include <cstdint>
#include <string_view>
namespace uma::protocol {
enum class ErrorCode : uint8_t {
    CounterpartyPubkeyFetchError,
    InvalidPubkeyFormat,
    CertChainInvalid,
    CertChainExpired,
    InvalidSignature,
    InvalidTimestamp,
    InvalidNonce,
    InternalError,
    NonUmaLnurlNotSupported,
    MissingRequiredUmaParameters,
    UnsupportedUmaVersion,
    ParseLnurlpRequestError,
    VelocityLimitExceeded,
    UserNotFound,
    UserNotReady,
    RequestNotFound,
    ParsePayreqRequestError,
    AmountOutOfRange,
    InvalidCurrency,
    SenderNotAccepted,
    MissingMandatoryPayerData,
    UnrecognizedMandatoryPayeeDataKey,
    ParseUtxoCallbackError,
    CounterpartyNotAllowed,
    ParseLnurlpResponseError,
    ParsePayreqResponseError,
    LnurlpRequestFailed,
    PayreqRequestFailed,
    NoCompatibleUmaVersion,
    InvalidInvoice,
    InvoiceExpired,
    QuoteExpired,
    InvalidInput,
    InvalidRequestFormat,
    Forbidden,
    NotImplemented,
    QuoteNotFound
};
struct ErrorCodeInfo {
    std::string_view name;
    int http_status;
};
[[nodiscard]] constexpr ErrorCodeInfo GetErrorCodeInfo(const ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::CounterpartyPubkeyFetchError: return {"COUNTERPARTY_PUBKEY_FETCH_ERROR", 424};
        case ErrorCode::InvalidPubkeyFormat: return {"INVALID_PUBKEY_FORMAT", 400};
        case ErrorCode::CertChainInvalid: return {"CERT_CHAIN_INVALID", 400};
        case ErrorCode::CertChainExpired: return {"CERT_CHAIN_EXPIRED", 400};
        case ErrorCode::InvalidSignature: return {"INVALID_SIGNATURE", 401};
        case ErrorCode::InvalidTimestamp: return {"INVALID_TIMESTAMP", 400};
        case ErrorCode::InvalidNonce: return {"INVALID_NONCE", 400};
        case ErrorCode::InternalError: return {"INTERNAL_ERROR", 500};
        case ErrorCode::NonUmaLnurlNotSupported: return {"NON_UMA_LNURL_NOT_SUPPORTED", 403};
        case ErrorCode::MissingRequiredUmaParameters: return {"MISSING_REQUIRED_UMA_PARAMETERS", 400};
        case ErrorCode::UnsupportedUmaVersion: return {"UNSUPPORTED_UMA_VERSION", 412};
        case ErrorCode::ParseLnurlpRequestError: return {"PARSE_LNURLP_REQUEST_ERROR", 400};
        case ErrorCode::VelocityLimitExceeded: return {"VELOCITY_LIMIT_EXCEEDED", 403};
        case ErrorCode::UserNotFound: return {"USER_NOT_FOUND", 404};
        case ErrorCode::UserNotReady: return {"USER_NOT_READY", 403};
        case ErrorCode::RequestNotFound: return {"REQUEST_NOT_FOUND", 404};
        case ErrorCode::ParsePayreqRequestError: return {"PARSE_PAYREQ_REQUEST_ERROR", 400};
        case ErrorCode::AmountOutOfRange: return {"AMOUNT_OUT_OF_RANGE", 400};
        case ErrorCode::InvalidCurrency: return {"INVALID_CURRENCY", 400};
        case ErrorCode::SenderNotAccepted: return {"SENDER_NOT_ACCEPTED", 400};
        case ErrorCode::MissingMandatoryPayerData: return {"MISSING_MANDATORY_PAYER_DATA", 400};
        case ErrorCode::UnrecognizedMandatoryPayeeDataKey: return {"UNRECOGNIZED_MANDATORY_PAYEE_DATA_KEY", 501};
        case ErrorCode::ParseUtxoCallbackError: return {"PARSE_UTXO_CALLBACK_ERROR", 400};
        case ErrorCode::CounterpartyNotAllowed: return {"COUNTERPARTY_NOT_ALLOWED", 403};
        case ErrorCode::ParseLnurlpResponseError: return {"PARSE_LNURLP_RESPONSE_ERROR", 400};
        case ErrorCode::ParsePayreqResponseError: return {"PARSE_PAYREQ_RESPONSE_ERROR", 400};
        case ErrorCode::LnurlpRequestFailed: return {"LNURLP_REQUEST_FAILED", 424};
        case ErrorCode::PayreqRequestFailed: return {"PAYREQ_REQUEST_FAILED", 424};
        case ErrorCode::NoCompatibleUmaVersion: return {"NO_COMPATIBLE_UMA_VERSION", 424};
        case ErrorCode::InvalidInvoice: return {"INVALID_INVOICE", 400};
        case ErrorCode::InvoiceExpired: return {"INVOICE_EXPIRED", 400};
        case ErrorCode::QuoteExpired: return {"QUOTE_EXPIRED", 400};
        case ErrorCode::InvalidInput: return {"INVALID_INPUT", 400};
        case ErrorCode::InvalidRequestFormat: return {"INVALID_REQUEST_FORMAT", 400};
        case ErrorCode::Forbidden: return {"FORBIDDEN", 403};
        case ErrorCode::NotImplemented: return {"NOT_IMPLEMENTED", 501};
        case ErrorCode::QuoteNotFound: return {"QUOTE_NOT_FOUND", 404};
    }
    return {"INTERNAL_ERROR", 500};
}
[[nodiscard]] constexpr std::string_view ErrorCodeName(const ErrorCode code) noexcept {
    return GetErrorCodeInfo(code).name;
}
[[nodiscard]] constexpr int ErrorCodeHttpStatus(const ErrorCode code) noexcept {
    return GetErrorCodeInfo(code).http_status;
}
}
