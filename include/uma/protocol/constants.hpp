#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace uma::protocol {

inline constexpr int kUmaMajorVersion = 1;
inline constexpr int kUmaMinorVersion = 0;
inline constexpr std::string_view kUmaBackwardCompatibleVersion = "0.3";

inline constexpr std::string_view kWellKnownPrefix = "/.well-known/";
inline constexpr std::string_view kLnurlpPathSegment = "lnurlp";
inline constexpr std::string_view kPubKeyPath = "/.well-known/lnurlpubkey";
inline constexpr std::string_view kPayRequestTag = "payRequest";

inline constexpr std::string_view kPayerDataComplianceKey = "compliance";
inline constexpr std::string_view kPayerDataIdentifierKey = "identifier";
inline constexpr std::string_view kPayerDataNameKey = "name";
inline constexpr std::string_view kPayerDataEmailKey = "email";

inline constexpr char kPayloadDelimiter = '|';
inline constexpr char kAmountCurrencyDelimiter = '.';
inline constexpr char kBackingSignatureDelimiter = ':';
inline constexpr char kBackingSignatureListDelimiter = ',';
inline constexpr char kAddressDelimiter = '@';

inline constexpr std::string_view kInvoiceHumanReadablePrefix = "uma";

namespace invoice_tags {
inline constexpr uint8_t kReceiverUma = 0;
inline constexpr uint8_t kInvoiceUuid = 1;
inline constexpr uint8_t kAmount = 2;
inline constexpr uint8_t kReceivingCurrency = 3;
inline constexpr uint8_t kExpiration = 4;
inline constexpr uint8_t kIsSubjectToTravelRule = 5;
inline constexpr uint8_t kRequiredPayerData = 6;
inline constexpr uint8_t kUmaVersion = 7;
inline constexpr uint8_t kCommentCharsAllowed = 8;
inline constexpr uint8_t kSenderUma = 9;
inline constexpr uint8_t kInvoiceLimit = 10;
inline constexpr uint8_t kKycStatus = 11;
inline constexpr uint8_t kCallback = 12;
inline constexpr uint8_t kSignature = 100;

inline constexpr uint8_t kCurrencyCode = 0;
inline constexpr uint8_t kCurrencyName = 1;
inline constexpr uint8_t kCurrencySymbol = 2;
inline constexpr uint8_t kCurrencyDecimals = 3;
}

}
