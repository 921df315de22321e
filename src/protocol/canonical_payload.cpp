#include "uma/protocol/canonical_payload.hpp"
#include "uma/protocol/constants.hpp"

#include <algorithm>
#include <initializer_list>

namespace uma::protocol {

    namespace {

        std::string JoinFields(std::initializer_list<std::string_view> fields) {
            std::string out;
            bool first = true;
            for (const auto field : fields) {
                if (!first) {
                    out.push_back(kPayloadDelimiter);
                }
                out.append(field);
                first = false;
            }
            return out;
        }

    }

    std::string CanonicalPayload::ToLowerAscii(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
            return static_cast<char>(c >= 'A' && c <= 'Z' ? c + ('a' - 'A') : c);
        });
        return value;
    }

    std::string CanonicalPayload::ForLnurlpRequest(
        const std::string_view receiver_address, const std::string_view nonce, const int64_t timestamp) {
        return JoinFields({receiver_address, nonce, std::to_string(timestamp)});
    }

    std::string CanonicalPayload::ForLnurlpComplianceResponse(
        const std::string_view receiver_identifier, const std::string_view nonce, const int64_t timestamp) {
        return ToLowerAscii(ForLnurlpRequest(receiver_identifier, nonce, timestamp));
    }

    std::string CanonicalPayload::ForPayRequest(
        const std::string_view payer_identifier, const std::string_view nonce, const int64_t timestamp) {
        return ToLowerAscii(ForPayRequestV0(payer_identifier, nonce, timestamp));
    }

    std::string CanonicalPayload::ForPayRequestV0(
        const std::string_view payer_identifier, const std::string_view nonce, const int64_t timestamp) {
        return ForLnurlpRequest(payer_identifier, nonce, timestamp);
    }

    std::string CanonicalPayload::ForPayReqResponse(
        const std::string_view payer_identifier,
        const std::string_view payee_identifier,
        const std::string_view nonce,
        const int64_t timestamp) {
        return ToLowerAscii(JoinFields({payer_identifier, payee_identifier, nonce, std::to_string(timestamp)}));
    }

    std::string CanonicalPayload::ForPostTransactionCallback(const std::string_view nonce, const int64_t timestamp) {
        return JoinFields({nonce, std::to_string(timestamp)});
    }

}
