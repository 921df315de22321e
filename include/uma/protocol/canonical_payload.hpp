#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace uma::protocol {

/**
 * @brief Canonical byte strings covered by each message signature
 *
 * Fields are joined with '|'. These layouts are shared with every peer
 * implementation, so changing a field order or the case handling breaks
 * signature interoperability.
 */
class CanonicalPayload {
public:
    /// receiverAddress|nonce|timestamp, case preserved.
    [[nodiscard]] static std::string ForLnurlpRequest(
        std::string_view receiver_address, std::string_view nonce, int64_t timestamp);

    /// receiverIdentifier|nonce|timestamp, lower-cased.
    [[nodiscard]] static std::string ForLnurlpComplianceResponse(
        std::string_view receiver_identifier, std::string_view nonce, int64_t timestamp);

    /// payerIdentifier|nonce|timestamp, lower-cased.
    [[nodiscard]] static std::string ForPayRequest(
        std::string_view payer_identifier, std::string_view nonce, int64_t timestamp);

    /// Legacy V0 layout. Same fields as ForPayRequest with case preserved.
    [[nodiscard]] static std::string ForPayRequestV0(
        std::string_view payer_identifier, std::string_view nonce, int64_t timestamp);

    /// payerIdentifier|payeeIdentifier|nonce|timestamp, lower-cased.
    [[nodiscard]] static std::string ForPayReqResponse(
        std::string_view payer_identifier,
        std::string_view payee_identifier,
        std::string_view nonce,
        int64_t timestamp);

    /// nonce|timestamp
    [[nodiscard]] static std::string ForPostTransactionCallback(std::string_view nonce, int64_t timestamp);

    [[nodiscard]] static std::string ToLowerAscii(std::string value);

private:
    CanonicalPayload() = delete;
};

} // namespace uma::protocol
