#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"
#include "uma/protocol/payee_data.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uma::protocol {

struct RouteHop {
    std::string pubkey;
    std::string channel;
    int64_t fee = 0;
    int64_t msatoshi = 0;

    bool operator==(const RouteHop&) const = default;
};

struct Route {
    std::string pubkey;
    std::vector<RouteHop> path;

    bool operator==(const Route&) const = default;
};

/**
 * @brief Conversion the receiver applied to produce the invoice amount
 *
 * `multiplier` is millisatoshis per smallest unit of the receiving
 * currency; the fee is in millisatoshis and already included in the
 * invoice. Serialized as "fee"; decoders also accept the older
 * "exchangeFeesMillisatoshi" key.
 */
struct PayReqResponsePaymentInfo {
    std::optional<int64_t> amount;
    std::string currency_code;
    int decimals = 0;
    double multiplier = 0.0;
    int64_t exchange_fees_millisatoshi = 0;

    bool operator==(const PayReqResponsePaymentInfo&) const = default;
};

/// Fixed receiver compliance struct of the legacy layout.
struct PayReqResponseCompliance {
    std::vector<std::string> utxos;
    std::optional<std::string> node_pub_key;
    std::string utxo_callback;

    bool operator==(const PayReqResponseCompliance&) const = default;
};

struct PayReqResponseV1 {
    std::string encoded_invoice;
    std::optional<PayReqResponsePaymentInfo> payment_info;
    std::optional<PayeeData> payee_data;
    std::vector<Route> routes;
    std::optional<bool> disposable;
    std::optional<std::map<std::string, std::string>> success_action;

    bool operator==(const PayReqResponseV1&) const = default;
};

struct PayReqResponseV0 {
    std::string encoded_invoice;
    PayReqResponseCompliance compliance;
    PayReqResponsePaymentInfo payment_info;
    std::vector<Route> routes;

    bool operator==(const PayReqResponseV0&) const = default;
};

/**
 * @brief Receiver's answer to a pay request, carrying the invoice
 *
 * Closed sum over the V0 and V1 layouts. Decoding selects V0 when a
 * top-level `compliance` key is present and V1 otherwise.
 */
class PayReqResponse {
public:
    explicit PayReqResponse(PayReqResponseV1 response) : value_(std::move(response)) {}
    explicit PayReqResponse(PayReqResponseV0 response) : value_(std::move(response)) {}

    [[nodiscard]] bool IsV0() const noexcept { return std::holds_alternative<PayReqResponseV0>(value_); }
    [[nodiscard]] bool IsV1() const noexcept { return !IsV0(); }

    [[nodiscard]] const PayReqResponseV0& AsV0() const { return std::get<PayReqResponseV0>(value_); }
    [[nodiscard]] const PayReqResponseV1& AsV1() const { return std::get<PayReqResponseV1>(value_); }

    [[nodiscard]] const std::string& EncodedInvoice() const;
    [[nodiscard]] std::optional<PayReqResponsePaymentInfo> PaymentInfo() const;
    [[nodiscard]] const std::vector<Route>& Routes() const;

    /// V1 only: payee data carries an identifier and compliance, and a
    /// conversion is present.
    [[nodiscard]] bool IsUmaResponse() const noexcept;

    /// Lower-cased `payerIdentifier|payeeIdentifier|nonce|timestamp`.
    [[nodiscard]] Result<std::string, UmaFailure> SignablePayload(std::string_view payer_identifier) const;

    /// Copy with the payee compliance block replaced. V1 only.
    [[nodiscard]] Result<PayReqResponse, UmaFailure> WithPayeeCompliance(CompliancePayeeData compliance) const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const;
    [[nodiscard]] static Result<PayReqResponse, UmaFailure> FromJsonObject(const utilities::JsonObject& object);
    [[nodiscard]] static Result<PayReqResponse, UmaFailure> FromJson(std::string_view json);

    bool operator==(const PayReqResponse&) const = default;

private:
    std::variant<PayReqResponseV0, PayReqResponseV1> value_;
};

} // namespace uma::protocol
