#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"
#include "uma/protocol/counter_party_data.hpp"
#include "uma/protocol/payer_data.hpp"
#include "uma/protocol/settlement.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace uma::protocol {

/**
 * @brief Pay request layout for major version 1 and later
 *
 * The amount and sending currency share one wire field,
 * `"<amount>.<code>"`, or just `"<amount>"` when the amount is in
 * millisatoshis.
 */
struct PayRequestV1 {
    std::optional<std::string> sending_currency_code;
    std::optional<std::string> receiving_currency_code;
    int64_t amount = 0;
    std::optional<PayerData> payer_data;
    std::optional<CounterPartyDataOptions> requested_payee_data;
    std::optional<std::string> comment;
    std::optional<std::string> invoice_uuid;
    std::optional<SettlementInfo> settlement;

    bool operator==(const PayRequestV1&) const = default;
};

/// Legacy layout: the receiving currency and the amount are separate
/// fields and payer data is mandatory.
struct PayRequestV0 {
    std::string currency_code;
    int64_t amount = 0;
    PayerData payer_data;

    bool operator==(const PayRequestV0&) const = default;
};

using QueryParamMap = std::map<std::string, std::string>;

/**
 * @brief Request the sender posts to the receiver's callback
 *
 * Closed sum over the V0 and V1 layouts. Decoding selects V0 when a flat
 * `currency` key is present and V1 otherwise.
 */
class PayRequest {
public:
    explicit PayRequest(PayRequestV1 request) : value_(std::move(request)) {}
    explicit PayRequest(PayRequestV0 request) : value_(std::move(request)) {}

    [[nodiscard]] bool IsV0() const noexcept { return std::holds_alternative<PayRequestV0>(value_); }
    [[nodiscard]] bool IsV1() const noexcept { return !IsV0(); }

    [[nodiscard]] const PayRequestV0& AsV0() const { return std::get<PayRequestV0>(value_); }
    [[nodiscard]] const PayRequestV1& AsV1() const { return std::get<PayRequestV1>(value_); }

    [[nodiscard]] int64_t Amount() const noexcept;
    [[nodiscard]] std::optional<std::string> SendingCurrencyCode() const;
    [[nodiscard]] std::optional<std::string> ReceivingCurrencyCode() const;
    [[nodiscard]] const PayerData* GetPayerData() const noexcept;

    /// Payer data carries both an identifier and a compliance block.
    [[nodiscard]] bool IsUmaRequest() const noexcept;

    /// Canonical payload of the payer compliance signature. Fails when the
    /// request has no payer identifier or compliance block.
    [[nodiscard]] Result<std::string, UmaFailure> SignablePayload() const;

    /// Copy with the payer data replaced.
    [[nodiscard]] PayRequest WithPayerData(PayerData payer_data) const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const;
    [[nodiscard]] static Result<PayRequest, UmaFailure> FromJsonObject(const utilities::JsonObject& object);
    [[nodiscard]] static Result<PayRequest, UmaFailure> FromJson(std::string_view json);

    /// GET form of the request. Nested objects are JSON-encoded strings.
    [[nodiscard]] Result<QueryParamMap, UmaFailure> ToQueryParamMap() const;
    [[nodiscard]] static Result<PayRequest, UmaFailure> FromQueryParamMap(const QueryParamMap& params);

    /// Splits `"100.USD"` into (100, "USD") and `"100"` into (100, none).
    [[nodiscard]] static Result<std::pair<int64_t, std::optional<std::string>>, UmaFailure> ParseAmount(
        std::string_view amount);
    [[nodiscard]] static std::string FormatAmount(int64_t amount, const std::optional<std::string>& currency_code);

    bool operator==(const PayRequest&) const = default;

private:
    std::variant<PayRequestV0, PayRequestV1> value_;
};

} // namespace uma::protocol
