#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace uma::protocol {

/// Bounds in the smallest unit of the currency (cents for USD).
struct CurrencyConvertible {
    int64_t min = 0;
    int64_t max = 0;

    bool operator==(const CurrencyConvertible&) const = default;
};

struct CurrencyV1 {
    std::string code;
    std::string name;
    std::string symbol;
    double millisatoshi_per_unit = 0.0;
    CurrencyConvertible convertible;
    int decimals = 0;

    bool operator==(const CurrencyV1&) const = default;
};

struct CurrencyV0 {
    std::string code;
    std::string name;
    std::string symbol;
    double millisatoshi_per_unit = 0.0;
    int64_t min_sendable = 0;
    int64_t max_sendable = 0;
    int decimals = 0;

    bool operator==(const CurrencyV0&) const = default;
};

/**
 * @brief A currency offered in an lnurlp response
 *
 * The wire layout depends on the negotiated major version: V1 nests the
 * bounds under `convertible`, V0 carries flat `minSendable`/`maxSendable`.
 * Decoding picks V0 when `minSendable` is present.
 */
class Currency {
public:
    explicit Currency(CurrencyV1 currency) : value_(std::move(currency)) {}
    explicit Currency(CurrencyV0 currency) : value_(std::move(currency)) {}

    /// Chooses the layout for `uma_version`: V0 below major 1, V1 otherwise.
    [[nodiscard]] static Result<Currency, UmaFailure> Create(
        std::string code,
        std::string name,
        std::string symbol,
        double millisatoshi_per_unit,
        int decimals,
        int64_t min_sendable,
        int64_t max_sendable,
        std::string_view uma_version);

    [[nodiscard]] bool IsV0() const noexcept { return std::holds_alternative<CurrencyV0>(value_); }

    [[nodiscard]] const std::string& Code() const;
    [[nodiscard]] const std::string& Name() const;
    [[nodiscard]] const std::string& Symbol() const;
    [[nodiscard]] double MillisatoshiPerUnit() const;
    [[nodiscard]] int Decimals() const;
    [[nodiscard]] int64_t MinSendable() const;
    [[nodiscard]] int64_t MaxSendable() const;

    [[nodiscard]] Currency ToV0() const;
    [[nodiscard]] Currency ToV1() const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;

    [[nodiscard]] static Result<Currency, UmaFailure> FromJsonObject(
        const utilities::JsonObject& object, ErrorCode error_code);

    bool operator==(const Currency&) const = default;

private:
    std::variant<CurrencyV0, CurrencyV1> value_;
};

} // namespace uma::protocol
