#include "uma/protocol/currency.hpp"
#include "uma/protocol/version.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    namespace {

        template<typename F>
        decltype(auto) Visit(const std::variant<CurrencyV0, CurrencyV1>& value, F&& func) {
            return std::visit(std::forward<F>(func), value);
        }

    }

    Result<Currency, UmaFailure> Currency::Create(
        std::string code,
        std::string name,
        std::string symbol,
        const double millisatoshi_per_unit,
        const int decimals,
        const int64_t min_sendable,
        const int64_t max_sendable,
        std::string_view uma_version) {
        UMA_TRY_ASSIGN(const Version version, Version::Parse(uma_version));
        if (version.major < 1) {
            return Result<Currency, UmaFailure>::Ok(Currency(CurrencyV0{
                std::move(code), std::move(name), std::move(symbol),
                millisatoshi_per_unit, min_sendable, max_sendable, decimals}));
        }
        return Result<Currency, UmaFailure>::Ok(Currency(CurrencyV1{
            std::move(code), std::move(name), std::move(symbol),
            millisatoshi_per_unit, CurrencyConvertible{min_sendable, max_sendable}, decimals}));
    }

    const std::string& Currency::Code() const {
        return Visit(value_, [](const auto& c) -> const std::string& { return c.code; });
    }

    const std::string& Currency::Name() const {
        return Visit(value_, [](const auto& c) -> const std::string& { return c.name; });
    }

    const std::string& Currency::Symbol() const {
        return Visit(value_, [](const auto& c) -> const std::string& { return c.symbol; });
    }

    double Currency::MillisatoshiPerUnit() const {
        return Visit(value_, [](const auto& c) { return c.millisatoshi_per_unit; });
    }

    int Currency::Decimals() const {
        return Visit(value_, [](const auto& c) { return c.decimals; });
    }

    int64_t Currency::MinSendable() const {
        if (const auto* v0 = std::get_if<CurrencyV0>(&value_)) {
            return v0->min_sendable;
        }
        return std::get<CurrencyV1>(value_).convertible.min;
    }

    int64_t Currency::MaxSendable() const {
        if (const auto* v0 = std::get_if<CurrencyV0>(&value_)) {
            return v0->max_sendable;
        }
        return std::get<CurrencyV1>(value_).convertible.max;
    }

    Currency Currency::ToV0() const {
        return Currency(CurrencyV0{
            Code(), Name(), Symbol(), MillisatoshiPerUnit(), MinSendable(), MaxSendable(), Decimals()});
    }

    Currency Currency::ToV1() const {
        return Currency(CurrencyV1{
            Code(), Name(), Symbol(), MillisatoshiPerUnit(),
            CurrencyConvertible{MinSendable(), MaxSendable()}, Decimals()});
    }

    JsonObject Currency::ToJsonObject() const {
        JsonObject object;
        Json::SetString(object, "code", Code());
        Json::SetString(object, "name", Name());
        Json::SetString(object, "symbol", Symbol());
        Json::SetDouble(object, "multiplier", MillisatoshiPerUnit());
        Json::SetInt64(object, "decimals", Decimals());
        if (IsV0()) {
            Json::SetInt64(object, "minSendable", MinSendable());
            Json::SetInt64(object, "maxSendable", MaxSendable());
        } else {
            JsonObject convertible;
            Json::SetInt64(convertible, "min", MinSendable());
            Json::SetInt64(convertible, "max", MaxSendable());
            Json::SetObject(object, "convertible", std::move(convertible));
        }
        return object;
    }

    Result<Currency, UmaFailure> Currency::FromJsonObject(const JsonObject& object, const ErrorCode error_code) {
        UMA_TRY_ASSIGN(std::string code, Json::GetString(object, "code", error_code));
        UMA_TRY_ASSIGN(std::string name, Json::GetString(object, "name", error_code));
        UMA_TRY_ASSIGN(std::string symbol, Json::GetString(object, "symbol", error_code));
        UMA_TRY_ASSIGN(const double multiplier, Json::GetDouble(object, "multiplier", error_code));
        UMA_TRY_ASSIGN(const int64_t decimals, Json::GetInt64(object, "decimals", error_code));

        if (Json::Has(object, "minSendable")) {
            UMA_TRY_ASSIGN(const int64_t min_sendable, Json::GetInt64(object, "minSendable", error_code));
            UMA_TRY_ASSIGN(const int64_t max_sendable, Json::GetInt64(object, "maxSendable", error_code));
            return Result<Currency, UmaFailure>::Ok(Currency(CurrencyV0{
                std::move(code), std::move(name), std::move(symbol),
                multiplier, min_sendable, max_sendable, static_cast<int>(decimals)}));
        }

        UMA_TRY_ASSIGN(const auto convertible, Json::GetObject(object, "convertible", error_code));
        UMA_TRY_ASSIGN(const int64_t min, Json::GetInt64(convertible, "min", error_code));
        UMA_TRY_ASSIGN(const int64_t max, Json::GetInt64(convertible, "max", error_code));
        return Result<Currency, UmaFailure>::Ok(Currency(CurrencyV1{
            std::move(code), std::move(name), std::move(symbol),
            multiplier, CurrencyConvertible{min, max}, static_cast<int>(decimals)}));
    }

}
