#include "uma/protocol/pay_request.hpp"
#include "uma/protocol/canonical_payload.hpp"
#include "uma/protocol/constants.hpp"

#include <charconv>

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    namespace {

        constexpr ErrorCode kParseError = ErrorCode::ParsePayreqRequestError;

        template<typename T>
        Result<T, UmaFailure> ParseJsonParam(
            const std::string& text,
            Result<T, UmaFailure> (*from_object)(const JsonObject&, ErrorCode)) {
            UMA_TRY_ASSIGN(const auto object, Json::ParseObject(text, kParseError));
            return from_object(object, kParseError);
        }

    }

    Result<std::pair<int64_t, std::optional<std::string>>, UmaFailure> PayRequest::ParseAmount(
        const std::string_view amount) {
        using ParsedAmount = std::pair<int64_t, std::optional<std::string>>;
        const auto dot = amount.find(kAmountCurrencyDelimiter);
        const std::string_view number = dot == std::string_view::npos ? amount : amount.substr(0, dot);

        int64_t value = 0;
        const auto [end, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
        if (number.empty() || ec != std::errc() || end != number.data() + number.size()) {
            return Result<ParsedAmount, UmaFailure>::Err(
                UmaFailure::Of(kParseError, "Invalid amount: " + std::string(amount)));
        }
        if (dot == std::string_view::npos) {
            return Result<ParsedAmount, UmaFailure>::Ok(ParsedAmount{value, std::nullopt});
        }
        const std::string_view code = amount.substr(dot + 1);
        if (code.empty()) {
            return Result<ParsedAmount, UmaFailure>::Err(
                UmaFailure::Of(kParseError, "Invalid amount: " + std::string(amount)));
        }
        return Result<ParsedAmount, UmaFailure>::Ok(ParsedAmount{value, std::string(code)});
    }

    std::string PayRequest::FormatAmount(const int64_t amount, const std::optional<std::string>& currency_code) {
        if (!currency_code.has_value()) {
            return std::to_string(amount);
        }
        return std::to_string(amount) + kAmountCurrencyDelimiter + *currency_code;
    }

    int64_t PayRequest::Amount() const noexcept {
        return std::visit([](const auto& request) { return request.amount; }, value_);
    }

    std::optional<std::string> PayRequest::SendingCurrencyCode() const {
        if (IsV0()) {
            return std::nullopt;
        }
        return AsV1().sending_currency_code;
    }

    std::optional<std::string> PayRequest::ReceivingCurrencyCode() const {
        if (IsV0()) {
            return AsV0().currency_code;
        }
        return AsV1().receiving_currency_code;
    }

    const PayerData* PayRequest::GetPayerData() const noexcept {
        if (const auto* v0 = std::get_if<PayRequestV0>(&value_)) {
            return &v0->payer_data;
        }
        const auto& v1 = std::get<PayRequestV1>(value_);
        return v1.payer_data.has_value() ? &*v1.payer_data : nullptr;
    }

    bool PayRequest::IsUmaRequest() const noexcept {
        const PayerData* payer_data = GetPayerData();
        return payer_data != nullptr && payer_data->Identifier().has_value() &&
               payer_data->Compliance().has_value();
    }

    Result<std::string, UmaFailure> PayRequest::SignablePayload() const {
        const PayerData* payer_data = GetPayerData();
        if (payer_data == nullptr) {
            return Result<std::string, UmaFailure>::Err(UmaFailure::MissingRequiredFields({"payerData"}));
        }
        if (!payer_data->Identifier().has_value()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields({"payerData.identifier"}));
        }
        const auto& compliance = payer_data->Compliance();
        if (!compliance.has_value()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields({"payerData.compliance"}));
        }
        if (IsV0()) {
            return Result<std::string, UmaFailure>::Ok(CanonicalPayload::ForPayRequestV0(
                *payer_data->Identifier(), compliance->signature_nonce, compliance->signature_timestamp));
        }
        return Result<std::string, UmaFailure>::Ok(CanonicalPayload::ForPayRequest(
            *payer_data->Identifier(), compliance->signature_nonce, compliance->signature_timestamp));
    }

    PayRequest PayRequest::WithPayerData(PayerData payer_data) const {
        if (IsV0()) {
            PayRequestV0 copy = AsV0();
            copy.payer_data = std::move(payer_data);
            return PayRequest(std::move(copy));
        }
        PayRequestV1 copy = AsV1();
        copy.payer_data = std::move(payer_data);
        return PayRequest(std::move(copy));
    }

    JsonObject PayRequest::ToJsonObject() const {
        JsonObject object;
        if (IsV0()) {
            const auto& request = AsV0();
            Json::SetString(object, "currency", request.currency_code);
            Json::SetInt64(object, "amount", request.amount);
            Json::SetObject(object, "payerData", request.payer_data.ToJsonObject());
            return object;
        }
        const auto& request = AsV1();
        if (request.receiving_currency_code.has_value()) {
            Json::SetString(object, "convert", *request.receiving_currency_code);
        }
        Json::SetString(object, "amount", FormatAmount(request.amount, request.sending_currency_code));
        if (request.payer_data.has_value()) {
            Json::SetObject(object, "payerData", request.payer_data->ToJsonObject());
        }
        if (request.requested_payee_data.has_value()) {
            Json::SetObject(object, "payeeData", CounterPartyData::ToJsonObject(*request.requested_payee_data));
        }
        if (request.comment.has_value()) {
            Json::SetString(object, "comment", *request.comment);
        }
        if (request.invoice_uuid.has_value()) {
            Json::SetString(object, "invoiceUUID", *request.invoice_uuid);
        }
        if (request.settlement.has_value()) {
            Json::SetObject(object, "settlement", request.settlement->ToJsonObject());
        }
        return object;
    }

    Result<std::string, UmaFailure> PayRequest::ToJson() const {
        return Json::Serialize(ToJsonObject());
    }

    Result<PayRequest, UmaFailure> PayRequest::FromJsonObject(const JsonObject& object) {
        if (Json::Has(object, "currency")) {
            PayRequestV0 request;
            UMA_TRY_ASSIGN(request.currency_code, Json::GetString(object, "currency", kParseError));
            UMA_TRY_ASSIGN(request.amount, Json::GetInt64(object, "amount", kParseError));
            UMA_TRY_ASSIGN(const auto payer_object, Json::GetObject(object, "payerData", kParseError));
            UMA_TRY_ASSIGN(request.payer_data, PayerData::FromJsonObject(payer_object, kParseError));
            return Result<PayRequest, UmaFailure>::Ok(PayRequest(std::move(request)));
        }

        PayRequestV1 request;
        const auto* amount = Json::Find(object, "amount");
        if (amount == nullptr) {
            return Result<PayRequest, UmaFailure>::Err(UmaFailure::MissingRequiredFields({"amount"}));
        }
        if (amount->kind_case() == utilities::JsonValue::kStringValue) {
            UMA_TRY_ASSIGN(const auto parsed, ParseAmount(amount->string_value()));
            request.amount = parsed.first;
            request.sending_currency_code = parsed.second;
        } else {
            UMA_TRY_ASSIGN(request.amount, Json::AsInt64(*amount, "amount", kParseError));
        }
        UMA_TRY_ASSIGN(request.receiving_currency_code, Json::GetOptionalString(object, "convert", kParseError));
        UMA_TRY_ASSIGN(const auto payer_object, Json::GetOptionalObject(object, "payerData", kParseError));
        if (payer_object.has_value()) {
            UMA_TRY_ASSIGN(request.payer_data, PayerData::FromJsonObject(*payer_object, kParseError));
        }
        UMA_TRY_ASSIGN(request.requested_payee_data,
            CounterPartyData::OptionalFromJson(object, "payeeData", kParseError));
        UMA_TRY_ASSIGN(request.comment, Json::GetOptionalString(object, "comment", kParseError));
        UMA_TRY_ASSIGN(request.invoice_uuid, Json::GetOptionalString(object, "invoiceUUID", kParseError));
        UMA_TRY_ASSIGN(const auto settlement_object, Json::GetOptionalObject(object, "settlement", kParseError));
        if (settlement_object.has_value()) {
            UMA_TRY_ASSIGN(request.settlement, SettlementInfo::FromJsonObject(*settlement_object, kParseError));
        }
        return Result<PayRequest, UmaFailure>::Ok(PayRequest(std::move(request)));
    }

    Result<PayRequest, UmaFailure> PayRequest::FromJson(const std::string_view json) {
        UMA_TRY_ASSIGN(const auto object, Json::ParseObject(json, kParseError));
        return FromJsonObject(object);
    }

    Result<QueryParamMap, UmaFailure> PayRequest::ToQueryParamMap() const {
        QueryParamMap params;
        if (IsV0()) {
            const auto& request = AsV0();
            params["amount"] = std::to_string(request.amount);
            params["convert"] = request.currency_code;
            UMA_TRY_ASSIGN(params["payerData"], Json::Serialize(request.payer_data.ToJsonObject()));
            return Result<QueryParamMap, UmaFailure>::Ok(std::move(params));
        }
        const auto& request = AsV1();
        params["amount"] = FormatAmount(request.amount, request.sending_currency_code);
        if (request.receiving_currency_code.has_value()) {
            params["convert"] = *request.receiving_currency_code;
        }
        if (request.payer_data.has_value()) {
            UMA_TRY_ASSIGN(params["payerData"], Json::Serialize(request.payer_data->ToJsonObject()));
        }
        if (request.requested_payee_data.has_value()) {
            UMA_TRY_ASSIGN(params["payeeData"],
                Json::Serialize(CounterPartyData::ToJsonObject(*request.requested_payee_data)));
        }
        if (request.comment.has_value()) {
            params["comment"] = *request.comment;
        }
        if (request.invoice_uuid.has_value()) {
            params["invoiceUUID"] = *request.invoice_uuid;
        }
        if (request.settlement.has_value()) {
            UMA_TRY_ASSIGN(params["settlement"], Json::Serialize(request.settlement->ToJsonObject()));
        }
        return Result<QueryParamMap, UmaFailure>::Ok(std::move(params));
    }

    Result<PayRequest, UmaFailure> PayRequest::FromQueryParamMap(const QueryParamMap& params) {
        const auto amount = params.find("amount");
        if (amount == params.end()) {
            return Result<PayRequest, UmaFailure>::Err(UmaFailure::MissingRequiredFields({"amount"}));
        }
        PayRequestV1 request;
        UMA_TRY_ASSIGN(const auto parsed, ParseAmount(amount->second));
        request.amount = parsed.first;
        request.sending_currency_code = parsed.second;
        if (const auto it = params.find("convert"); it != params.end()) {
            request.receiving_currency_code = it->second;
        }
        if (const auto it = params.find("payerData"); it != params.end()) {
            UMA_TRY_ASSIGN(request.payer_data, ParseJsonParam<PayerData>(it->second, &PayerData::FromJsonObject));
        }
        if (const auto it = params.find("payeeData"); it != params.end()) {
            UMA_TRY_ASSIGN(request.requested_payee_data,
                ParseJsonParam<CounterPartyDataOptions>(it->second, &CounterPartyData::FromJsonObject));
        }
        if (const auto it = params.find("comment"); it != params.end()) {
            request.comment = it->second;
        }
        if (const auto it = params.find("invoiceUUID"); it != params.end()) {
            request.invoice_uuid = it->second;
        }
        if (const auto it = params.find("settlement"); it != params.end()) {
            UMA_TRY_ASSIGN(request.settlement,
                ParseJsonParam<SettlementInfo>(it->second, &SettlementInfo::FromJsonObject));
        }
        return Result<PayRequest, UmaFailure>::Ok(PayRequest(std::move(request)));
    }

}
