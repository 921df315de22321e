#include "uma/protocol/pay_req_response.hpp"
#include "uma/protocol/canonical_payload.hpp"

namespace uma::protocol {

    using utilities::Json;
    using utilities::JsonObject;

    namespace {

        constexpr ErrorCode kParseError = ErrorCode::ParsePayreqResponseError;

        JsonObject PaymentInfoToJson(const PayReqResponsePaymentInfo& info) {
            JsonObject object;
            if (info.amount.has_value()) {
                Json::SetInt64(object, "amount", *info.amount);
            }
            Json::SetString(object, "currencyCode", info.currency_code);
            Json::SetInt64(object, "decimals", info.decimals);
            Json::SetDouble(object, "multiplier", info.multiplier);
            Json::SetInt64(object, "fee", info.exchange_fees_millisatoshi);
            return object;
        }

        Result<PayReqResponsePaymentInfo, UmaFailure> PaymentInfoFromJson(const JsonObject& object) {
            PayReqResponsePaymentInfo info;
            UMA_TRY_ASSIGN(info.amount, Json::GetOptionalInt64(object, "amount", kParseError));
            UMA_TRY_ASSIGN(info.currency_code, Json::GetString(object, "currencyCode", kParseError));
            UMA_TRY_ASSIGN(const int64_t decimals, Json::GetInt64(object, "decimals", kParseError));
            info.decimals = static_cast<int>(decimals);
            UMA_TRY_ASSIGN(info.multiplier, Json::GetDouble(object, "multiplier", kParseError));
            const std::string_view fee_key = Json::Has(object, "fee") ? "fee" : "exchangeFeesMillisatoshi";
            UMA_TRY_ASSIGN(info.exchange_fees_millisatoshi, Json::GetInt64(object, fee_key, kParseError));
            return Result<PayReqResponsePaymentInfo, UmaFailure>::Ok(std::move(info));
        }

        void RoutesToJson(JsonObject& object, const std::vector<Route>& routes) {
            std::vector<JsonObject> route_objects;
            route_objects.reserve(routes.size());
            for (const auto& route : routes) {
                JsonObject route_object;
                Json::SetString(route_object, "pubkey", route.pubkey);
                std::vector<JsonObject> hops;
                hops.reserve(route.path.size());
                for (const auto& hop : route.path) {
                    JsonObject hop_object;
                    Json::SetString(hop_object, "pubkey", hop.pubkey);
                    Json::SetString(hop_object, "channel", hop.channel);
                    Json::SetInt64(hop_object, "fee", hop.fee);
                    Json::SetInt64(hop_object, "msatoshi", hop.msatoshi);
                    hops.push_back(std::move(hop_object));
                }
                Json::SetObjectList(route_object, "path", std::move(hops));
                route_objects.push_back(std::move(route_object));
            }
            Json::SetObjectList(object, "routes", std::move(route_objects));
        }

        Result<std::vector<Route>, UmaFailure> RoutesFromJson(const JsonObject& object) {
            std::vector<Route> routes;
            if (!Json::Has(object, "routes")) {
                return Result<std::vector<Route>, UmaFailure>::Ok(std::move(routes));
            }
            UMA_TRY_ASSIGN(const auto route_objects, Json::GetObjectList(object, "routes", kParseError));
            for (const auto& route_object : route_objects) {
                Route route;
                UMA_TRY_ASSIGN(route.pubkey, Json::GetString(route_object, "pubkey", kParseError));
                UMA_TRY_ASSIGN(const auto hop_objects, Json::GetObjectList(route_object, "path", kParseError));
                for (const auto& hop_object : hop_objects) {
                    RouteHop hop;
                    UMA_TRY_ASSIGN(hop.pubkey, Json::GetString(hop_object, "pubkey", kParseError));
                    UMA_TRY_ASSIGN(hop.channel, Json::GetString(hop_object, "channel", kParseError));
                    UMA_TRY_ASSIGN(hop.fee, Json::GetInt64(hop_object, "fee", kParseError));
                    UMA_TRY_ASSIGN(hop.msatoshi, Json::GetInt64(hop_object, "msatoshi", kParseError));
                    route.path.push_back(std::move(hop));
                }
                routes.push_back(std::move(route));
            }
            return Result<std::vector<Route>, UmaFailure>::Ok(std::move(routes));
        }

    }

    const std::string& PayReqResponse::EncodedInvoice() const {
        return std::visit([](const auto& response) -> const std::string& { return response.encoded_invoice; }, value_);
    }

    std::optional<PayReqResponsePaymentInfo> PayReqResponse::PaymentInfo() const {
        if (IsV0()) {
            return AsV0().payment_info;
        }
        return AsV1().payment_info;
    }

    const std::vector<Route>& PayReqResponse::Routes() const {
        return std::visit([](const auto& response) -> const std::vector<Route>& { return response.routes; }, value_);
    }

    bool PayReqResponse::IsUmaResponse() const noexcept {
        if (IsV0()) {
            return false;
        }
        const auto& response = AsV1();
        return response.payee_data.has_value() &&
               response.payee_data->Identifier().has_value() &&
               response.payee_data->Compliance().has_value() &&
               response.payment_info.has_value();
    }

    Result<std::string, UmaFailure> PayReqResponse::SignablePayload(const std::string_view payer_identifier) const {
        if (IsV0()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::InvalidInput("Legacy pay responses carry no payee signature"));
        }
        const auto& payee_data = AsV1().payee_data;
        if (!payee_data.has_value()) {
            return Result<std::string, UmaFailure>::Err(UmaFailure::MissingRequiredFields({"payeeData"}));
        }
        if (!payee_data->Identifier().has_value()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields({"payeeData.identifier"}));
        }
        const auto& compliance = payee_data->Compliance();
        if (!compliance.has_value()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields({"payeeData.compliance"}));
        }
        return Result<std::string, UmaFailure>::Ok(CanonicalPayload::ForPayReqResponse(
            payer_identifier,
            *payee_data->Identifier(),
            compliance->signature_nonce,
            compliance->signature_timestamp));
    }

    Result<PayReqResponse, UmaFailure> PayReqResponse::WithPayeeCompliance(CompliancePayeeData compliance) const {
        if (IsV0()) {
            return Result<PayReqResponse, UmaFailure>::Err(
                UmaFailure::InvalidInput("Legacy pay responses carry no payee data"));
        }
        PayReqResponseV1 copy = AsV1();
        if (!copy.payee_data.has_value()) {
            copy.payee_data = PayeeData();
        }
        copy.payee_data = copy.payee_data->WithCompliance(std::move(compliance));
        return Result<PayReqResponse, UmaFailure>::Ok(PayReqResponse(std::move(copy)));
    }

    JsonObject PayReqResponse::ToJsonObject() const {
        JsonObject object;
        if (IsV0()) {
            const auto& response = AsV0();
            Json::SetString(object, "pr", response.encoded_invoice);
            JsonObject compliance;
            Json::SetStringList(compliance, "utxos", response.compliance.utxos);
            if (response.compliance.node_pub_key.has_value()) {
                Json::SetString(compliance, "nodePubKey", *response.compliance.node_pub_key);
            }
            Json::SetString(compliance, "utxoCallback", response.compliance.utxo_callback);
            Json::SetObject(object, "compliance", std::move(compliance));
            Json::SetObject(object, "paymentInfo", PaymentInfoToJson(response.payment_info));
            RoutesToJson(object, response.routes);
            return object;
        }
        const auto& response = AsV1();
        Json::SetString(object, "pr", response.encoded_invoice);
        if (response.payment_info.has_value()) {
            Json::SetObject(object, "converted", PaymentInfoToJson(*response.payment_info));
        }
        if (response.payee_data.has_value()) {
            Json::SetObject(object, "payeeData", response.payee_data->ToJsonObject());
        }
        RoutesToJson(object, response.routes);
        if (response.disposable.has_value()) {
            Json::SetBool(object, "disposable", *response.disposable);
        }
        if (response.success_action.has_value()) {
            JsonObject action;
            for (const auto& [key, value] : *response.success_action) {
                Json::SetString(action, key, value);
            }
            Json::SetObject(object, "successAction", std::move(action));
        }
        return object;
    }

    Result<std::string, UmaFailure> PayReqResponse::ToJson() const {
        return Json::Serialize(ToJsonObject());
    }

    Result<PayReqResponse, UmaFailure> PayReqResponse::FromJsonObject(const JsonObject& object) {
        if (Json::Has(object, "compliance")) {
            PayReqResponseV0 response;
            UMA_TRY_ASSIGN(response.encoded_invoice, Json::GetString(object, "pr", kParseError));
            UMA_TRY_ASSIGN(const auto compliance, Json::GetObject(object, "compliance", kParseError));
            if (Json::Has(compliance, "utxos")) {
                UMA_TRY_ASSIGN(response.compliance.utxos, Json::GetStringList(compliance, "utxos", kParseError));
            }
            UMA_TRY_ASSIGN(response.compliance.node_pub_key,
                Json::GetOptionalString(compliance, "nodePubKey", kParseError));
            UMA_TRY_ASSIGN(const auto callback, Json::GetOptionalString(compliance, "utxoCallback", kParseError));
            response.compliance.utxo_callback = callback.value_or("");
            UMA_TRY_ASSIGN(const auto payment_info, Json::GetObject(object, "paymentInfo", kParseError));
            UMA_TRY_ASSIGN(response.payment_info, PaymentInfoFromJson(payment_info));
            UMA_TRY_ASSIGN(response.routes, RoutesFromJson(object));
            return Result<PayReqResponse, UmaFailure>::Ok(PayReqResponse(std::move(response)));
        }

        PayReqResponseV1 response;
        UMA_TRY_ASSIGN(response.encoded_invoice, Json::GetString(object, "pr", kParseError));
        UMA_TRY_ASSIGN(const auto converted, Json::GetOptionalObject(object, "converted", kParseError));
        if (converted.has_value()) {
            UMA_TRY_ASSIGN(response.payment_info, PaymentInfoFromJson(*converted));
        }
        UMA_TRY_ASSIGN(const auto payee_object, Json::GetOptionalObject(object, "payeeData", kParseError));
        if (payee_object.has_value()) {
            UMA_TRY_ASSIGN(response.payee_data, PayeeData::FromJsonObject(*payee_object, kParseError));
        }
        UMA_TRY_ASSIGN(response.routes, RoutesFromJson(object));
        UMA_TRY_ASSIGN(response.disposable, Json::GetOptionalBool(object, "disposable", kParseError));
        UMA_TRY_ASSIGN(const auto action, Json::GetOptionalObject(object, "successAction", kParseError));
        if (action.has_value()) {
            std::map<std::string, std::string> success_action;
            for (const auto& entry : action->fields()) {
                UMA_TRY_ASSIGN(auto value, Json::GetString(*action, entry.first, kParseError));
                success_action.emplace(entry.first, std::move(value));
            }
            response.success_action = std::move(success_action);
        }
        return Result<PayReqResponse, UmaFailure>::Ok(PayReqResponse(std::move(response)));
    }

    Result<PayReqResponse, UmaFailure> PayReqResponse::FromJson(const std::string_view json) {
        UMA_TRY_ASSIGN(const auto object, Json::ParseObject(json, kParseError));
        return FromJsonObject(object);
    }

}
