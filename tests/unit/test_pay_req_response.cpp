#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/pay_req_response.hpp"
using namespace uma::protocol;

namespace {

PayReqResponseV1 SampleV1() {
    CompliancePayeeData compliance;
    compliance.utxos = {"utxo9"};
    compliance.utxo_callback = "https://vasp2.com/utxo";
    compliance.signature = "3045";
    compliance.signature_nonce = "5150";
    compliance.signature_timestamp = 1700000100;

    PayReqResponseV1 response;
    response.encoded_invoice = "lntb100n1p0abcdef";
    response.payment_info = PayReqResponsePaymentInfo{1000, "USD", 2, 34150.0, 2000};
    response.payee_data = PayeeData::Create(compliance, "$Bob@VASP2.com");
    response.routes = {Route{"02aa", {RouteHop{"03bb", "123x1x0", 10, 1000}}}};
    response.disposable = false;
    response.success_action = std::map<std::string, std::string>{{"tag", "message"}, {"message", "thanks"}};
    return response;
}

} // namespace

TEST_CASE("PayReqResponse - V1 layout", "[pay_req_response][protocol]") {
    SECTION("Round trips with routes and success action") {
        const PayReqResponse response(SampleV1());
        const auto json = response.ToJson().Unwrap();
        REQUIRE(json.find(R"("converted")") != std::string::npos);
        const auto decoded = PayReqResponse::FromJson(json).Unwrap();
        REQUIRE(decoded.IsV1());
        REQUIRE(decoded.IsUmaResponse());
        REQUIRE(decoded == response);
    }

    SECTION("Fee is written as fee and read under either name") {
        const PayReqResponse response(SampleV1());
        const auto json = response.ToJson().Unwrap();
        REQUIRE(json.find(R"("fee":2000)") != std::string::npos);
        REQUIRE(json.find("exchangeFeesMillisatoshi") == std::string::npos);

        const auto legacy = PayReqResponse::FromJson(
            R"({"pr":"lnbc1","routes":[],"converted":{"currencyCode":"USD","decimals":2,)"
            R"("multiplier":34150,"exchangeFeesMillisatoshi":1500}})").Unwrap();
        REQUIRE(legacy.PaymentInfo()->exchange_fees_millisatoshi == 1500);
        REQUIRE_FALSE(legacy.PaymentInfo()->amount.has_value());
    }

    SECTION("Plain LNURL responses are not UMA responses") {
        const auto plain = PayReqResponse::FromJson(R"({"pr":"lnbc1","routes":[]})").Unwrap();
        REQUIRE(plain.IsV1());
        REQUIRE_FALSE(plain.IsUmaResponse());
        REQUIRE(plain.EncodedInvoice() == "lnbc1");
    }

    SECTION("Missing invoice is a parse error") {
        auto result = PayReqResponse::FromJson(R"({"routes":[]})");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::ParsePayreqResponseError);
    }
}

TEST_CASE("PayReqResponse - V0 layout", "[pay_req_response][protocol]") {
    PayReqResponseV0 legacy;
    legacy.encoded_invoice = "lnbc1";
    legacy.compliance = PayReqResponseCompliance{{"utxo1"}, "02ff", "https://vasp2.com/utxo"};
    legacy.payment_info = PayReqResponsePaymentInfo{std::nullopt, "USD", 2, 34150.0, 100};

    const PayReqResponse response(legacy);
    const auto decoded = PayReqResponse::FromJson(response.ToJson().Unwrap()).Unwrap();
    REQUIRE(decoded.IsV0());
    REQUIRE(decoded == response);
    REQUIRE_FALSE(decoded.IsUmaResponse());
    REQUIRE(decoded.SignablePayload("$alice@vasp1.com").IsErr());
    REQUIRE(decoded.WithPayeeCompliance(CompliancePayeeData{}).IsErr());
}

TEST_CASE("PayReqResponse - Signable payload", "[pay_req_response][protocol]") {
    const PayReqResponse response(SampleV1());
    REQUIRE(response.SignablePayload("$Alice@VASP1.com").Unwrap() ==
        "$alice@vasp1.com|$bob@vasp2.com|5150|1700000100");

    auto unsigned_response = SampleV1();
    unsigned_response.payee_data = PayeeData::Create(std::nullopt, "$bob@vasp2.com");
    auto payload = PayReqResponse(unsigned_response).SignablePayload("$alice@vasp1.com");
    REQUIRE(payload.IsErr());
    REQUIRE(payload.UnwrapErr().missing_fields == std::vector<std::string>{"payeeData.compliance"});

    CompliancePayeeData replacement;
    replacement.signature_nonce = "1";
    replacement.signature_timestamp = 2;
    const auto updated = PayReqResponse(unsigned_response).WithPayeeCompliance(replacement).Unwrap();
    REQUIRE(updated.SignablePayload("$alice@vasp1.com").Unwrap() == "$alice@vasp1.com|$bob@vasp2.com|1|2");
}
