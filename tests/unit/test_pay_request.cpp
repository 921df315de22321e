#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/pay_request.hpp"
using namespace uma::protocol;

namespace {

CompliancePayerData SampleCompliance() {
    CompliancePayerData compliance;
    compliance.utxos = {"utxo1", "utxo2"};
    compliance.kyc_status = KycStatus::Verified;
    compliance.utxo_callback = "https://vasp1.com/utxo";
    compliance.signature = "3045";
    compliance.signature_nonce = "4242";
    compliance.signature_timestamp = 1700000000;
    return compliance;
}

PayRequest SampleV1() {
    PayRequestV1 request;
    request.sending_currency_code = "USD";
    request.receiving_currency_code = "EUR";
    request.amount = 1000;
    request.payer_data = PayerData::Create("$Alice@VASP1.com", SampleCompliance(), "Alice");
    request.requested_payee_data = CounterPartyData::CreateOptions({{"identifier", true}});
    request.comment = "rent";
    request.invoice_uuid = "c7c07fec-cf00-431c-916f-6c13fc4b69f9";
    request.settlement = SettlementInfo{"ln", "BTC"};
    return PayRequest(std::move(request));
}

} // namespace

TEST_CASE("PayRequest - Amount field", "[pay_request][protocol]") {
    SECTION("Currency suffix is optional") {
        const auto with_code = PayRequest::ParseAmount("100.USD").Unwrap();
        REQUIRE(with_code.first == 100);
        REQUIRE(with_code.second == std::optional<std::string>("USD"));

        const auto msats = PayRequest::ParseAmount("100").Unwrap();
        REQUIRE(msats.first == 100);
        REQUIRE_FALSE(msats.second.has_value());
    }

    SECTION("Malformed amounts are rejected") {
        REQUIRE(PayRequest::ParseAmount("").IsErr());
        REQUIRE(PayRequest::ParseAmount("abc").IsErr());
        REQUIRE(PayRequest::ParseAmount("100.").IsErr());
        REQUIRE(PayRequest::ParseAmount("1.5.USD").IsErr());
        REQUIRE(PayRequest::ParseAmount("100").IsOk());
    }

    SECTION("Formatting matches parsing") {
        REQUIRE(PayRequest::FormatAmount(100, "USD") == "100.USD");
        REQUIRE(PayRequest::FormatAmount(100, std::nullopt) == "100");
    }
}

TEST_CASE("PayRequest - Version layouts", "[pay_request][protocol]") {
    SECTION("V1 round trips through JSON") {
        const auto request = SampleV1();
        const auto json = request.ToJson().Unwrap();
        REQUIRE(json.find(R"("amount":"1000.USD")") != std::string::npos);
        const auto decoded = PayRequest::FromJson(json).Unwrap();
        REQUIRE(decoded.IsV1());
        REQUIRE(decoded == request);
    }

    SECTION("A flat currency key selects V0") {
        const auto json = R"({"currency":"USD","amount":500,"payerData":{"identifier":"$alice@vasp1.com"}})";
        const auto decoded = PayRequest::FromJson(json).Unwrap();
        REQUIRE(decoded.IsV0());
        REQUIRE(decoded.Amount() == 500);
        REQUIRE(decoded.ReceivingCurrencyCode() == std::optional<std::string>("USD"));
        REQUIRE_FALSE(decoded.SendingCurrencyCode().has_value());
        REQUIRE_FALSE(decoded.IsUmaRequest());
    }

    SECTION("V0 requires payer data") {
        auto result = PayRequest::FromJson(R"({"currency":"USD","amount":500})");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::ParsePayreqRequestError);
    }

    SECTION("Missing amount is reported by name") {
        auto result = PayRequest::FromJson(R"({"convert":"USD"})");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().missing_fields == std::vector<std::string>{"amount"});
    }

    SECTION("Numeric V1 amounts are millisatoshis") {
        const auto decoded = PayRequest::FromJson(R"({"amount":2500,"convert":"USD"})").Unwrap();
        REQUIRE(decoded.IsV1());
        REQUIRE(decoded.Amount() == 2500);
        REQUIRE_FALSE(decoded.SendingCurrencyCode().has_value());
    }
}

TEST_CASE("PayRequest - Query parameters", "[pay_request][protocol]") {
    SECTION("V1 round trips through the GET form") {
        const auto request = SampleV1();
        const auto params = request.ToQueryParamMap().Unwrap();
        REQUIRE(params.at("amount") == "1000.USD");
        REQUIRE(params.at("convert") == "EUR");
        REQUIRE(PayRequest::FromQueryParamMap(params).Unwrap() == request);
    }

    SECTION("Unparseable nested JSON is a parse error") {
        QueryParamMap params{{"amount", "10"}, {"payerData", "{oops"}};
        auto result = PayRequest::FromQueryParamMap(params);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::ParsePayreqRequestError);
    }
}

TEST_CASE("PayRequest - Signable payload", "[pay_request][protocol]") {
    SECTION("V1 lowercases the payload") {
        REQUIRE(SampleV1().SignablePayload().Unwrap() == "$alice@vasp1.com|4242|1700000000");
    }

    SECTION("V0 preserves case") {
        PayRequestV0 legacy;
        legacy.currency_code = "USD";
        legacy.amount = 10;
        legacy.payer_data = PayerData::Create("$Alice@VASP1.com", SampleCompliance());
        REQUIRE(PayRequest(legacy).SignablePayload().Unwrap() == "$Alice@VASP1.com|4242|1700000000");
    }

    SECTION("Missing compliance data cannot be signed") {
        const auto request = SampleV1().WithPayerData(PayerData::Create("$alice@vasp1.com"));
        REQUIRE_FALSE(request.IsUmaRequest());
        auto payload = request.SignablePayload();
        REQUIRE(payload.IsErr());
        REQUIRE(payload.UnwrapErr().missing_fields == std::vector<std::string>{"payerData.compliance"});
    }
}
