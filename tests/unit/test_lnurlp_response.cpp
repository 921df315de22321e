#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/lnurlp_response.hpp"
using namespace uma::protocol;

namespace {

UmaLnurlpResponse SampleResponse() {
    UmaLnurlpResponse response;
    response.callback = "https://vasp2.com/api/lnurl/payreq/$bob";
    response.min_sendable = 1000;
    response.max_sendable = 10000000;
    response.encoded_metadata = R"([["text/plain","Pay to vasp2.com user $bob"]])";
    response.currencies = {Currency::Create("USD", "US Dollar", "$", 34150, 2, 1, 10000000, "1.0").Unwrap()};
    response.required_payer_data = CounterPartyData::CreateOptions({{"identifier", true}, {"name", false}});
    response.compliance.kyc_status = KycStatus::Verified;
    response.compliance.signature = "3045";
    response.compliance.signature_nonce = "777";
    response.compliance.signature_timestamp = 1700000000;
    response.compliance.is_subject_to_travel_rule = true;
    response.compliance.receiver_identifier = "$Bob@VASP2.com";
    response.uma_version = "1.0";
    response.comment_chars_allowed = 20;
    return response;
}

} // namespace

TEST_CASE("LnurlpResponse - JSON encoding", "[lnurlp_response][protocol]") {
    SECTION("UMA responses round trip") {
        const auto response = SampleResponse();
        const auto json = response.ToJson().Unwrap();
        REQUIRE(json.find(R"("tag":"payRequest")") != std::string::npos);
        REQUIRE(UmaLnurlpResponse::FromJson(json).Unwrap() == response);
    }

    SECTION("Large sendable bounds keep full precision") {
        auto response = SampleResponse();
        response.max_sendable = 2'100'000'000'000'000'000;
        const auto json = response.ToJson().Unwrap();
        REQUIRE(json.find("e+") == std::string::npos);
        REQUIRE(UmaLnurlpResponse::FromJson(json).Unwrap().max_sendable == 2'100'000'000'000'000'000);
    }

    SECTION("Settlement options and backing signatures are carried") {
        auto response = SampleResponse().WithBackingSignature(BackingSignature{"backer.com", "3044"});
        response.settlement_options = std::vector<SettlementOption>{
            SettlementOption{"spark", {SettlementAsset{"btkn1xyz", {{"USD", 1000.0}}}}}};
        const auto decoded = UmaLnurlpResponse::FromJson(response.ToJson().Unwrap()).Unwrap();
        REQUIRE(decoded.backing_signatures == response.backing_signatures);
        REQUIRE(decoded.settlement_options == response.settlement_options);
    }

    SECTION("Plain LNURL responses parse loosely but not strictly") {
        const auto json = R"({"callback":"https://vasp2.com/cb","minSendable":1000,"maxSendable":2000,)"
                          R"("metadata":"[]","tag":"payRequest"})";
        const auto loose = LnurlpResponse::FromJson(json).Unwrap();
        REQUIRE_FALSE(loose.IsUmaResponse());
        auto strict = UmaLnurlpResponse::FromJson(json);
        REQUIRE(strict.IsErr());
        REQUIRE(strict.UnwrapErr().code == ErrorCode::MissingRequiredUmaParameters);
        REQUIRE(strict.UnwrapErr().missing_fields ==
            std::vector<std::string>{"currencies", "payerData", "compliance", "umaVersion"});
    }

    SECTION("Broken JSON reports a parse error") {
        auto result = LnurlpResponse::FromJson("{not json");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::ParseLnurlpResponseError);
    }
}

TEST_CASE("LnurlpResponse - Compliance payload", "[lnurlp_response][protocol]") {
    REQUIRE(SampleResponse().SignablePayload() == "$bob@vasp2.com|777|1700000000");
}
