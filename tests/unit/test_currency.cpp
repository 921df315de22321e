#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/currency.hpp"
#include "uma/utilities/json_value.hpp"
using namespace uma::protocol;
using namespace uma::protocol::utilities;

TEST_CASE("Currency - Version specific layout", "[currency][protocol]") {
    SECTION("V1 nests limits under convertible") {
        const auto currency = Currency::Create("USD", "US Dollar", "$", 34150, 2, 1, 10000000, "1.0").Unwrap();
        REQUIRE_FALSE(currency.IsV0());
        const auto object = currency.ToJsonObject();
        REQUIRE(Json::Has(object, "convertible"));
        REQUIRE_FALSE(Json::Has(object, "minSendable"));
        const auto convertible = Json::GetObject(object, "convertible", ErrorCode::InvalidInput).Unwrap();
        REQUIRE(Json::GetInt64(convertible, "max", ErrorCode::InvalidInput).Unwrap() == 10000000);
    }

    SECTION("V0 keeps limits at the top level") {
        const auto currency = Currency::Create("USD", "US Dollar", "$", 34150, 2, 1, 10000000, "0.3").Unwrap();
        REQUIRE(currency.IsV0());
        const auto object = currency.ToJsonObject();
        REQUIRE(Json::GetInt64(object, "minSendable", ErrorCode::InvalidInput).Unwrap() == 1);
        REQUIRE_FALSE(Json::Has(object, "convertible"));
    }

    SECTION("Converting between layouts keeps every value") {
        const auto v1 = Currency::Create("EUR", "Euro", "E", 0.5, 2, 3, 4, "1.0").Unwrap();
        const auto v0 = v1.ToV0();
        REQUIRE(v0.IsV0());
        REQUIRE(v0.MinSendable() == 3);
        REQUIRE(v0.MaxSendable() == 4);
        REQUIRE(v0.MillisatoshiPerUnit() == 0.5);
        REQUIRE(v0.ToV1() == v1);
    }

    SECTION("Bad version strings are rejected") {
        REQUIRE(Currency::Create("USD", "US Dollar", "$", 1, 2, 1, 2, "one").IsErr());
    }
}

TEST_CASE("Currency - JSON decoding", "[currency][protocol]") {
    SECTION("Either layout is recognized") {
        const auto v1_json = R"({"code":"USD","name":"US Dollar","symbol":"$","multiplier":34150,)"
                             R"("decimals":2,"convertible":{"min":1,"max":100}})";
        const auto object = Json::ParseObject(v1_json, ErrorCode::ParseLnurlpResponseError).Unwrap();
        const auto currency = Currency::FromJsonObject(object, ErrorCode::ParseLnurlpResponseError).Unwrap();
        REQUIRE_FALSE(currency.IsV0());
        REQUIRE(currency.MaxSendable() == 100);

        const auto v0_json = R"({"code":"USD","name":"US Dollar","symbol":"$","multiplier":34150,)"
                             R"("decimals":2,"minSendable":1,"maxSendable":100})";
        const auto legacy = Currency::FromJsonObject(
            Json::ParseObject(v0_json, ErrorCode::ParseLnurlpResponseError).Unwrap(),
            ErrorCode::ParseLnurlpResponseError).Unwrap();
        REQUIRE(legacy.IsV0());
        REQUIRE(legacy.MinSendable() == 1);
    }

    SECTION("Missing code reports the caller's error code") {
        const auto object = Json::ParseObject(R"({"name":"US Dollar"})", ErrorCode::ParseLnurlpResponseError).Unwrap();
        auto result = Currency::FromJsonObject(object, ErrorCode::ParseLnurlpResponseError);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::ParseLnurlpResponseError);
    }
}
