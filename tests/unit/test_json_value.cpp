#include <catch2/catch_test_macros.hpp>
#include "uma/utilities/json_value.hpp"
#include <limits>
using namespace uma::protocol;
using namespace uma::protocol::utilities;

TEST_CASE("Json - Integer encoding", "[json][codec]") {
    constexpr auto kError = ErrorCode::ParsePayreqRequestError;

    SECTION("Round millisatoshi amounts are written without an exponent") {
        JsonObject object;
        Json::SetInt64(object, "amount", 1'000'000'000'000'000);
        const auto json = Json::Serialize(object).Unwrap();
        REQUIRE(json == R"({"amount":1000000000000000})");
    }

    SECTION("Integers beyond 2^53 survive a round trip") {
        for (const int64_t value : {std::numeric_limits<int64_t>::max(),
                                    std::numeric_limits<int64_t>::min(),
                                    int64_t{9007199254740993}}) {
            JsonObject object;
            Json::SetInt64(object, "amount", value);
            const auto parsed = Json::ParseObject(Json::Serialize(object).Unwrap(), kError).Unwrap();
            REQUIRE(Json::GetInt64(parsed, "amount", kError).Unwrap() == value);
        }
    }

    SECTION("2^53 itself stays a JSON number") {
        JsonObject object;
        Json::SetInt64(object, "amount", 9007199254740992);
        REQUIRE(Json::Serialize(object).Unwrap() == R"({"amount":9007199254740992})");
    }

    SECTION("Fractional numbers are not integers") {
        JsonObject object;
        Json::SetDouble(object, "rate", 0.5);
        REQUIRE(Json::Serialize(object).Unwrap() == R"({"rate":0.5})");
        REQUIRE(Json::GetInt64(object, "rate", kError).IsErr());
    }
}

TEST_CASE("Json - Serialization", "[json][codec]") {
    SECTION("Keys are sorted and strings escaped") {
        JsonObject object;
        Json::SetString(object, "b", "say \"hi\"\n");
        Json::SetBool(object, "a", true);
        Json::SetStringList(object, "c", {"$alice@vasp1.com"});
        REQUIRE(Json::Serialize(object).Unwrap() ==
            R"({"a":true,"b":"say \"hi\"\n","c":["$alice@vasp1.com"]})");
    }

    SECTION("Output parses back to an equal document") {
        JsonObject inner;
        Json::SetDouble(inner, "multiplier", 1234.5);
        JsonObject object;
        Json::SetObject(object, "inner", inner);
        Json::SetIntList(object, "majors", {0, 1});
        const auto parsed = Json::ParseObject(Json::Serialize(object).Unwrap(), ErrorCode::InvalidInput).Unwrap();
        REQUIRE(Json::Equals(parsed, object));
    }
}
