#include <catch2/catch_test_macros.hpp>
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"
using namespace uma::protocol;
using namespace uma::protocol::utilities;

TEST_CASE("ErrorCode - Names and HTTP status", "[failures][core]") {
    REQUIRE(ErrorCodeName(ErrorCode::InvalidSignature) == "INVALID_SIGNATURE");
    REQUIRE(ErrorCodeHttpStatus(ErrorCode::InvalidSignature) == 401);
    REQUIRE(ErrorCodeHttpStatus(ErrorCode::UnsupportedUmaVersion) == 412);
    REQUIRE(ErrorCodeHttpStatus(ErrorCode::CounterpartyPubkeyFetchError) == 424);
    REQUIRE(ErrorCodeHttpStatus(ErrorCode::UnrecognizedMandatoryPayeeDataKey) == 501);
    REQUIRE(ErrorCodeHttpStatus(ErrorCode::InternalError) == 500);
}

TEST_CASE("UmaFailure - Structured detail", "[failures][core]") {
    SECTION("Missing fields are listed") {
        const auto failure = UmaFailure::MissingRequiredFields({"nonce", "signature"});
        REQUIRE(failure.code == ErrorCode::MissingRequiredUmaParameters);
        REQUIRE(failure.missing_fields.size() == 2);
        REQUIRE(failure.message.find("nonce, signature") != std::string::npos);
    }

    SECTION("Replay kinds are distinguishable") {
        REQUIRE(UmaFailure::NonceReused().replay_failure == ReplayFailureKind::NonceReused);
        REQUIRE(UmaFailure::TimestampTooOld().replay_failure == ReplayFailureKind::TimestampTooOld);
        REQUIRE(UmaFailure::NonceReused().code == ErrorCode::InvalidNonce);
    }

    SECTION("Invoice kinds are distinguishable") {
        REQUIRE(UmaFailure::InvoiceChecksum("x").codec_failure == CodecFailureKind::Checksum);
        REQUIRE(UmaFailure::InvoiceStructure("x").codec_failure == CodecFailureKind::Structure);
        REQUIRE(UmaFailure::InvoiceMissingFields({"amount"}).codec_failure == CodecFailureKind::MissingField);
    }
}

TEST_CASE("UmaFailure - Error body", "[failures][core]") {
    SECTION("Plain failures render status reason and code") {
        const auto body = UmaFailure::InvalidSignature("bad sig").ToJson().Unwrap();
        const auto object = Json::ParseObject(body, ErrorCode::InvalidInput).Unwrap();
        REQUIRE(Json::GetString(object, "status", ErrorCode::InvalidInput).Unwrap() == "ERROR");
        REQUIRE(Json::GetString(object, "reason", ErrorCode::InvalidInput).Unwrap() == "bad sig");
        REQUIRE(Json::GetString(object, "code", ErrorCode::InvalidInput).Unwrap() == "INVALID_SIGNATURE");
        REQUIRE_FALSE(Json::Has(object, "supportedMajorVersions"));
    }

    SECTION("Version failures list the supported majors") {
        const auto failure = UmaFailure::UnsupportedVersion("2.0", {0, 1});
        REQUIRE(failure.HttpStatus() == 412);
        const auto object = Json::ParseObject(failure.ToJson().Unwrap(), ErrorCode::InvalidInput).Unwrap();
        REQUIRE(Json::GetString(object, "unsupportedVersion", ErrorCode::InvalidInput).Unwrap() == "2.0");
        const auto* majors = Json::Find(object, "supportedMajorVersions");
        REQUIRE(majors != nullptr);
        REQUIRE(majors->list_value().values_size() == 2);
        REQUIRE(majors->list_value().values(1).number_value() == 1.0);
    }
}
