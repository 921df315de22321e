#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/lnurlp_request.hpp"
using namespace uma::protocol;

namespace {

UmaLnurlpRequest SampleRequest() {
    UmaLnurlpRequest request;
    request.receiver_address = "$bob@vasp2.com";
    request.nonce = "12345";
    request.signature = "3045022100abcdef";
    request.is_subject_to_travel_rule = true;
    request.vasp_domain = "vasp1.com";
    request.timestamp = 1700000000;
    request.uma_version = "1.0";
    return request;
}

} // namespace

TEST_CASE("LnurlpRequest - URL encoding", "[lnurlp_request][protocol]") {
    SECTION("Round trip keeps every field") {
        const auto request = SampleRequest();
        const auto url = request.EncodeToUrl().Unwrap();
        REQUIRE(url.rfind("https://vasp2.com/.well-known/lnurlp/", 0) == 0);

        const auto decoded = LnurlpRequest::DecodeFromUrl(url).Unwrap();
        REQUIRE(decoded.IsUmaRequest());
        REQUIRE(decoded.ToStrict().Unwrap() == request);
    }

    SECTION("Strict requests widen without loss") {
        const auto request = SampleRequest();
        const auto loose = request.ToLoose();
        REQUIRE(loose.IsUmaRequest());
        REQUIRE(loose.vasp_domain == std::optional<std::string>("vasp1.com"));
        REQUIRE(loose.ToStrict().Unwrap() == request);
    }

    SECTION("Unescaped plus signs stay in the username") {
        const auto decoded = LnurlpRequest::DecodeFromUrl(
            "https://vasp.com/.well-known/lnurlp/a+b?signature=3045022100abcdef&vaspDomain=vasp1.com"
            "&nonce=12345&isSubjectToTravelRule=true&timestamp=1700000000&umaVersion=1.0").Unwrap();
        REQUIRE(decoded.receiver_address == "a+b@vasp.com");
        REQUIRE(decoded.IsUmaRequest());
    }

    SECTION("Backing signatures survive domains with ports") {
        const auto request = SampleRequest()
            .WithBackingSignature(BackingSignature{"backer.com:8443", "3044aa"})
            .WithBackingSignature(BackingSignature{"other.org", "3044bb"});
        const auto decoded = LnurlpRequest::DecodeFromUrl(request.EncodeToUrl().Unwrap()).Unwrap();
        REQUIRE(decoded.backing_signatures.has_value());
        REQUIRE(decoded.backing_signatures->size() == 2);
        REQUIRE((*decoded.backing_signatures)[0].domain == "backer.com:8443");
        REQUIRE((*decoded.backing_signatures)[1].signature == "3044bb");
    }

    SECTION("Localhost receivers use plain http and keep the port") {
        LnurlpRequest request;
        request.receiver_address = "$bob@localhost:8080";
        const auto url = request.EncodeToUrl().Unwrap();
        REQUIRE(url == "http://localhost:8080/.well-known/lnurlp/%24bob");
        REQUIRE(LnurlpRequest::DecodeFromUrl(url).Unwrap().receiver_address == "$bob@localhost:8080");
    }

    SECTION("Addresses without exactly one @ are rejected") {
        LnurlpRequest request;
        request.receiver_address = "bob.vasp2.com";
        REQUIRE(request.EncodeToUrl().IsErr());
    }
}

TEST_CASE("LnurlpRequest - URL decoding", "[lnurlp_request][protocol]") {
    SECTION("Plain LNURL requests are not UMA requests") {
        const auto decoded = LnurlpRequest::DecodeFromUrl("https://vasp2.com/.well-known/lnurlp/bob").Unwrap();
        REQUIRE_FALSE(decoded.IsUmaRequest());
        REQUIRE(decoded.receiver_address == "bob@vasp2.com");

        auto strict = decoded.ToStrict();
        REQUIRE(strict.IsErr());
        REQUIRE(strict.UnwrapErr().missing_fields ==
            std::vector<std::string>{"nonce", "signature", "vaspDomain", "timestamp", "umaVersion"});
    }

    SECTION("Travel rule flag is case insensitive") {
        const auto decoded = LnurlpRequest::DecodeFromUrl(
            "https://vasp2.com/.well-known/lnurlp/bob?isSubjectToTravelRule=TRUE").Unwrap();
        REQUIRE(decoded.is_subject_to_travel_rule == true);
    }

    SECTION("Malformed URLs report a parse error") {
        const auto expect_parse_error = [](const char* url) {
            auto result = LnurlpRequest::DecodeFromUrl(url);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().code == ErrorCode::ParseLnurlpRequestError);
        };
        expect_parse_error("ftp://vasp2.com/.well-known/lnurlp/bob");
        expect_parse_error("https://vasp2.com/lnurlp/bob");
        expect_parse_error("https://vasp2.com/.well-known/lnurlp/bob/extra");
        expect_parse_error("https://vasp2.com/.well-known/lnurlp/bo%20b");
        expect_parse_error("https://vasp2.com/.well-known/lnurlp/bob?timestamp=soon");
    }

    SECTION("Unsupported versions fail with 412") {
        auto result = LnurlpRequest::DecodeFromUrl(
            "https://vasp2.com/.well-known/lnurlp/bob?umaVersion=7.0");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::UnsupportedUmaVersion);
        REQUIRE(result.UnwrapErr().HttpStatus() == 412);
        REQUIRE(result.UnwrapErr().supported_major_versions == std::vector<int>{0, 1});
    }
}

TEST_CASE("LnurlpRequest - Signable payload", "[lnurlp_request][protocol]") {
    const auto request = SampleRequest();
    REQUIRE(request.SignablePayload() == "$bob@vasp2.com|12345|1700000000");

    auto mixed = request;
    mixed.receiver_address = "$Bob@VASP2.com";
    REQUIRE(mixed.SignablePayload() == "$Bob@VASP2.com|12345|1700000000");
}
