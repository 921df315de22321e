#include <catch2/catch_test_macros.hpp>
#include "uma/utilities/url.hpp"
using namespace uma::protocol;
using namespace uma::protocol::utilities;

TEST_CASE("Url - Percent encoding", "[url][codec]") {
    SECTION("Reserved characters are escaped") {
        REQUIRE(Url::Encode("$bob") == "%24bob");
        REQUIRE(Url::Encode("a b:c,d") == "a%20b%3Ac%2Cd");
        REQUIRE(Url::Encode("safe-._~") == "safe-._~");
    }
    SECTION("Decode reverses Encode") {
        const std::string original = "vasp1.com:3045304402,x=y&z";
        REQUIRE(Url::Decode(Url::Encode(original)).Unwrap() == original);
    }
    SECTION("Truncated escapes are rejected") {
        REQUIRE(Url::Decode("abc%2").IsErr());
        REQUIRE(Url::Decode("abc%zz").IsErr());
    }
}

TEST_CASE("Url - Parsing", "[url][codec]") {
    SECTION("Splits scheme, host, port, path and query") {
        auto result = Url::Parse("https://vasp.com:8080/.well-known/lnurlp/%24bob?nonce=12&flag");
        REQUIRE(result.IsOk());
        const auto& parsed = result.Unwrap();
        REQUIRE(parsed.scheme == "https");
        REQUIRE(parsed.host == "vasp.com");
        REQUIRE(parsed.port == uint16_t{8080});
        REQUIRE(parsed.path_segments == std::vector<std::string>{".well-known", "lnurlp", "$bob"});
        REQUIRE(parsed.QueryValue("nonce") == "12");
        REQUIRE(parsed.QueryValue("flag") == "");
        REQUIRE_FALSE(parsed.QueryValue("missing").has_value());
    }
    SECTION("Plus signs are literal in paths and spaces in queries") {
        const auto parsed = Url::Parse("https://vasp.com/.well-known/lnurlp/a+b?x=1+2").Unwrap();
        REQUIRE(parsed.path_segments.back() == "a+b");
        REQUIRE(parsed.QueryValue("x") == "1 2");
        REQUIRE(Url::DecodePathSegment("a+b%2Bc").Unwrap() == "a+b+c");
    }
    SECTION("Missing scheme is rejected") {
        REQUIRE(Url::Parse("vasp.com/.well-known").IsErr());
    }
    SECTION("Bad port is rejected") {
        REQUIRE(Url::Parse("https://vasp.com:http/").IsErr());
    }
}

TEST_CASE("Url - Domains", "[url]") {
    SECTION("Local hosts use plain http") {
        REQUIRE(Url::SchemeForDomain("localhost:8080") == "http");
        REQUIRE(Url::SchemeForDomain("vasp.local") == "http");
        REQUIRE(Url::SchemeForDomain("vasp.internal") == "http");
        REQUIRE(Url::SchemeForDomain("127.0.0.1") == "http");
        REQUIRE(Url::SchemeForDomain("vasp.com") == "https");
    }
    SECTION("VASP domain comes from the address") {
        REQUIRE(Url::GetVaspDomainFromUmaAddress("$bob@vasp.com").Unwrap() == "vasp.com");
        REQUIRE(Url::GetVaspDomainFromUmaAddress("bob").IsErr());
        REQUIRE(Url::GetVaspDomainFromUmaAddress("bob@").IsErr());
    }
}
