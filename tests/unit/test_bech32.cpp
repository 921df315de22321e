#include <catch2/catch_test_macros.hpp>
#include "uma/utilities/bech32.hpp"
using namespace uma::protocol;
using namespace uma::protocol::utilities;

TEST_CASE("Bech32 - Reference vectors", "[bech32][codec]") {
    SECTION("Empty payload decodes in either case") {
        for (const char* text : {"A12UEL5L", "a12uel5l"}) {
            auto result = Bech32::Decode(text);
            REQUIRE(result.IsOk());
            REQUIRE(result.Unwrap().hrp == "a");
            REQUIRE(result.Unwrap().data.empty());
        }
    }
    SECTION("Full charset payload") {
        const std::string text = "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw";
        auto result = Bech32::Decode(text);
        REQUIRE(result.IsOk());
        const std::vector<uint8_t> expected = {
            0x00, 0x44, 0x32, 0x14, 0xc7, 0x42, 0x54, 0xb6, 0x35, 0xcf,
            0x84, 0x65, 0x3a, 0x56, 0xd7, 0xc6, 0x75, 0xbe, 0x77, 0xdf};
        REQUIRE(result.Unwrap().hrp == "abcdef");
        REQUIRE(result.Unwrap().data == expected);
        REQUIRE(Bech32::Encode("abcdef", expected) == text);
    }
}

TEST_CASE("Bech32 - Failure classification", "[bech32][codec]") {
    SECTION("A single flipped character is a checksum failure") {
        auto result = Bech32::Decode("abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxx");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Checksum);
    }
    SECTION("Mixed case is a structure failure") {
        auto result = Bech32::Decode("A12uEL5L");
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }
    SECTION("Missing separator is a structure failure") {
        auto result = Bech32::Decode("qpzry9x8gf2tvdw0");
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }
    SECTION("Characters outside the alphabet are a structure failure") {
        auto result = Bech32::Decode("a1bqqqqqq");
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }
    SECTION("Too short for a checksum") {
        auto result = Bech32::Decode("a1qqq");
        REQUIRE(result.UnwrapErr().codec_failure == CodecFailureKind::Structure);
    }
}

TEST_CASE("Bech32 - Long payloads", "[bech32][codec]") {
    std::vector<uint8_t> payload(400);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 7);
    }
    const std::string encoded = Bech32::Encode("uma", payload);
    REQUIRE(encoded.size() > 90);
    auto decoded = Bech32::Decode(encoded);
    REQUIRE(decoded.IsOk());
    REQUIRE(decoded.Unwrap().data == payload);
}
