#include <catch2/catch_test_macros.hpp>
#include "uma/crypto/sodium_interop.hpp"
#include <set>
using namespace uma::protocol;
using namespace uma::protocol::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Wipe zeroes the buffer") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(100, 0x00));
    }
}

TEST_CASE("SodiumInterop - Hex Codec", "[sodium][crypto][hex]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("ToHex is lowercase") {
        const std::vector<uint8_t> bytes = {0xDE, 0xAD, 0xBE, 0xEF};
        REQUIRE(SodiumInterop::ToHex(bytes) == "deadbeef");
    }
    SECTION("FromHex accepts upper case") {
        auto result = SodiumInterop::FromHex("DEADBEEF");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    }
    SECTION("Odd length is rejected") {
        REQUIRE(SodiumInterop::FromHex("abc").IsErr());
    }
    SECTION("Non-hex characters are rejected") {
        auto result = SodiumInterop::FromHex("zz");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::InvalidInput);
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("GetRandomBytes generates correct size") {
        REQUIRE(SodiumInterop::GetRandomBytes(32).size() == 32);
    }
    SECTION("GenerateRandomUInt64 does not repeat") {
        std::set<uint64_t> seen;
        for (int i = 0; i < 100; ++i) {
            seen.insert(SodiumInterop::GenerateRandomUInt64());
        }
        REQUIRE(seen.size() == 100);
    }
}
