#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/signing_engine.hpp"
#include "uma/crypto/secp256k1.hpp"
#include "uma/crypto/ecies.hpp"
#include "helpers/test_fixtures.hpp"
#include <string>
#include <vector>

using namespace uma::protocol;
using namespace uma::protocol::crypto;
using namespace uma::protocol::test_helpers;

TEST_CASE("SigningEngine - ECDSA signatures", "[signing][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::string payload = "$bob@vasp2.com|12345|1700000000";

    SECTION("Known key pair signs and verifies") {
        REQUIRE(Secp256k1::DerivePublicKey(PrivateKey()).Unwrap() == PublicKey());
        const auto signature = SigningEngine::Sign(payload, PrivateKey()).Unwrap();
        REQUIRE(SigningEngine::Verify(payload, signature, PublicKey()));
    }

    SECTION("Compressed public keys verify too") {
        const auto signature = SigningEngine::Sign(payload, PrivateKey()).Unwrap();
        const auto uncompressed = PublicKey();
        std::vector<uint8_t> compressed(uncompressed.begin(), uncompressed.begin() + 33);
        compressed[0] = (uncompressed.back() & 1) ? 0x03 : 0x02;
        REQUIRE(Secp256k1::NormalizePublicKey(compressed).Unwrap() == PublicKey());
        REQUIRE(SigningEngine::Verify(payload, signature, compressed));
    }

    SECTION("Tampered payloads fail") {
        const auto signature = SigningEngine::Sign(payload, PrivateKey()).Unwrap();
        REQUIRE_FALSE(SigningEngine::Verify("$bob@vasp2.com|12345|1700000001", signature, PublicKey()));
    }

    SECTION("Another key fails") {
        const auto other = Secp256k1::GenerateKeyPair().Unwrap();
        const auto signature = SigningEngine::Sign(payload, other.private_key).Unwrap();
        REQUIRE(SigningEngine::Verify(payload, signature, other.public_key));
        REQUIRE_FALSE(SigningEngine::Verify(payload, signature, PublicKey()));
    }

    SECTION("Malformed material is a failed check, not an error") {
        const auto signature = SigningEngine::Sign(payload, PrivateKey()).Unwrap();
        REQUIRE_FALSE(SigningEngine::Verify(payload, "not-hex", PublicKey()));
        REQUIRE_FALSE(SigningEngine::Verify(payload, "3006020101020101", PublicKey()));
        REQUIRE_FALSE(SigningEngine::Verify(payload, signature, std::vector<uint8_t>(65, 0x04)));
        REQUIRE_FALSE(SigningEngine::Verify(payload, signature, std::vector<uint8_t>{}));
    }

    SECTION("Invalid private keys cannot sign") {
        REQUIRE(SigningEngine::Sign(payload, std::vector<uint8_t>(32, 0x00)).IsErr());
        REQUIRE(SigningEngine::Sign(payload, std::vector<uint8_t>(12, 0x01)).IsErr());
    }
}

TEST_CASE("SigningEngine - Travel rule encryption", "[signing][ecies][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::string travel_rule = R"({"originator":{"name":"Alice"},"amount":"100.USD"})";

    SECTION("Receiver decrypts what sender encrypts") {
        const auto ciphertext = SigningEngine::EncryptCompliancePayload(travel_rule, PublicKey()).Unwrap();
        REQUIRE(ciphertext.size() == 2 * (65 + 16 + 16 + travel_rule.size()));
        REQUIRE(SigningEngine::DecryptCompliancePayload(ciphertext, PrivateKey()).Unwrap() == travel_rule);
    }

    SECTION("Every encryption uses a fresh ephemeral key") {
        const auto first = SigningEngine::EncryptCompliancePayload(travel_rule, PublicKey()).Unwrap();
        const auto second = SigningEngine::EncryptCompliancePayload(travel_rule, PublicKey()).Unwrap();
        REQUIRE(first != second);
    }

    SECTION("Wrong key or tampered ciphertext fails") {
        auto ciphertext = SigningEngine::EncryptCompliancePayload(travel_rule, PublicKey()).Unwrap();
        const auto other = Secp256k1::GenerateKeyPair().Unwrap();
        REQUIRE(SigningEngine::DecryptCompliancePayload(ciphertext, other.private_key).IsErr());

        ciphertext.back() = ciphertext.back() == '0' ? '1' : '0';
        REQUIRE(SigningEngine::DecryptCompliancePayload(ciphertext, PrivateKey()).IsErr());
    }

    SECTION("Truncated ciphertext fails") {
        REQUIRE(Ecies::Decrypt(std::vector<uint8_t>(40, 0x01), PrivateKey()).IsErr());
        REQUIRE(SigningEngine::DecryptCompliancePayload("zz", PrivateKey()).IsErr());
    }
}
