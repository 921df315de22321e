#include <catch2/catch_test_macros.hpp>
#include "uma/security/in_memory_public_key_cache.hpp"
#include "helpers/test_fixtures.hpp"
#include <atomic>
#include <memory>

using namespace uma::protocol;
using namespace uma::protocol::configuration;
using namespace uma::protocol::security;
using namespace uma::protocol::test_helpers;

TEST_CASE("PublicKeyCache - Expiration", "[pubkey_cache][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto now = std::make_shared<std::atomic<int64_t>>(1000);
    InMemoryPublicKeyCache cache(ProtocolConfig::Default(), [now] { return now->load(); });

    SECTION("Entries are served until their expiration") {
        cache.AddPublicKeyForVasp("vasp2.com", PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 2000));
        REQUIRE(cache.FetchPublicKeyForVasp("vasp2.com").has_value());
        now->store(1999);
        REQUIRE(cache.FetchPublicKeyForVasp("vasp2.com").has_value());
        now->store(2000);
        REQUIRE_FALSE(cache.FetchPublicKeyForVasp("vasp2.com").has_value());
        REQUIRE(cache.GetCachedDomainCount() == 0);
    }

    SECTION("Already expired entries are not stored") {
        cache.AddPublicKeyForVasp("vasp2.com", PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 1000));
        REQUIRE(cache.GetCachedDomainCount() == 0);
    }

    SECTION("Unknown domains miss") {
        REQUIRE_FALSE(cache.FetchPublicKeyForVasp("nowhere.com").has_value());
    }

    SECTION("Remove and clear") {
        cache.AddPublicKeyForVasp("a.com", PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 5000));
        cache.AddPublicKeyForVasp("b.com", PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 5000));
        cache.RemovePublicKeyForVasp("a.com");
        REQUIRE_FALSE(cache.FetchPublicKeyForVasp("a.com").has_value());
        REQUIRE(cache.GetCachedDomainCount() == 1);
        cache.Clear();
        REQUIRE(cache.GetCachedDomainCount() == 0);
    }

    SECTION("Adding again replaces the entry") {
        cache.AddPublicKeyForVasp("vasp2.com", PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 1500));
        cache.AddPublicKeyForVasp("vasp2.com", PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 9000));
        now->store(5000);
        const auto entry = cache.FetchPublicKeyForVasp("vasp2.com");
        REQUIRE(entry.has_value());
        REQUIRE(entry->ExpirationTimestamp() == std::optional<int64_t>(9000));
    }
}

TEST_CASE("PublicKeyCache - Non-expiring keys", "[pubkey_cache][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto keys = PubKeyResponse::FromKeys(PublicKey(), PublicKey());

    SECTION("Refused by default") {
        InMemoryPublicKeyCache cache(ProtocolConfig::Default(), [] { return int64_t{1000}; });
        cache.AddPublicKeyForVasp("vasp2.com", keys);
        REQUIRE_FALSE(cache.FetchPublicKeyForVasp("vasp2.com").has_value());
    }

    SECTION("Kept when the config allows them") {
        InMemoryPublicKeyCache cache(
            ProtocolConfig::Default().WithNonExpiringKeysAllowed(true), [] { return int64_t{1000}; });
        cache.AddPublicKeyForVasp("vasp2.com", keys);
        REQUIRE(cache.FetchPublicKeyForVasp("vasp2.com").has_value());
    }
}
