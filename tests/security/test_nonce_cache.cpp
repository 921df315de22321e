#include <catch2/catch_test_macros.hpp>
#include "uma/security/in_memory_nonce_cache.hpp"

using namespace uma::protocol;
using namespace uma::protocol::security;

TEST_CASE("NonceCache - Replay detection", "[nonce][replay][security]") {
    InMemoryNonceCache cache(1000);

    SECTION("First use succeeds, reuse fails") {
        REQUIRE(cache.CheckAndSaveNonce("abc", 1500).IsOk());
        auto replay = cache.CheckAndSaveNonce("abc", 1600);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().code == ErrorCode::InvalidNonce);
        REQUIRE(replay.UnwrapErr().replay_failure == ReplayFailureKind::NonceReused);
        REQUIRE(cache.GetTrackedNonceCount() == 1);
    }

    SECTION("Timestamps below the floor are rejected and not recorded") {
        auto old = cache.CheckAndSaveNonce("abc", 999);
        REQUIRE(old.IsErr());
        REQUIRE(old.UnwrapErr().replay_failure == ReplayFailureKind::TimestampTooOld);
        REQUIRE(cache.GetTrackedNonceCount() == 0);
        REQUIRE(cache.CheckAndSaveNonce("abc", 1000).IsOk());
    }

    SECTION("Nonces are case sensitive") {
        REQUIRE(cache.CheckAndSaveNonce("abc", 1500).IsOk());
        REQUIRE(cache.CheckAndSaveNonce("ABC", 1500).IsOk());
    }
}

TEST_CASE("NonceCache - Purging", "[nonce][replay][security]") {
    InMemoryNonceCache cache;
    REQUIRE(cache.CheckAndSaveNonce("old", 100).IsOk());
    REQUIRE(cache.CheckAndSaveNonce("new", 300).IsOk());

    SECTION("Purge drops old entries and raises the floor") {
        cache.PurgeNoncesOlderThan(200);
        REQUIRE(cache.GetTrackedNonceCount() == 1);
        REQUIRE(cache.GetOldestValidTimestamp() == 200);
        REQUIRE(cache.CheckAndSaveNonce("old", 100).UnwrapErr().replay_failure ==
            ReplayFailureKind::TimestampTooOld);
        REQUIRE(cache.CheckAndSaveNonce("new", 300).UnwrapErr().replay_failure ==
            ReplayFailureKind::NonceReused);
    }

    SECTION("Floor never moves down") {
        cache.PurgeNoncesOlderThan(200);
        cache.PurgeNoncesOlderThan(50);
        REQUIRE(cache.GetOldestValidTimestamp() == 200);
        REQUIRE(cache.CheckAndSaveNonce("fresh", 150).IsErr());
    }

    SECTION("Reset forgets everything") {
        cache.PurgeNoncesOlderThan(200);
        cache.Reset();
        REQUIRE(cache.GetTrackedNonceCount() == 0);
        REQUIRE(cache.CheckAndSaveNonce("old", 100).IsOk());
    }
}
