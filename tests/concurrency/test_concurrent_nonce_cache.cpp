#include <catch2/catch_test_macros.hpp>
#include "uma/security/in_memory_nonce_cache.hpp"
#include "uma/security/in_memory_public_key_cache.hpp"
#include "helpers/test_fixtures.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace uma::protocol;
using namespace uma::protocol::security;
using namespace uma::protocol::test_helpers;

TEST_CASE("Concurrency - Nonce cache admits each nonce once", "[concurrency][nonce][replay]") {
    SECTION("Many threads racing on the same nonces") {
        InMemoryNonceCache cache;
        constexpr int THREAD_COUNT = 16;
        constexpr int NONCE_COUNT = 500;

        std::atomic<int> accepted{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < NONCE_COUNT; ++i) {
                    if (cache.CheckAndSaveNonce("nonce-" + std::to_string(i), 1000 + i).IsOk()) {
                        accepted.fetch_add(1, std::memory_order_relaxed);
                    } else {
                        rejected.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(accepted.load() == NONCE_COUNT);
        REQUIRE(rejected.load() == NONCE_COUNT * (THREAD_COUNT - 1));
        REQUIRE(cache.GetTrackedNonceCount() == NONCE_COUNT);
    }

    SECTION("Purging while checking keeps the floor monotonic") {
        InMemoryNonceCache cache;
        std::atomic<bool> floor_went_down{false};
        std::atomic<bool> unexpected_reuse{false};

        std::thread purger([&]() {
            for (int64_t cutoff = 0; cutoff < 2000; cutoff += 10) {
                cache.PurgeNoncesOlderThan(cutoff);
            }
        });
        std::thread checker([&]() {
            int64_t last_floor = 0;
            for (int i = 0; i < 2000; ++i) {
                auto admitted = cache.CheckAndSaveNonce("n" + std::to_string(i), i);
                if (admitted.IsErr() && admitted.UnwrapErr().replay_failure != ReplayFailureKind::TimestampTooOld) {
                    unexpected_reuse = true;
                }
                const int64_t floor = cache.GetOldestValidTimestamp();
                if (floor < last_floor) {
                    floor_went_down = true;
                }
                last_floor = floor;
            }
        });
        purger.join();
        checker.join();

        REQUIRE_FALSE(floor_went_down.load());
        REQUIRE_FALSE(unexpected_reuse.load());
        REQUIRE(cache.GetOldestValidTimestamp() == 1990);
    }
}

TEST_CASE("Concurrency - Public key cache under parallel access", "[concurrency][pubkey_cache]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    InMemoryPublicKeyCache cache(configuration::ProtocolConfig::Default(), [] { return int64_t{1000}; });
    const auto keys = PubKeyResponse::FromKeys(PublicKey(), PublicKey(), 5000);

    constexpr int THREAD_COUNT = 8;
    std::atomic<int> misses_after_add{0};
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            const std::string domain = "vasp" + std::to_string(t) + ".com";
            for (int i = 0; i < 200; ++i) {
                cache.AddPublicKeyForVasp(domain, keys);
                if (!cache.FetchPublicKeyForVasp(domain).has_value()) {
                    misses_after_add.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(misses_after_add.load() == 0);
    REQUIRE(cache.GetCachedDomainCount() == THREAD_COUNT);
}
