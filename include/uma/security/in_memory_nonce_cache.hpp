#pragma once
#include "uma/interfaces/i_nonce_cache.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
namespace uma::protocol::security {

/**
 * @brief Process-local nonce cache
 *
 * One mutex guards both the nonce map and the timestamp floor, so two
 * concurrent CheckAndSaveNonce calls for the same nonce never both succeed.
 * Callers should purge periodically; nothing is evicted otherwise.
 */
class InMemoryNonceCache final : public interfaces::INonceCache {
public:
    /// `oldest_valid_timestamp` seeds the floor, in seconds since epoch.
    explicit InMemoryNonceCache(int64_t oldest_valid_timestamp = 0);

    InMemoryNonceCache(const InMemoryNonceCache&) = delete;
    InMemoryNonceCache& operator=(const InMemoryNonceCache&) = delete;
    InMemoryNonceCache(InMemoryNonceCache&&) = delete;
    InMemoryNonceCache& operator=(InMemoryNonceCache&&) = delete;
    ~InMemoryNonceCache() override = default;

    [[nodiscard]] Result<Unit, UmaFailure> CheckAndSaveNonce(
        std::string_view nonce,
        int64_t timestamp) override;

    void PurgeNoncesOlderThan(int64_t cutoff) override;

    size_t GetTrackedNonceCount() const;
    int64_t GetOldestValidTimestamp() const;
    void Reset();

private:
    mutable std::mutex lock_;
    std::unordered_map<std::string, int64_t> nonces_;
    int64_t oldest_valid_timestamp_;
};

}
