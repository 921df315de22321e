#include "uma/security/in_memory_nonce_cache.hpp"
#include "uma/debug/protocol_logger.hpp"
#include <algorithm>

namespace uma::protocol::security {
    InMemoryNonceCache::InMemoryNonceCache(const int64_t oldest_valid_timestamp)
        : oldest_valid_timestamp_(oldest_valid_timestamp) {
    }

    Result<Unit, UmaFailure> InMemoryNonceCache::CheckAndSaveNonce(
        const std::string_view nonce,
        const int64_t timestamp) {
        std::lock_guard guard(lock_);
        if (timestamp < oldest_valid_timestamp_) {
            debug::LogNonceRejected(nonce, timestamp, "below floor");
            return Result<Unit, UmaFailure>::Err(UmaFailure::TimestampTooOld());
        }
        if (!nonces_.try_emplace(std::string(nonce), timestamp).second) {
            debug::LogNonceRejected(nonce, timestamp, "reused");
            return Result<Unit, UmaFailure>::Err(UmaFailure::NonceReused());
        }
        return Result<Unit, UmaFailure>::Ok(Unit{});
    }

    void InMemoryNonceCache::PurgeNoncesOlderThan(const int64_t cutoff) {
        std::lock_guard guard(lock_);
        for (auto it = nonces_.begin(); it != nonces_.end();) {
            if (it->second < cutoff) {
                it = nonces_.erase(it);
            } else {
                ++it;
            }
        }
        oldest_valid_timestamp_ = std::max(oldest_valid_timestamp_, cutoff);
    }

    size_t InMemoryNonceCache::GetTrackedNonceCount() const {
        std::lock_guard guard(lock_);
        return nonces_.size();
    }

    int64_t InMemoryNonceCache::GetOldestValidTimestamp() const {
        std::lock_guard guard(lock_);
        return oldest_valid_timestamp_;
    }

    void InMemoryNonceCache::Reset() {
        std::lock_guard guard(lock_);
        nonces_.clear();
        oldest_valid_timestamp_ = 0;
    }
}
