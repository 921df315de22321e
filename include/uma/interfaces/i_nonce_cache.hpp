#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <cstdint>
#include <string_view>
namespace uma::protocol::interfaces {

/// Replay guard consulted before any signature on a nonce-bearing message
/// is checked. Implementations must make CheckAndSaveNonce atomic.
class INonceCache {
public:
    virtual ~INonceCache() = default;

    /// INVALID_NONCE with ReplayFailureKind::TimestampTooOld when
    /// `timestamp` is below the purge floor, NonceReused when the nonce was
    /// already recorded.
    [[nodiscard]] virtual Result<Unit, UmaFailure> CheckAndSaveNonce(
        std::string_view nonce,
        int64_t timestamp) = 0;

    /// Drops entries older than `cutoff` and raises the floor to it. The
    /// floor never moves down.
    virtual void PurgeNoncesOlderThan(int64_t cutoff) = 0;
};

}
