#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol::crypto {

/**
 * @brief Interop layer for libsodium utilities
 *
 * Randomness for protocol nonces, hex codecs for keys and signatures,
 * constant-time comparison and wiping of private key copies.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint64_t GenerateRandomUInt64();

    // ========================================================================
    // Hex Encoding
    // ========================================================================

    /// Lowercase hex, two characters per byte.
    static std::string ToHex(std::span<const uint8_t> data);

    /// Accepts upper or lower case; rejects odd lengths and non-hex characters.
    static Result<std::vector<uint8_t>, UmaFailure> FromHex(std::string_view hex);

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace uma::protocol::crypto
