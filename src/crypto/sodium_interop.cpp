#include "uma/crypto/sodium_interop.hpp"
#include "uma/core/format.hpp"

namespace uma::protocol::crypto {

    // ============================================================================
    // Initialization
    // ============================================================================

    Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
        std::call_once(init_flag_, []() {
            if (sodium_init() < SodiumConstants::SUCCESS) {
                initialized_.store(false, std::memory_order_release);
            } else {
                initialized_.store(true, std::memory_order_release);
            }
        });

        if (!initialized_.load(std::memory_order_acquire)) {
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed(
                    std::string(ErrorMessages::SODIUM_INIT_FAILED)));
        }

        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    bool SodiumInterop::IsInitialized() noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    // ============================================================================
    // Secure Memory Operations
    // ============================================================================

    Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
        if (!IsInitialized()) {
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed(
                    std::string(ErrorMessages::NOT_INITIALIZED)));
        }

        if (buffer.empty()) {
            return Result<Unit, SodiumFailure>::Ok(unit);
        }

        if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::BufferTooLarge(
                    compat::format("Buffer size {} exceeds maximum {}",
                        buffer.size(), Constants::MAX_BUFFER_SIZE)));
        }

        if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
            return WipeSmallBuffer(buffer);
        }
        return WipeLargeBuffer(buffer);
    }

    Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
        volatile uint8_t* vbuf = buffer.data();
        for (size_t i = 0; i < buffer.size(); ++i) {
            vbuf[i] = 0;
        }
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
        sodium_memzero(buffer.data(), buffer.size());
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    // ============================================================================
    // Random Number Generation
    // ============================================================================

    std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
        std::vector<uint8_t> buffer(size);
        randombytes_buf(buffer.data(), size);
        return buffer;
    }

    uint64_t SodiumInterop::GenerateRandomUInt64() {
        uint64_t value = 0;
        randombytes_buf(&value, sizeof(value));
        return value;
    }

    // ============================================================================
    // Hex Encoding
    // ============================================================================

    std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
        if (data.empty()) {
            return {};
        }
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.resize(data.size() * 2);
        return hex;
    }

    Result<std::vector<uint8_t>, UmaFailure> SodiumInterop::FromHex(std::string_view hex) {
        if (hex.size() % 2 != 0) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidInput(
                    compat::format("Hex string has odd length {}", hex.size())));
        }
        std::vector<uint8_t> bytes(hex.size() / 2);
        if (hex.empty()) {
            return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(bytes));
        }
        size_t decoded_len = 0;
        const char* hex_end = nullptr;
        const int rc = sodium_hex2bin(
            bytes.data(), bytes.size(),
            hex.data(), hex.size(),
            nullptr, &decoded_len, &hex_end);
        if (rc != SodiumConstants::SUCCESS ||
            hex_end != hex.data() + hex.size() ||
            decoded_len != bytes.size()) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidInput("Invalid hex string"));
        }
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(bytes));
    }

}
