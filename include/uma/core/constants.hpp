#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace uma::protocol {
struct Constants {
    static constexpr size_t SECP256K1_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE = 65;
    static constexpr size_t SECP256K1_COMPRESSED_PUBLIC_KEY_SIZE = 33;
    static constexpr uint8_t SECP256K1_UNCOMPRESSED_PREFIX = 0x04;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t ECIES_NONCE_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_BUFFER_SIZE = 1024 * 1024 * 1024;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view CURVE_SECP256K1 = "secp256k1";
    static constexpr std::string_view ALGORITHM_EC = "EC";
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "libsodium is not initialized";
    static constexpr std::string_view NONCE_ALREADY_USED = "Nonce already used";
    static constexpr std::string_view TIMESTAMP_TOO_OLD = "Timestamp too old";
};
}
