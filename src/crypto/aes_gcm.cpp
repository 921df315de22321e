#include "uma/crypto/aes_gcm.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "uma/core/constants.hpp"
#include "uma/core/format.hpp"
#include "openssl_handles.hpp"
#include <memory>
namespace uma::protocol::crypto {
    using OpenSSL = OpenSSLConstants;
    namespace {
        using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX,
            detail::OpenSSLDeleter<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>>;
        using detail::GetOpenSSLError;
        Result<Unit, UmaFailure> ValidateKeyAndNonce(
            std::span<const uint8_t> key,
            std::span<const uint8_t> nonce) {
            if (key.size() != Constants::AES_KEY_SIZE) {
                return Result<Unit, UmaFailure>::Err(
                    UmaFailure::InvalidInput(
                        compat::format("AES-256-GCM key must be {} bytes, got {}",
                            Constants::AES_KEY_SIZE, key.size())));
            }
            if (nonce.empty()) {
                return Result<Unit, UmaFailure>::Err(
                    UmaFailure::InvalidInput("AES-GCM nonce cannot be empty"));
            }
            return Result<Unit, UmaFailure>::Ok(unit);
        }
        void WipeOutput(std::vector<uint8_t>& output) {
            // Wiping can only fail before libsodium is initialized; the buffer is discarded either way.
            if (SodiumInterop::SecureWipe(std::span<uint8_t>(output)).IsErr()) {
                output.assign(output.size(), 0);
            }
        }
    }
    Result<std::vector<uint8_t>, UmaFailure>
    AesGcm::Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data) {
        UMA_TRY(ValidateKeyAndNonce(key, nonce));
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                                  associated_data.data(),
                                  static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("Failed to add associated data: {}", GetOpenSSLError())));
            }
        }
        std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
        int ciphertext_len = 0;
        if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                              plaintext.data(),
                              static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
            WipeOutput(output);
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Encryption failed: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
            WipeOutput(output);
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
        }
        ciphertext_len += final_len;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                                output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
            WipeOutput(output);
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
        }
        output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(output));
    }
    Result<std::vector<uint8_t>, UmaFailure>
    AesGcm::Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data) {
        UMA_TRY(ValidateKeyAndNonce(key, nonce));
        if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidInput(
                    compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                        ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
        }
        const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
        std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
        std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                                  associated_data.data(),
                                  static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("Failed to add associated data: {}", GetOpenSSLError())));
            }
        }
        std::vector<uint8_t> output(ciphertext_len);
        int plaintext_len = 0;
        if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                              ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
            WipeOutput(output);
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Decryption failed: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                                tag_copy.data()) != OpenSSL::SUCCESS) {
            WipeOutput(output);
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
            WipeOutput(output);
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidInput(
                    "Authentication tag verification failed - data may have been tampered with"));
        }
        plaintext_len += final_len;
        output.resize(static_cast<size_t>(plaintext_len));
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(output));
    }
}
