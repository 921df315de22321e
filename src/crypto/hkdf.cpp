#include "uma/crypto/hkdf.hpp"
#include "uma/core/constants.hpp"
#include "uma/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace uma::protocol::crypto {

    using OpenSSL = OpenSSLConstants;

    namespace {
        struct EVP_KDF_Deleter {
            void operator()(EVP_KDF* kdf) const {
                if (kdf) {
                    EVP_KDF_free(kdf);
                }
            }
        };
        struct EVP_KDF_CTX_Deleter {
            void operator()(EVP_KDF_CTX* ctx) const {
                if (ctx) {
                    EVP_KDF_CTX_free(ctx);
                }
            }
        };
        using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
        using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
    }

    Result<Unit, UmaFailure> Hkdf::DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {

        if (output.size() > MAX_OUTPUT_LEN) {
            return Result<Unit, UmaFailure>::Err(
                UmaFailure::InvalidInput(
                    compat::format("HKDF output size exceeds maximum allowed: {} > {}",
                        output.size(), MAX_OUTPUT_LEN)));
        }
        if (ikm.empty()) {
            return Result<Unit, UmaFailure>::Err(
                UmaFailure::InvalidInput("HKDF input key material cannot be empty"));
        }

        const std::string algorithm(OpenSSL::ALGORITHM_HKDF);
        const EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, algorithm.c_str(), nullptr));
        if (!kdf) {
            return Result<Unit, UmaFailure>::Err(
                UmaFailure::Internal("Failed to fetch HKDF algorithm"));
        }
        const EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf.get()));
        if (!kctx) {
            return Result<Unit, UmaFailure>::Err(
                UmaFailure::Internal("Failed to create HKDF context"));
        }

        OSSL_PARAM params[5];
        int param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
            return Result<Unit, UmaFailure>::Err(
                UmaFailure::Internal("HKDF key derivation failed"));
        }
        return Result<Unit, UmaFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, UmaFailure> Hkdf::DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        const size_t output_size,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {

        std::vector<uint8_t> output(output_size);
        auto result = DeriveKey(ikm, output, salt, info);
        if (result.IsErr()) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                std::move(result).UnwrapErr());
        }
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(output));
    }

}
