#include "uma/crypto/secp256k1.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "uma/core/constants.hpp"
#include "uma/core/format.hpp"
#include "openssl_handles.hpp"

#include <openssl/core_names.h>
#include <openssl/obj_mac.h>

namespace uma::protocol::crypto {

    using namespace detail;
    using OpenSSL = OpenSSLConstants;

    namespace {
        Result<EC_GROUP_ptr, UmaFailure> NewGroup() {
            EC_GROUP_ptr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
            if (!group) {
                return Result<EC_GROUP_ptr, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("secp256k1 group unavailable: {}", GetOpenSSLError())));
            }
            return Result<EC_GROUP_ptr, UmaFailure>::Ok(std::move(group));
        }

        Result<SECRET_BIGNUM_ptr, UmaFailure> DecodeScalar(
            const EC_GROUP* group,
            std::span<const uint8_t> private_key) {
            if (private_key.size() != Constants::SECP256K1_PRIVATE_KEY_SIZE) {
                return Result<SECRET_BIGNUM_ptr, UmaFailure>::Err(
                    UmaFailure::InvalidInput(
                        compat::format("secp256k1 private key must be {} bytes, got {}",
                            Constants::SECP256K1_PRIVATE_KEY_SIZE, private_key.size())));
            }
            SECRET_BIGNUM_ptr scalar(BN_secure_new());
            if (!scalar ||
                !BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), scalar.get())) {
                return Result<SECRET_BIGNUM_ptr, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("Failed to load private key: {}", GetOpenSSLError())));
            }
            if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(group)) >= 0) {
                return Result<SECRET_BIGNUM_ptr, UmaFailure>::Err(
                    UmaFailure::InvalidInput("secp256k1 private key is out of range"));
            }
            return Result<SECRET_BIGNUM_ptr, UmaFailure>::Ok(std::move(scalar));
        }

        Result<EC_POINT_ptr, UmaFailure> DecodePoint(
            const EC_GROUP* group,
            std::span<const uint8_t> public_key) {
            if (public_key.size() != Constants::SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE &&
                public_key.size() != Constants::SECP256K1_COMPRESSED_PUBLIC_KEY_SIZE) {
                return Result<EC_POINT_ptr, UmaFailure>::Err(
                    UmaFailure::InvalidPubKeyFormat(
                        compat::format("Invalid secp256k1 public key length {}", public_key.size())));
            }
            EC_POINT_ptr point(EC_POINT_new(group));
            if (!point ||
                EC_POINT_oct2point(group, point.get(), public_key.data(), public_key.size(), nullptr)
                    != OpenSSL::SUCCESS) {
                return Result<EC_POINT_ptr, UmaFailure>::Err(
                    UmaFailure::InvalidPubKeyFormat(
                        compat::format("Public key is not a secp256k1 point: {}", GetOpenSSLError())));
            }
            return Result<EC_POINT_ptr, UmaFailure>::Ok(std::move(point));
        }

        Result<std::vector<uint8_t>, UmaFailure> EncodePoint(
            const EC_GROUP* group,
            const EC_POINT* point) {
            std::vector<uint8_t> encoded(Constants::SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE);
            const size_t written = EC_POINT_point2oct(
                group, point, POINT_CONVERSION_UNCOMPRESSED,
                encoded.data(), encoded.size(), nullptr);
            if (written != encoded.size()) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("Failed to encode point: {}", GetOpenSSLError())));
            }
            return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(encoded));
        }

        Result<std::vector<uint8_t>, UmaFailure> MultiplyPoint(
            const EC_GROUP* group,
            const BIGNUM* scalar,
            const EC_POINT* base) {
            BN_CTX_ptr bn_ctx(BN_CTX_new());
            EC_POINT_ptr result(EC_POINT_new(group));
            if (!bn_ctx || !result) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal("Failed to allocate EC point"));
            }
            const int rc = base == nullptr
                ? EC_POINT_mul(group, result.get(), scalar, nullptr, nullptr, bn_ctx.get())
                : EC_POINT_mul(group, result.get(), nullptr, base, scalar, bn_ctx.get());
            if (rc != OpenSSL::SUCCESS) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("EC point multiplication failed: {}", GetOpenSSLError())));
            }
            return EncodePoint(group, result.get());
        }

        Result<EVP_PKEY_ptr, UmaFailure> BuildKey(
            const BIGNUM* private_scalar,
            std::span<const uint8_t> public_key) {
            OSSL_PARAM_BLD_ptr builder(OSSL_PARAM_BLD_new());
            if (!builder) {
                return Result<EVP_PKEY_ptr, UmaFailure>::Err(
                    UmaFailure::Internal("Failed to allocate parameter builder"));
            }
            const std::string curve(OpenSSL::CURVE_SECP256K1);
            int ok = OSSL_PARAM_BLD_push_utf8_string(
                builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, curve.c_str(), 0);
            ok = ok && OSSL_PARAM_BLD_push_octet_string(
                builder.get(), OSSL_PKEY_PARAM_PUB_KEY, public_key.data(), public_key.size());
            if (private_scalar != nullptr) {
                ok = ok && OSSL_PARAM_BLD_push_BN(
                    builder.get(), OSSL_PKEY_PARAM_PRIV_KEY, private_scalar);
            }
            OSSL_PARAM_ptr params(ok ? OSSL_PARAM_BLD_to_param(builder.get()) : nullptr);
            if (!params) {
                return Result<EVP_PKEY_ptr, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("Failed to build key parameters: {}", GetOpenSSLError())));
            }
            const std::string algorithm(OpenSSL::ALGORITHM_EC);
            EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, algorithm.c_str(), nullptr));
            if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != OpenSSL::SUCCESS) {
                return Result<EVP_PKEY_ptr, UmaFailure>::Err(
                    UmaFailure::Internal(
                        compat::format("Failed to create key context: {}", GetOpenSSLError())));
            }
            EVP_PKEY* raw_key = nullptr;
            const int selection = private_scalar != nullptr ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
            if (EVP_PKEY_fromdata(ctx.get(), &raw_key, selection, params.get()) != OpenSSL::SUCCESS) {
                return Result<EVP_PKEY_ptr, UmaFailure>::Err(
                    UmaFailure::InvalidPubKeyFormat(
                        compat::format("Failed to import secp256k1 key: {}", GetOpenSSLError())));
            }
            return Result<EVP_PKEY_ptr, UmaFailure>::Ok(EVP_PKEY_ptr(raw_key));
        }

        Result<std::vector<uint8_t>, UmaFailure> NormalizeLowS(
            const EC_GROUP* group,
            std::span<const uint8_t> der) {
            const unsigned char* cursor = der.data();
            ECDSA_SIG_ptr sig(d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der.size())));
            if (!sig) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal("Failed to decode produced signature"));
            }
            const BIGNUM* r = nullptr;
            const BIGNUM* s = nullptr;
            ECDSA_SIG_get0(sig.get(), &r, &s);
            const BIGNUM* order = EC_GROUP_get0_order(group);
            BIGNUM_ptr half_order(BN_new());
            if (!half_order || BN_rshift1(half_order.get(), order) != OpenSSL::SUCCESS) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal("Failed to compute half order"));
            }
            if (BN_cmp(s, half_order.get()) > 0) {
                BIGNUM_ptr low_s(BN_new());
                BIGNUM_ptr r_copy(BN_dup(r));
                if (!low_s || !r_copy || BN_sub(low_s.get(), order, s) != OpenSSL::SUCCESS) {
                    return Result<std::vector<uint8_t>, UmaFailure>::Err(
                        UmaFailure::Internal("Failed to normalize signature"));
                }
                if (ECDSA_SIG_set0(sig.get(), r_copy.get(), low_s.get()) != OpenSSL::SUCCESS) {
                    return Result<std::vector<uint8_t>, UmaFailure>::Err(
                        UmaFailure::Internal("Failed to normalize signature"));
                }
                // ECDSA_SIG now owns both numbers.
                (void)r_copy.release();
                (void)low_s.release();
            }
            const int encoded_len = i2d_ECDSA_SIG(sig.get(), nullptr);
            if (encoded_len <= 0) {
                return Result<std::vector<uint8_t>, UmaFailure>::Err(
                    UmaFailure::Internal("Failed to encode signature"));
            }
            std::vector<uint8_t> encoded(static_cast<size_t>(encoded_len));
            unsigned char* out = encoded.data();
            i2d_ECDSA_SIG(sig.get(), &out);
            return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(encoded));
        }
    }

    Result<std::vector<uint8_t>, UmaFailure> Secp256k1::DerivePublicKey(
        std::span<const uint8_t> private_key) {
        UMA_TRY_ASSIGN(auto group, NewGroup());
        UMA_TRY_ASSIGN(auto scalar, DecodeScalar(group.get(), private_key));
        return MultiplyPoint(group.get(), scalar.get(), nullptr);
    }

    Result<std::vector<uint8_t>, UmaFailure> Secp256k1::NormalizePublicKey(
        std::span<const uint8_t> public_key) {
        UMA_TRY_ASSIGN(auto group, NewGroup());
        UMA_TRY_ASSIGN(auto point, DecodePoint(group.get(), public_key));
        return EncodePoint(group.get(), point.get());
    }

    Result<Secp256k1KeyPair, UmaFailure> Secp256k1::GenerateKeyPair() {
        const std::string algorithm(OpenSSL::ALGORITHM_EC);
        const std::string curve(OpenSSL::CURVE_SECP256K1);
        EVP_PKEY_ptr key(EVP_PKEY_Q_keygen(nullptr, nullptr, algorithm.c_str(), curve.c_str()));
        if (!key) {
            return Result<Secp256k1KeyPair, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("secp256k1 key generation failed: {}", GetOpenSSLError())));
        }
        BIGNUM* raw_scalar = nullptr;
        if (EVP_PKEY_get_bn_param(key.get(), OSSL_PKEY_PARAM_PRIV_KEY, &raw_scalar) != OpenSSL::SUCCESS) {
            return Result<Secp256k1KeyPair, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to read generated private key: {}", GetOpenSSLError())));
        }
        const SECRET_BIGNUM_ptr scalar(raw_scalar);
        Secp256k1KeyPair pair;
        pair.private_key.resize(Constants::SECP256K1_PRIVATE_KEY_SIZE);
        if (BN_bn2binpad(scalar.get(), pair.private_key.data(),
                         static_cast<int>(pair.private_key.size())) < 0) {
            return Result<Secp256k1KeyPair, UmaFailure>::Err(
                UmaFailure::Internal("Failed to export generated private key"));
        }
        UMA_TRY_ASSIGN(pair.public_key, DerivePublicKey(pair.private_key));
        return Result<Secp256k1KeyPair, UmaFailure>::Ok(std::move(pair));
    }

    Result<std::vector<uint8_t>, UmaFailure> Secp256k1::Sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> private_key) {
        UMA_TRY_ASSIGN(auto group, NewGroup());
        UMA_TRY_ASSIGN(auto scalar, DecodeScalar(group.get(), private_key));
        UMA_TRY_ASSIGN(const auto public_key, MultiplyPoint(group.get(), scalar.get(), nullptr));
        UMA_TRY_ASSIGN(auto key, BuildKey(scalar.get(), public_key));

        EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
        if (!md_ctx ||
            EVP_DigestSignInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to initialize signing: {}", GetOpenSSLError())));
        }
        size_t signature_len = 0;
        if (EVP_DigestSign(md_ctx.get(), nullptr, &signature_len,
                           message.data(), message.size()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Failed to size signature: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> der(signature_len);
        if (EVP_DigestSign(md_ctx.get(), der.data(), &signature_len,
                           message.data(), message.size()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::Internal(
                    compat::format("Signing failed: {}", GetOpenSSLError())));
        }
        der.resize(signature_len);
        return NormalizeLowS(group.get(), der);
    }

    bool Secp256k1::Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> der_signature,
        std::span<const uint8_t> public_key) {
        if (der_signature.empty()) {
            return false;
        }
        auto normalized = NormalizePublicKey(public_key);
        if (normalized.IsErr()) {
            return false;
        }
        auto key = BuildKey(nullptr, normalized.Unwrap());
        if (key.IsErr()) {
            return false;
        }
        EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
        if (!md_ctx ||
            EVP_DigestVerifyInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, key.Unwrap().get())
                != OpenSSL::SUCCESS) {
            ERR_clear_error();
            return false;
        }
        const int rc = EVP_DigestVerify(
            md_ctx.get(), der_signature.data(), der_signature.size(),
            message.data(), message.size());
        ERR_clear_error();
        return rc == OpenSSL::SUCCESS;
    }

    Result<std::vector<uint8_t>, UmaFailure> Secp256k1::ComputeSharedPoint(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key) {
        UMA_TRY_ASSIGN(auto group, NewGroup());
        UMA_TRY_ASSIGN(auto scalar, DecodeScalar(group.get(), private_key));
        UMA_TRY_ASSIGN(auto peer, DecodePoint(group.get(), peer_public_key));
        return MultiplyPoint(group.get(), scalar.get(), peer.get());
    }

}
