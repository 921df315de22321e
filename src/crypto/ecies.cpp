#include "uma/crypto/ecies.hpp"
#include "uma/crypto/aes_gcm.hpp"
#include "uma/crypto/hkdf.hpp"
#include "uma/crypto/secp256k1.hpp"
#include "uma/crypto/sodium_interop.hpp"
#include "uma/core/constants.hpp"
#include "uma/core/format.hpp"

namespace uma::protocol::crypto {

    namespace {
        void Wipe(std::vector<uint8_t>& buffer) {
            if (SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsErr()) {
                buffer.assign(buffer.size(), 0);
            }
        }

        constexpr size_t kHeaderSize =
            Constants::SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE +
            Constants::ECIES_NONCE_SIZE +
            Constants::AES_GCM_TAG_SIZE;

        Result<std::vector<uint8_t>, UmaFailure> DeriveSymmetricKey(
            std::span<const uint8_t> ephemeral_public_key,
            std::span<const uint8_t> shared_point) {
            std::vector<uint8_t> master;
            master.reserve(ephemeral_public_key.size() + shared_point.size());
            master.insert(master.end(), ephemeral_public_key.begin(), ephemeral_public_key.end());
            master.insert(master.end(), shared_point.begin(), shared_point.end());
            auto key = Hkdf::DeriveKeyBytes(master, Constants::AES_KEY_SIZE);
            Wipe(master);
            return key;
        }
    }

    Result<std::vector<uint8_t>, UmaFailure> Ecies::Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> recipient_public_key) {
        UMA_TRY_ASSIGN(auto ephemeral, Secp256k1::GenerateKeyPair());
        auto shared_result = Secp256k1::ComputeSharedPoint(ephemeral.private_key, recipient_public_key);
        Wipe(ephemeral.private_key);
        UMA_TRY_ASSIGN(auto shared_point, std::move(shared_result));
        UMA_TRY_ASSIGN(auto key, DeriveSymmetricKey(ephemeral.public_key, shared_point));
        Wipe(shared_point);

        const auto nonce = SodiumInterop::GetRandomBytes(Constants::ECIES_NONCE_SIZE);
        auto sealed_result = AesGcm::Encrypt(key, nonce, plaintext);
        Wipe(key);
        UMA_TRY_ASSIGN(const auto sealed, std::move(sealed_result));

        const size_t body_len = sealed.size() - Constants::AES_GCM_TAG_SIZE;
        std::vector<uint8_t> output;
        output.reserve(kHeaderSize + body_len);
        output.insert(output.end(), ephemeral.public_key.begin(), ephemeral.public_key.end());
        output.insert(output.end(), nonce.begin(), nonce.end());
        output.insert(output.end(), sealed.begin() + static_cast<std::ptrdiff_t>(body_len), sealed.end());
        output.insert(output.end(), sealed.begin(), sealed.begin() + static_cast<std::ptrdiff_t>(body_len));
        return Result<std::vector<uint8_t>, UmaFailure>::Ok(std::move(output));
    }

    Result<std::vector<uint8_t>, UmaFailure> Ecies::Decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> recipient_private_key) {
        if (ciphertext.size() < kHeaderSize) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidInput(
                    compat::format("ECIES payload too short: {} bytes (minimum {})",
                        ciphertext.size(), kHeaderSize)));
        }
        const auto ephemeral_public_key =
            ciphertext.subspan(0, Constants::SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE);
        const auto nonce = ciphertext.subspan(
            Constants::SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE, Constants::ECIES_NONCE_SIZE);
        const auto tag = ciphertext.subspan(
            Constants::SECP256K1_UNCOMPRESSED_PUBLIC_KEY_SIZE + Constants::ECIES_NONCE_SIZE,
            Constants::AES_GCM_TAG_SIZE);
        const auto body = ciphertext.subspan(kHeaderSize);

        UMA_TRY_ASSIGN(auto shared_point,
            Secp256k1::ComputeSharedPoint(recipient_private_key, ephemeral_public_key));
        UMA_TRY_ASSIGN(auto key, DeriveSymmetricKey(ephemeral_public_key, shared_point));
        Wipe(shared_point);

        std::vector<uint8_t> sealed;
        sealed.reserve(body.size() + tag.size());
        sealed.insert(sealed.end(), body.begin(), body.end());
        sealed.insert(sealed.end(), tag.begin(), tag.end());
        auto plaintext = AesGcm::Decrypt(key, nonce, sealed);
        Wipe(key);
        return plaintext;
    }

}
