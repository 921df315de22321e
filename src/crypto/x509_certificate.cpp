#include "uma/crypto/x509_certificate.hpp"
#include "uma/crypto/secp256k1.hpp"
#include "uma/core/format.hpp"
#include "openssl_handles.hpp"

#include <openssl/core_names.h>
#include <openssl/pem.h>

namespace uma::protocol::crypto {

    using namespace detail;

    namespace {
        Result<BIO_ptr, UmaFailure> OpenPem(std::string_view pem_chain) {
            if (pem_chain.empty()) {
                return Result<BIO_ptr, UmaFailure>::Err(
                    UmaFailure::CertChainInvalid("Certificate chain is empty"));
            }
            BIO_ptr bio(BIO_new_mem_buf(pem_chain.data(), static_cast<int>(pem_chain.size())));
            if (!bio) {
                return Result<BIO_ptr, UmaFailure>::Err(
                    UmaFailure::Internal("Failed to allocate certificate buffer"));
            }
            return Result<BIO_ptr, UmaFailure>::Ok(std::move(bio));
        }
    }

    Result<size_t, UmaFailure> X509Certificate::CountCertificates(std::string_view pem_chain) {
        UMA_TRY_ASSIGN(auto bio, OpenPem(pem_chain));
        size_t count = 0;
        while (true) {
            X509_ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
            if (!cert) {
                break;
            }
            ++count;
        }
        const unsigned long err = ERR_peek_last_error();
        // Reaching the end of the buffer reports PEM_R_NO_START_LINE; anything else is a parse failure.
        const bool clean_end = err == 0 ||
            (ERR_GET_LIB(err) == ERR_LIB_PEM && ERR_GET_REASON(err) == PEM_R_NO_START_LINE);
        ERR_clear_error();
        if (count == 0 || !clean_end) {
            return Result<size_t, UmaFailure>::Err(
                UmaFailure::CertChainInvalid("Certificate chain could not be parsed"));
        }
        return Result<size_t, UmaFailure>::Ok(count);
    }

    Result<std::vector<uint8_t>, UmaFailure> X509Certificate::ExtractLeafPublicKey(
        std::string_view pem_chain) {
        UMA_TRY_ASSIGN(auto bio, OpenPem(pem_chain));
        X509_ptr leaf(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!leaf) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::CertChainInvalid(
                    compat::format("Failed to parse leaf certificate: {}", GetOpenSSLError())));
        }
        EVP_PKEY* key = X509_get0_pubkey(leaf.get());
        if (key == nullptr || !EVP_PKEY_is_a(key, "EC")) {
            ERR_clear_error();
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidPubKeyFormat("Leaf certificate does not carry an EC public key"));
        }
        size_t encoded_len = 0;
        if (EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_PUB_KEY, nullptr, 0, &encoded_len)
                != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidPubKeyFormat(
                    compat::format("Failed to read certificate public key: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> encoded(encoded_len);
        if (EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_PUB_KEY,
                                            encoded.data(), encoded.size(), &encoded_len)
                != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, UmaFailure>::Err(
                UmaFailure::InvalidPubKeyFormat(
                    compat::format("Failed to read certificate public key: {}", GetOpenSSLError())));
        }
        encoded.resize(encoded_len);
        return Secp256k1::NormalizePublicKey(encoded);
    }

}
