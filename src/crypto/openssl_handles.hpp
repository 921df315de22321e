#pragma once
#include "uma/core/constants.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <memory>
#include <string>

namespace uma::protocol::crypto::detail {

template<typename T, void (*Free)(T*)>
struct OpenSSLDeleter {
    void operator()(T* ptr) const {
        if (ptr) {
            Free(ptr);
        }
    }
};

using BN_CTX_ptr = std::unique_ptr<BN_CTX, OpenSSLDeleter<BN_CTX, BN_CTX_free>>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, OpenSSLDeleter<BIGNUM, BN_free>>;
using SECRET_BIGNUM_ptr = std::unique_ptr<BIGNUM, OpenSSLDeleter<BIGNUM, BN_clear_free>>;
using EC_GROUP_ptr = std::unique_ptr<EC_GROUP, OpenSSLDeleter<EC_GROUP, EC_GROUP_free>>;
using EC_POINT_ptr = std::unique_ptr<EC_POINT, OpenSSLDeleter<EC_POINT, EC_POINT_free>>;
using ECDSA_SIG_ptr = std::unique_ptr<ECDSA_SIG, OpenSSLDeleter<ECDSA_SIG, ECDSA_SIG_free>>;
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, OpenSSLDeleter<EVP_PKEY, EVP_PKEY_free>>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, OpenSSLDeleter<EVP_PKEY_CTX, EVP_PKEY_CTX_free>>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, OpenSSLDeleter<EVP_MD_CTX, EVP_MD_CTX_free>>;
using OSSL_PARAM_BLD_ptr = std::unique_ptr<OSSL_PARAM_BLD, OpenSSLDeleter<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>>;
using OSSL_PARAM_ptr = std::unique_ptr<OSSL_PARAM, OpenSSLDeleter<OSSL_PARAM, OSSL_PARAM_free>>;
using X509_ptr = std::unique_ptr<X509, OpenSSLDeleter<X509, X509_free>>;
using BIO_ptr = std::unique_ptr<BIO, OpenSSLDeleter<BIO, BIO_free_all>>;

inline std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return std::string(buffer);
}

}
