#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
namespace uma::protocol::crypto {

class X509Certificate {
public:
    /// Number of certificates in a PEM bundle. Fails with CERT_CHAIN_INVALID
    /// when the bundle holds none or any block fails to parse.
    [[nodiscard]] static Result<size_t, UmaFailure> CountCertificates(std::string_view pem_chain);

    /// Uncompressed secp256k1 public key of the leaf (first) certificate.
    [[nodiscard]] static Result<std::vector<uint8_t>, UmaFailure> ExtractLeafPublicKey(
        std::string_view pem_chain);

private:
    X509Certificate() = delete;
};

}
