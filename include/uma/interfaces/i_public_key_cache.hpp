#pragma once
#include "uma/protocol/pub_key_response.hpp"
#include <optional>
#include <string_view>
namespace uma::protocol::interfaces {

class IPublicKeyCache {
public:
    virtual ~IPublicKeyCache() = default;

    /// Nothing for unknown or expired domains.
    [[nodiscard]] virtual std::optional<PubKeyResponse> FetchPublicKeyForVasp(std::string_view vasp_domain) = 0;

    /// Entries that are already expired are not stored.
    virtual void AddPublicKeyForVasp(std::string_view vasp_domain, const PubKeyResponse& response) = 0;

    virtual void RemovePublicKeyForVasp(std::string_view vasp_domain) = 0;

    virtual void Clear() = 0;
};

}
