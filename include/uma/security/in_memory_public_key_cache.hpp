#pragma once
#include "uma/interfaces/i_public_key_cache.hpp"
#include "uma/configuration/protocol_config.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
namespace uma::protocol::security {

/**
 * @brief Process-local TTL cache of counterparty public keys
 *
 * An entry is served while its expirationTimestamp lies strictly in the
 * future and evicted on the first lookup after that. Entries published
 * without an expiration are only cached when the config allows
 * non-expiring keys.
 */
class InMemoryPublicKeyCache final : public interfaces::IPublicKeyCache {
public:
    /// Seconds since epoch.
    using Clock = std::function<int64_t()>;

    explicit InMemoryPublicKeyCache(
        configuration::ProtocolConfig config = configuration::ProtocolConfig::Default(),
        Clock clock = SystemClock);

    InMemoryPublicKeyCache(const InMemoryPublicKeyCache&) = delete;
    InMemoryPublicKeyCache& operator=(const InMemoryPublicKeyCache&) = delete;
    InMemoryPublicKeyCache(InMemoryPublicKeyCache&&) = delete;
    InMemoryPublicKeyCache& operator=(InMemoryPublicKeyCache&&) = delete;
    ~InMemoryPublicKeyCache() override = default;

    [[nodiscard]] std::optional<PubKeyResponse> FetchPublicKeyForVasp(std::string_view vasp_domain) override;
    void AddPublicKeyForVasp(std::string_view vasp_domain, const PubKeyResponse& response) override;
    void RemovePublicKeyForVasp(std::string_view vasp_domain) override;
    void Clear() override;

    size_t GetCachedDomainCount() const;

    static int64_t SystemClock();

private:
    [[nodiscard]] bool IsUsable(const PubKeyResponse& response, int64_t now) const;

    configuration::ProtocolConfig config_;
    Clock clock_;
    mutable std::mutex lock_;
    std::map<std::string, PubKeyResponse, std::less<>> entries_;
};

}
