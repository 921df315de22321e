#include "uma/security/in_memory_public_key_cache.hpp"
#include "uma/debug/protocol_logger.hpp"
#include <chrono>

namespace uma::protocol::security {
    InMemoryPublicKeyCache::InMemoryPublicKeyCache(configuration::ProtocolConfig config, Clock clock)
        : config_(std::move(config))
          , clock_(std::move(clock)) {
    }

    int64_t InMemoryPublicKeyCache::SystemClock() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    bool InMemoryPublicKeyCache::IsUsable(const PubKeyResponse& response, const int64_t now) const {
        const auto& expiration = response.ExpirationTimestamp();
        if (!expiration.has_value()) {
            return config_.AllowsNonExpiringKeys();
        }
        return *expiration > now;
    }

    std::optional<PubKeyResponse> InMemoryPublicKeyCache::FetchPublicKeyForVasp(const std::string_view vasp_domain) {
        const int64_t now = clock_();
        std::lock_guard guard(lock_);
        const auto it = entries_.find(vasp_domain);
        if (it == entries_.end()) {
            debug::LogKeyCacheEvent(vasp_domain, "MISS");
            return std::nullopt;
        }
        if (!IsUsable(it->second, now)) {
            debug::LogKeyCacheEvent(vasp_domain, "EXPIRED");
            entries_.erase(it);
            return std::nullopt;
        }
        debug::LogKeyCacheEvent(vasp_domain, "HIT");
        return it->second;
    }

    void InMemoryPublicKeyCache::AddPublicKeyForVasp(
        const std::string_view vasp_domain,
        const PubKeyResponse& response) {
        const int64_t now = clock_();
        if (!IsUsable(response, now)) {
            debug::LogKeyCacheEvent(vasp_domain, "REFUSED");
            return;
        }
        std::lock_guard guard(lock_);
        entries_.insert_or_assign(std::string(vasp_domain), response);
        debug::LogKeyCacheEvent(vasp_domain, "STORED");
    }

    void InMemoryPublicKeyCache::RemovePublicKeyForVasp(const std::string_view vasp_domain) {
        std::lock_guard guard(lock_);
        if (const auto it = entries_.find(vasp_domain); it != entries_.end()) {
            entries_.erase(it);
        }
    }

    void InMemoryPublicKeyCache::Clear() {
        std::lock_guard guard(lock_);
        entries_.clear();
    }

    size_t InMemoryPublicKeyCache::GetCachedDomainCount() const {
        std::lock_guard guard(lock_);
        return entries_.size();
    }
}
