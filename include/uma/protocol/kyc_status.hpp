#pragma once

#include <cstdint>
#include <string_view>

namespace uma::protocol {

enum class KycStatus : uint8_t {
    Unknown,
    NotVerified,
    Pending,
    Verified
};

[[nodiscard]] constexpr std::string_view KycStatusToString(const KycStatus status) noexcept {
    switch (status) {
        case KycStatus::Unknown: return "UNKNOWN";
        case KycStatus::NotVerified: return "NOT_VERIFIED";
        case KycStatus::Pending: return "PENDING";
        case KycStatus::Verified: return "VERIFIED";
    }
    return "UNKNOWN";
}

/// Unrecognized wire values decode as Unknown.
[[nodiscard]] constexpr KycStatus KycStatusFromString(std::string_view raw) noexcept {
    if (raw == "NOT_VERIFIED") return KycStatus::NotVerified;
    if (raw == "PENDING") return KycStatus::Pending;
    if (raw == "VERIFIED") return KycStatus::Verified;
    return KycStatus::Unknown;
}

} // namespace uma::protocol
