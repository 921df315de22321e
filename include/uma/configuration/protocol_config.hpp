#pragma once

#include "uma/protocol/constants.hpp"

#include <string>
#include <vector>
#include <utility>

namespace uma::protocol::configuration {

/// Version and cache policy for one protocol deployment.
///
/// The current version is what this implementation speaks natively. The
/// backward compatible list holds one "major.minor" string per older major
/// version that is still understood; it is what version negotiation answers
/// with when a peer only offers that older major.
///
/// @example
/// ```cpp
/// auto config = ProtocolConfig::Default();                  // 1.0, back-compat 0.3
/// auto legacy = config.WithBackwardCompatibleVersions({});  // 1.x only
/// ```
class ProtocolConfig {
public:
    [[nodiscard]] static ProtocolConfig Default() {
        return ProtocolConfig(
            kUmaMajorVersion,
            kUmaMinorVersion,
            {std::string(kUmaBackwardCompatibleVersion)},
            false);
    }

    [[nodiscard]] ProtocolConfig WithCurrentVersion(const int major, const int minor) const {
        ProtocolConfig copy = *this;
        copy.major_version_ = major;
        copy.minor_version_ = minor;
        return copy;
    }

    [[nodiscard]] ProtocolConfig WithBackwardCompatibleVersions(std::vector<std::string> versions) const {
        ProtocolConfig copy = *this;
        copy.backward_compatible_versions_ = std::move(versions);
        return copy;
    }

    /// When enabled, public keys published without an expiration timestamp
    /// are cached and served until explicitly removed.
    [[nodiscard]] ProtocolConfig WithNonExpiringKeysAllowed(const bool allowed) const {
        ProtocolConfig copy = *this;
        copy.allow_non_expiring_keys_ = allowed;
        return copy;
    }

    [[nodiscard]] int GetMajorVersion() const noexcept { return major_version_; }
    [[nodiscard]] int GetMinorVersion() const noexcept { return minor_version_; }

    [[nodiscard]] std::string GetCurrentVersion() const {
        return std::to_string(major_version_) + "." + std::to_string(minor_version_);
    }

    [[nodiscard]] const std::vector<std::string>& GetBackwardCompatibleVersions() const noexcept {
        return backward_compatible_versions_;
    }

    [[nodiscard]] bool AllowsNonExpiringKeys() const noexcept {
        return allow_non_expiring_keys_;
    }

    [[nodiscard]] bool operator==(const ProtocolConfig& other) const {
        return major_version_ == other.major_version_ &&
               minor_version_ == other.minor_version_ &&
               backward_compatible_versions_ == other.backward_compatible_versions_ &&
               allow_non_expiring_keys_ == other.allow_non_expiring_keys_;
    }

private:
    ProtocolConfig(
        const int major,
        const int minor,
        std::vector<std::string> backward_compatible,
        const bool allow_non_expiring_keys)
        : major_version_(major)
        , minor_version_(minor)
        , backward_compatible_versions_(std::move(backward_compatible))
        , allow_non_expiring_keys_(allow_non_expiring_keys) {}

    int major_version_;
    int minor_version_;
    std::vector<std::string> backward_compatible_versions_;
    bool allow_non_expiring_keys_;
};

} // namespace uma::protocol::configuration
