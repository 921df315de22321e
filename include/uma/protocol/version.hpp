#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/configuration/protocol_config.hpp"

#include <compare>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

/// A "major.minor" protocol version. Ordered by major, then minor.
struct Version {
    int major = 0;
    int minor = 0;

    [[nodiscard]] static Result<Version, UmaFailure> Parse(std::string_view text);

    [[nodiscard]] std::string ToString() const;

    auto operator<=>(const Version&) const = default;
};

/**
 * @brief Picks the protocol version used with a counterparty
 *
 * Supported majors are the configured current major plus the major of each
 * backward compatible version string. An older major always maps back to
 * its configured "major.minor" string, the current major to the current
 * version.
 */
class VersionNegotiator {
public:
    explicit VersionNegotiator(
        configuration::ProtocolConfig config = configuration::ProtocolConfig::Default());

    /// Ascending, without duplicates.
    [[nodiscard]] std::vector<int> SupportedMajorVersions() const;

    [[nodiscard]] bool IsVersionSupported(std::string_view version) const;

    /// Ok(version) when supported, UNSUPPORTED_UMA_VERSION (412) otherwise.
    [[nodiscard]] Result<Version, UmaFailure> RequireSupported(std::string_view version) const;

    [[nodiscard]] std::optional<std::string> SelectHighestSupportedVersion(
        std::span<const int> peer_major_versions) const;

    /**
     * @brief Version to answer a request with
     *
     * The smaller of the requested and the current version under
     * major-then-minor ordering. Major and minor are not minimized
     * independently: a request for 0.9 against current 1.0 yields 0.9.
     */
    [[nodiscard]] Result<std::string, UmaFailure> SelectResponseVersion(
        std::string_view requested_version) const;

    [[nodiscard]] UmaFailure UnsupportedVersionFailure(std::string_view version) const;

    [[nodiscard]] const configuration::ProtocolConfig& GetConfig() const noexcept { return config_; }

private:
    [[nodiscard]] std::optional<std::string> VersionForMajor(int major) const;

    configuration::ProtocolConfig config_;
};

} // namespace uma::protocol
