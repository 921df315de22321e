#include "uma/protocol/version.hpp"
#include "uma/core/format.hpp"

#include <algorithm>
#include <charconv>

namespace uma::protocol {

    namespace {

        bool ParseComponent(std::string_view text, int& out) {
            if (text.empty()) {
                return false;
            }
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            return ec == std::errc() && ptr == text.data() + text.size() && out >= 0;
        }

    }

    Result<Version, UmaFailure> Version::Parse(std::string_view text) {
        const auto dot = text.find('.');
        if (dot == std::string_view::npos || text.find('.', dot + 1) != std::string_view::npos) {
            return Result<Version, UmaFailure>::Err(
                UmaFailure::InvalidInput(compat::format("Invalid version string: {}", text)));
        }
        Version version;
        if (!ParseComponent(text.substr(0, dot), version.major) ||
            !ParseComponent(text.substr(dot + 1), version.minor)) {
            return Result<Version, UmaFailure>::Err(
                UmaFailure::InvalidInput(compat::format("Invalid version string: {}", text)));
        }
        return Result<Version, UmaFailure>::Ok(version);
    }

    std::string Version::ToString() const {
        return compat::format("{}.{}", major, minor);
    }

    VersionNegotiator::VersionNegotiator(configuration::ProtocolConfig config)
        : config_(std::move(config)) {}

    std::vector<int> VersionNegotiator::SupportedMajorVersions() const {
        std::vector<int> majors{config_.GetMajorVersion()};
        for (const auto& version : config_.GetBackwardCompatibleVersions()) {
            auto parsed = Version::Parse(version);
            if (parsed.IsOk()) {
                majors.push_back(parsed.Unwrap().major);
            }
        }
        std::sort(majors.begin(), majors.end());
        majors.erase(std::unique(majors.begin(), majors.end()), majors.end());
        return majors;
    }

    bool VersionNegotiator::IsVersionSupported(std::string_view version) const {
        return RequireSupported(version).IsOk();
    }

    Result<Version, UmaFailure> VersionNegotiator::RequireSupported(std::string_view version) const {
        auto parsed = Version::Parse(version);
        if (parsed.IsErr()) {
            return Result<Version, UmaFailure>::Err(UnsupportedVersionFailure(version));
        }
        const std::vector<int> majors = SupportedMajorVersions();
        if (std::find(majors.begin(), majors.end(), parsed.Unwrap().major) == majors.end()) {
            return Result<Version, UmaFailure>::Err(UnsupportedVersionFailure(version));
        }
        return parsed;
    }

    std::optional<std::string> VersionNegotiator::SelectHighestSupportedVersion(
        std::span<const int> peer_major_versions) const {
        const std::vector<int> majors = SupportedMajorVersions();
        std::optional<int> highest;
        for (const int peer_major : peer_major_versions) {
            if (std::find(majors.begin(), majors.end(), peer_major) == majors.end()) {
                continue;
            }
            if (!highest.has_value() || peer_major > *highest) {
                highest = peer_major;
            }
        }
        if (!highest.has_value()) {
            return std::nullopt;
        }
        return VersionForMajor(*highest);
    }

    Result<std::string, UmaFailure> VersionNegotiator::SelectResponseVersion(
        std::string_view requested_version) const {
        UMA_TRY_ASSIGN(const Version requested, Version::Parse(requested_version));
        const Version current{config_.GetMajorVersion(), config_.GetMinorVersion()};
        return Result<std::string, UmaFailure>::Ok(std::min(requested, current).ToString());
    }

    UmaFailure VersionNegotiator::UnsupportedVersionFailure(std::string_view version) const {
        return UmaFailure::UnsupportedVersion(std::string(version), SupportedMajorVersions());
    }

    std::optional<std::string> VersionNegotiator::VersionForMajor(const int major) const {
        if (major == config_.GetMajorVersion()) {
            return config_.GetCurrentVersion();
        }
        for (const auto& version : config_.GetBackwardCompatibleVersions()) {
            auto parsed = Version::Parse(version);
            if (parsed.IsOk() && parsed.Unwrap().major == major) {
                return version;
            }
        }
        return std::nullopt;
    }

}
