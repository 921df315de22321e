#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uma::protocol::utilities {

/// Components of an absolute http(s) URL. Path segments and query values
/// are percent-decoded; query parameters keep their order of appearance.
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::optional<uint16_t> port;
    std::vector<std::string> path_segments;
    std::vector<std::pair<std::string, std::string>> query;

    [[nodiscard]] std::optional<std::string> QueryValue(std::string_view key) const;
};

class Url {
public:
    /// RFC 3986 percent-encoding; unreserved characters pass through.
    [[nodiscard]] static std::string Encode(std::string_view value);

    /// '+' decodes to a space, as in form-encoded query strings.
    [[nodiscard]] static Result<std::string, UmaFailure> Decode(std::string_view value);

    /// Path segments are not form-encoded: '+' is kept.
    [[nodiscard]] static Result<std::string, UmaFailure> DecodePathSegment(std::string_view value);

    [[nodiscard]] static Result<ParsedUrl, UmaFailure> Parse(std::string_view url);

    [[nodiscard]] static std::string BuildQuery(
        const std::vector<std::pair<std::string, std::string>>& params);

    /// Loopback and private-TLD hosts are reached over plain http.
    [[nodiscard]] static bool IsDomainLocalhost(std::string_view domain);

    [[nodiscard]] static std::string_view SchemeForDomain(std::string_view domain) {
        return IsDomainLocalhost(domain) ? "http" : "https";
    }

    /// "$alice@vasp.com" -> "vasp.com"
    [[nodiscard]] static Result<std::string, UmaFailure> GetVaspDomainFromUmaAddress(
        std::string_view address);

private:
    Url() = delete;

    static Result<std::string, UmaFailure> PercentDecode(std::string_view value, bool plus_as_space);
};

} // namespace uma::protocol::utilities
