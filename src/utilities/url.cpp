#include "uma/utilities/url.hpp"
#include "uma/protocol/constants.hpp"
#include "uma/core/format.hpp"

#include <cctype>
#include <charconv>

namespace uma::protocol::utilities {

    namespace {

        bool IsUnreserved(const unsigned char c) {
            return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        }

        int HexValue(const char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        UmaFailure InvalidUrl(std::string_view url, std::string_view reason) {
            return UmaFailure::InvalidInput(compat::format("Invalid URL '{}': {}", url, reason));
        }

    }

    std::optional<std::string> ParsedUrl::QueryValue(std::string_view key) const {
        for (const auto& [name, value] : query) {
            if (name == key) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string Url::Encode(std::string_view value) {
        static constexpr char hex_chars[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const char c : value) {
            const auto uc = static_cast<unsigned char>(c);
            if (IsUnreserved(uc)) {
                encoded.push_back(c);
            } else {
                encoded.push_back('%');
                encoded.push_back(hex_chars[uc >> 4]);
                encoded.push_back(hex_chars[uc & 0x0F]);
            }
        }
        return encoded;
    }

    Result<std::string, UmaFailure> Url::Decode(std::string_view value) {
        return PercentDecode(value, true);
    }

    Result<std::string, UmaFailure> Url::DecodePathSegment(std::string_view value) {
        return PercentDecode(value, false);
    }

    Result<std::string, UmaFailure> Url::PercentDecode(std::string_view value, const bool plus_as_space) {
        std::string decoded;
        decoded.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            const char c = value[i];
            if (c == '+' && plus_as_space) {
                decoded.push_back(' ');
            } else if (c == '%') {
                if (i + 2 >= value.size()) {
                    return Result<std::string, UmaFailure>::Err(
                        UmaFailure::InvalidInput("Truncated percent-encoding"));
                }
                const int high = HexValue(value[i + 1]);
                const int low = HexValue(value[i + 2]);
                if (high < 0 || low < 0) {
                    return Result<std::string, UmaFailure>::Err(
                        UmaFailure::InvalidInput("Invalid percent-encoding"));
                }
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            } else {
                decoded.push_back(c);
            }
        }
        return Result<std::string, UmaFailure>::Ok(std::move(decoded));
    }

    Result<ParsedUrl, UmaFailure> Url::Parse(std::string_view url) {
        ParsedUrl parsed;

        const auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return Result<ParsedUrl, UmaFailure>::Err(InvalidUrl(url, "missing scheme"));
        }
        for (const char c : url.substr(0, scheme_end)) {
            parsed.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        std::string_view rest = url.substr(scheme_end + 3);
        if (const auto fragment = rest.find('#'); fragment != std::string_view::npos) {
            rest = rest.substr(0, fragment);
        }

        std::string_view query_part;
        if (const auto question = rest.find('?'); question != std::string_view::npos) {
            query_part = rest.substr(question + 1);
            rest = rest.substr(0, question);
        }

        std::string_view authority = rest;
        std::string_view path;
        if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
            authority = rest.substr(0, slash);
            path = rest.substr(slash);
        }
        if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }
        if (authority.empty()) {
            return Result<ParsedUrl, UmaFailure>::Err(InvalidUrl(url, "missing host"));
        }

        if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            const std::string_view port_text = authority.substr(colon + 1);
            uint16_t port = 0;
            const auto [ptr, ec] = std::from_chars(
                port_text.data(), port_text.data() + port_text.size(), port);
            if (port_text.empty() || ec != std::errc() || ptr != port_text.data() + port_text.size()) {
                return Result<ParsedUrl, UmaFailure>::Err(InvalidUrl(url, "invalid port"));
            }
            parsed.port = port;
            authority = authority.substr(0, colon);
        }
        parsed.host = std::string(authority);

        size_t start = 0;
        while (start < path.size()) {
            if (path[start] == '/') {
                ++start;
                continue;
            }
            auto end = path.find('/', start);
            if (end == std::string_view::npos) {
                end = path.size();
            }
            UMA_TRY_ASSIGN(auto segment, DecodePathSegment(path.substr(start, end - start)));
            parsed.path_segments.push_back(std::move(segment));
            start = end;
        }

        start = 0;
        while (start < query_part.size()) {
            auto end = query_part.find('&', start);
            if (end == std::string_view::npos) {
                end = query_part.size();
            }
            const std::string_view pair = query_part.substr(start, end - start);
            if (!pair.empty()) {
                const auto equals = pair.find('=');
                UMA_TRY_ASSIGN(auto key, Decode(pair.substr(0, equals)));
                std::string value;
                if (equals != std::string_view::npos) {
                    UMA_TRY_ASSIGN(value, Decode(pair.substr(equals + 1)));
                }
                parsed.query.emplace_back(std::move(key), std::move(value));
            }
            start = end + 1;
        }

        return Result<ParsedUrl, UmaFailure>::Ok(std::move(parsed));
    }

    std::string Url::BuildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
        std::string query;
        for (const auto& [key, value] : params) {
            if (!query.empty()) {
                query.push_back('&');
            }
            query += Encode(key);
            query.push_back('=');
            query += Encode(value);
        }
        return query;
    }

    bool Url::IsDomainLocalhost(std::string_view domain) {
        const std::string_view host = domain.substr(0, domain.find(':'));
        const auto last_dot = host.rfind('.');
        const std::string_view tld = last_dot == std::string_view::npos ? host : host.substr(last_dot + 1);
        return host == "localhost" || tld == "local" || tld == "internal" || host == "127.0.0.1";
    }

    Result<std::string, UmaFailure> Url::GetVaspDomainFromUmaAddress(std::string_view address) {
        const auto at = address.find(kAddressDelimiter);
        if (at == std::string_view::npos || at + 1 >= address.size()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::InvalidInput(compat::format(
                    "Invalid UMA address '{}', expected $user@domain.com", address)));
        }
        return Result<std::string, UmaFailure>::Ok(std::string(address.substr(at + 1)));
    }

}
