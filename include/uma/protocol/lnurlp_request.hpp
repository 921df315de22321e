#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/protocol/backing_signature.hpp"
#include "uma/protocol/version.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

struct UmaLnurlpRequest;

/**
 * @brief First request in the flow, sent as a GET to the receiver's
 * `/.well-known/lnurlp/<user>` endpoint
 *
 * Every UMA field is optional so plain LNURL requests parse too. Use
 * ToStrict() to require the UMA fields.
 */
struct LnurlpRequest {
    /// `$user@domain`, optionally with a non-default port on the domain.
    std::string receiver_address;
    std::optional<std::string> nonce;
    std::optional<std::string> signature;
    std::optional<bool> is_subject_to_travel_rule;
    std::optional<std::string> vasp_domain;
    std::optional<int64_t> timestamp;
    std::optional<std::string> uma_version;
    std::optional<std::vector<BackingSignature>> backing_signatures;

    bool operator==(const LnurlpRequest&) const = default;

    [[nodiscard]] bool IsUmaRequest() const noexcept;

    /// Fails with MISSING_REQUIRED_UMA_PARAMETERS naming every absent field.
    [[nodiscard]] Result<UmaLnurlpRequest, UmaFailure> ToStrict() const;

    [[nodiscard]] Result<std::string, UmaFailure> EncodeToUrl() const;

    /**
     * @brief Parses an lnurlp query URL
     *
     * The scheme must be http or https and the path exactly
     * `/.well-known/lnurlp/<user>`. A `umaVersion` the negotiator does not
     * support yields UNSUPPORTED_UMA_VERSION.
     */
    [[nodiscard]] static Result<LnurlpRequest, UmaFailure> DecodeFromUrl(
        std::string_view url,
        const VersionNegotiator& negotiator = VersionNegotiator());
};

struct UmaLnurlpRequest {
    std::string receiver_address;
    std::string nonce;
    std::string signature;
    bool is_subject_to_travel_rule = false;
    std::string vasp_domain;
    int64_t timestamp = 0;
    std::string uma_version;
    std::optional<std::vector<BackingSignature>> backing_signatures;

    bool operator==(const UmaLnurlpRequest&) const = default;

    [[nodiscard]] LnurlpRequest ToLoose() const;

    [[nodiscard]] Result<std::string, UmaFailure> EncodeToUrl() const {
        return ToLoose().EncodeToUrl();
    }

    [[nodiscard]] std::string SignablePayload() const;

    [[nodiscard]] UmaLnurlpRequest SignedWith(std::string new_signature) const;

    [[nodiscard]] UmaLnurlpRequest WithBackingSignature(BackingSignature backing) const;
};

} // namespace uma::protocol
