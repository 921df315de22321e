#include "uma/protocol/lnurlp_request.hpp"
#include "uma/protocol/constants.hpp"
#include "uma/protocol/canonical_payload.hpp"
#include "uma/utilities/url.hpp"

#include <charconv>
#include <utility>

namespace uma::protocol {

    using utilities::Url;

    namespace {

        bool IsValidUsername(const std::string_view user) {
            if (user.empty()) {
                return false;
            }
            for (const char c : user) {
                const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
                if (!alnum && c != '.' && c != '_' && c != '$' && c != '+' && c != '-') {
                    return false;
                }
            }
            return true;
        }

        Result<int64_t, UmaFailure> ParseTimestamp(const std::string_view text) {
            int64_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || end != text.data() + text.size()) {
                return Result<int64_t, UmaFailure>::Err(UmaFailure::Of(
                    ErrorCode::ParseLnurlpRequestError, "Invalid timestamp: " + std::string(text)));
            }
            return Result<int64_t, UmaFailure>::Ok(value);
        }

        bool ParseBoolParam(std::string_view value) {
            if (value.size() != 4) {
                return false;
            }
            const auto lower = CanonicalPayload::ToLowerAscii(std::string(value));
            return lower == "true";
        }

    }

    bool LnurlpRequest::IsUmaRequest() const noexcept {
        return nonce.has_value() && signature.has_value() && vasp_domain.has_value() &&
               timestamp.has_value() && uma_version.has_value();
    }

    Result<UmaLnurlpRequest, UmaFailure> LnurlpRequest::ToStrict() const {
        std::vector<std::string> missing;
        if (!nonce.has_value()) {
            missing.emplace_back("nonce");
        }
        if (!signature.has_value()) {
            missing.emplace_back("signature");
        }
        if (!vasp_domain.has_value()) {
            missing.emplace_back("vaspDomain");
        }
        if (!timestamp.has_value()) {
            missing.emplace_back("timestamp");
        }
        if (!uma_version.has_value()) {
            missing.emplace_back("umaVersion");
        }
        if (!missing.empty()) {
            return Result<UmaLnurlpRequest, UmaFailure>::Err(
                UmaFailure::MissingRequiredFields(std::move(missing)));
        }
        UmaLnurlpRequest strict;
        strict.receiver_address = receiver_address;
        strict.nonce = *nonce;
        strict.signature = *signature;
        strict.is_subject_to_travel_rule = is_subject_to_travel_rule.value_or(false);
        strict.vasp_domain = *vasp_domain;
        strict.timestamp = *timestamp;
        strict.uma_version = *uma_version;
        strict.backing_signatures = backing_signatures;
        return Result<UmaLnurlpRequest, UmaFailure>::Ok(std::move(strict));
    }

    Result<std::string, UmaFailure> LnurlpRequest::EncodeToUrl() const {
        const auto at = receiver_address.find(kAddressDelimiter);
        if (at == std::string::npos || receiver_address.find(kAddressDelimiter, at + 1) != std::string::npos) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::InvalidInput("Invalid receiverAddress: " + receiver_address));
        }
        const std::string user = receiver_address.substr(0, at);
        const std::string domain = receiver_address.substr(at + 1);

        std::string url;
        url.append(Url::SchemeForDomain(domain));
        url.append("://");
        url.append(domain);
        url.append(kWellKnownPrefix);
        url.append(kLnurlpPathSegment);
        url.push_back('/');
        url.append(Url::Encode(user));

        std::vector<std::pair<std::string, std::string>> params;
        if (vasp_domain.has_value()) {
            params.emplace_back("vaspDomain", *vasp_domain);
        }
        if (nonce.has_value()) {
            params.emplace_back("nonce", *nonce);
        }
        if (signature.has_value()) {
            params.emplace_back("signature", *signature);
        }
        if (uma_version.has_value()) {
            params.emplace_back("umaVersion", *uma_version);
        }
        if (timestamp.has_value()) {
            params.emplace_back("timestamp", std::to_string(*timestamp));
        }
        if (is_subject_to_travel_rule.has_value()) {
            params.emplace_back("isSubjectToTravelRule", *is_subject_to_travel_rule ? "true" : "false");
        }
        if (backing_signatures.has_value()) {
            params.emplace_back("backingSignatures", BackingSignature::EncodeQueryValue(*backing_signatures));
        }
        if (!params.empty()) {
            url.push_back('?');
            url.append(Url::BuildQuery(params));
        }
        return Result<std::string, UmaFailure>::Ok(std::move(url));
    }

    Result<LnurlpRequest, UmaFailure> LnurlpRequest::DecodeFromUrl(
        const std::string_view url, const VersionNegotiator& negotiator) {
        auto parsed_result = Url::Parse(url);
        if (parsed_result.IsErr()) {
            return Result<LnurlpRequest, UmaFailure>::Err(UmaFailure::Of(
                ErrorCode::ParseLnurlpRequestError, std::move(parsed_result).UnwrapErr().message));
        }
        const auto parsed = std::move(parsed_result).Unwrap();

        if (parsed.scheme != "http" && parsed.scheme != "https") {
            return Result<LnurlpRequest, UmaFailure>::Err(UmaFailure::Of(
                ErrorCode::ParseLnurlpRequestError, "Invalid URL schema: " + std::string(url)));
        }
        const auto& segments = parsed.path_segments;
        if (segments.size() != 3 || segments[0] != ".well-known" || segments[1] != kLnurlpPathSegment) {
            return Result<LnurlpRequest, UmaFailure>::Err(UmaFailure::Of(
                ErrorCode::ParseLnurlpRequestError, "Invalid uma request path: " + std::string(url)));
        }
        if (!IsValidUsername(segments[2])) {
            return Result<LnurlpRequest, UmaFailure>::Err(UmaFailure::Of(
                ErrorCode::ParseLnurlpRequestError, "Invalid username: " + segments[2]));
        }

        LnurlpRequest request;
        request.receiver_address = segments[2] + kAddressDelimiter + parsed.host;
        if (parsed.port.has_value() && *parsed.port != 80 && *parsed.port != 443) {
            request.receiver_address += ":" + std::to_string(*parsed.port);
        }

        request.uma_version = parsed.QueryValue("umaVersion");
        if (request.uma_version.has_value() && !negotiator.IsVersionSupported(*request.uma_version)) {
            return Result<LnurlpRequest, UmaFailure>::Err(
                negotiator.UnsupportedVersionFailure(*request.uma_version));
        }
        request.vasp_domain = parsed.QueryValue("vaspDomain");
        request.nonce = parsed.QueryValue("nonce");
        request.signature = parsed.QueryValue("signature");
        if (const auto travel_rule = parsed.QueryValue("isSubjectToTravelRule"); travel_rule.has_value()) {
            request.is_subject_to_travel_rule = ParseBoolParam(*travel_rule);
        }
        if (const auto timestamp = parsed.QueryValue("timestamp"); timestamp.has_value()) {
            UMA_TRY_ASSIGN(request.timestamp, ParseTimestamp(*timestamp));
        }
        if (const auto backing = parsed.QueryValue("backingSignatures"); backing.has_value()) {
            UMA_TRY_ASSIGN(request.backing_signatures,
                BackingSignature::DecodeQueryValue(*backing, ErrorCode::ParseLnurlpRequestError));
        }
        return Result<LnurlpRequest, UmaFailure>::Ok(std::move(request));
    }

    LnurlpRequest UmaLnurlpRequest::ToLoose() const {
        LnurlpRequest loose;
        loose.receiver_address = receiver_address;
        loose.nonce = nonce;
        loose.signature = signature;
        loose.is_subject_to_travel_rule = is_subject_to_travel_rule;
        loose.vasp_domain = vasp_domain;
        loose.timestamp = timestamp;
        loose.uma_version = uma_version;
        loose.backing_signatures = backing_signatures;
        return loose;
    }

    std::string UmaLnurlpRequest::SignablePayload() const {
        return CanonicalPayload::ForLnurlpRequest(receiver_address, nonce, timestamp);
    }

    UmaLnurlpRequest UmaLnurlpRequest::SignedWith(std::string new_signature) const {
        UmaLnurlpRequest copy = *this;
        copy.signature = std::move(new_signature);
        return copy;
    }

    UmaLnurlpRequest UmaLnurlpRequest::WithBackingSignature(BackingSignature backing) const {
        UmaLnurlpRequest copy = *this;
        if (!copy.backing_signatures.has_value()) {
            copy.backing_signatures.emplace();
        }
        copy.backing_signatures->push_back(std::move(backing));
        return copy;
    }

}
