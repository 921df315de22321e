#pragma once
#include "uma/core/error_code.hpp"
#include "uma/core/result.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <cstdint>
namespace uma::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
};

/// Distinguishes the ways a portable invoice token can fail to decode.
enum class CodecFailureKind : uint8_t {
    None,
    Checksum,
    Structure,
    MissingField
};
enum class ReplayFailureKind : uint8_t {
    None,
    NonceReused,
    TimestampTooOld
};

/**
 * Typed error value returned by every fallible protocol operation.
 *
 * Beyond the protocol error code and human readable reason, a failure keeps
 * the structured detail a server needs to render a compliant error body:
 * names of missing fields, the supported major versions for a negotiation
 * failure, and the codec or replay sub-kind.
 */
class UmaFailure {
public:
    ErrorCode code;
    std::string message;
    std::vector<std::string> missing_fields;
    std::vector<int> supported_major_versions;
    std::optional<std::string> unsupported_version;
    CodecFailureKind codec_failure = CodecFailureKind::None;
    ReplayFailureKind replay_failure = ReplayFailureKind::None;

    UmaFailure(const ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] int HttpStatus() const noexcept { return ErrorCodeHttpStatus(code); }
    [[nodiscard]] std::string_view CodeName() const noexcept { return ErrorCodeName(code); }

    /// Renders `{"status":"ERROR","reason":...,"code":...}` plus any
    /// code-specific fields.
    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const;

    static UmaFailure Of(const ErrorCode c, std::string msg) {
        return {c, std::move(msg)};
    }
    static UmaFailure InvalidInput(std::string msg) {
        return {ErrorCode::InvalidInput, std::move(msg)};
    }
    static UmaFailure Internal(std::string msg) {
        return {ErrorCode::InternalError, std::move(msg)};
    }
    static UmaFailure InvalidSignature(std::string msg) {
        return {ErrorCode::InvalidSignature, std::move(msg)};
    }
    static UmaFailure InvalidPubKeyFormat(std::string msg) {
        return {ErrorCode::InvalidPubkeyFormat, std::move(msg)};
    }
    static UmaFailure CertChainInvalid(std::string msg) {
        return {ErrorCode::CertChainInvalid, std::move(msg)};
    }
    static UmaFailure PubKeyFetch(std::string msg) {
        return {ErrorCode::CounterpartyPubkeyFetchError, std::move(msg)};
    }
    static UmaFailure MissingRequiredFields(std::vector<std::string> fields);
    static UmaFailure UnsupportedVersion(std::string version, std::vector<int> supported_majors);
    static UmaFailure NonceReused();
    static UmaFailure TimestampTooOld();
    static UmaFailure InvoiceChecksum(std::string msg);
    static UmaFailure InvoiceStructure(std::string msg);
    static UmaFailure InvoiceMissingFields(std::vector<std::string> fields);
    static UmaFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Internal(sf.message);
    }
};
}
