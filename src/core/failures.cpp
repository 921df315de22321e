#include "uma/core/failures.hpp"
#include "uma/core/constants.hpp"
#include "uma/core/format.hpp"
#include "uma/utilities/json_value.hpp"

namespace uma::protocol {

    namespace {

        std::string JoinNames(const std::vector<std::string>& names) {
            std::string joined;
            for (size_t i = 0; i < names.size(); ++i) {
                if (i > 0) {
                    joined += ", ";
                }
                joined += names[i];
            }
            return joined;
        }

    }

    UmaFailure UmaFailure::MissingRequiredFields(std::vector<std::string> fields) {
        UmaFailure failure(
            ErrorCode::MissingRequiredUmaParameters,
            compat::format("Missing required UMA parameters: {}", JoinNames(fields)));
        failure.missing_fields = std::move(fields);
        return failure;
    }

    UmaFailure UmaFailure::UnsupportedVersion(std::string version, std::vector<int> supported_majors) {
        UmaFailure failure(
            ErrorCode::UnsupportedUmaVersion,
            compat::format("Unsupported version: {}.", version));
        failure.unsupported_version = std::move(version);
        failure.supported_major_versions = std::move(supported_majors);
        return failure;
    }

    UmaFailure UmaFailure::NonceReused() {
        UmaFailure failure(ErrorCode::InvalidNonce, std::string(ErrorMessages::NONCE_ALREADY_USED));
        failure.replay_failure = ReplayFailureKind::NonceReused;
        return failure;
    }

    UmaFailure UmaFailure::TimestampTooOld() {
        UmaFailure failure(ErrorCode::InvalidNonce, std::string(ErrorMessages::TIMESTAMP_TOO_OLD));
        failure.replay_failure = ReplayFailureKind::TimestampTooOld;
        return failure;
    }

    UmaFailure UmaFailure::InvoiceChecksum(std::string msg) {
        UmaFailure failure(ErrorCode::InvalidInvoice, std::move(msg));
        failure.codec_failure = CodecFailureKind::Checksum;
        return failure;
    }

    UmaFailure UmaFailure::InvoiceStructure(std::string msg) {
        UmaFailure failure(ErrorCode::InvalidInvoice, std::move(msg));
        failure.codec_failure = CodecFailureKind::Structure;
        return failure;
    }

    UmaFailure UmaFailure::InvoiceMissingFields(std::vector<std::string> fields) {
        UmaFailure failure(
            ErrorCode::InvalidInvoice,
            compat::format("missing required fields: [{}]", JoinNames(fields)));
        failure.codec_failure = CodecFailureKind::MissingField;
        failure.missing_fields = std::move(fields);
        return failure;
    }

    Result<std::string, UmaFailure> UmaFailure::ToJson() const {
        using utilities::Json;
        utilities::JsonObject body;
        Json::SetString(body, "status", "ERROR");
        Json::SetString(body, "reason", message);
        Json::SetString(body, "code", CodeName());
        if (code == ErrorCode::UnsupportedUmaVersion) {
            Json::SetIntList(body, "supportedMajorVersions", supported_major_versions);
            if (unsupported_version.has_value()) {
                Json::SetString(body, "unsupportedVersion", *unsupported_version);
            }
        }
        return Json::Serialize(body);
    }

}
