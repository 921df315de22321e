#pragma once

#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include "uma/utilities/json_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uma::protocol {

enum class TransactionStatus : uint8_t {
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view TransactionStatusToString(const TransactionStatus status) noexcept {
    return status == TransactionStatus::Completed ? "COMPLETED" : "FAILED";
}

[[nodiscard]] constexpr std::optional<TransactionStatus> TransactionStatusFromString(
    const std::string_view value) noexcept {
    if (value == "COMPLETED") {
        return TransactionStatus::Completed;
    }
    if (value == "FAILED") {
        return TransactionStatus::Failed;
    }
    return std::nullopt;
}

struct UtxoWithAmount {
    std::string utxo;
    int64_t amount_msats = 0;

    bool operator==(const UtxoWithAmount&) const = default;
};

/// Sent to the counterparty's utxoCallback once the payment settles.
struct PostTransactionCallback {
    std::vector<UtxoWithAmount> utxos;
    std::string vasp_domain;
    std::string signature;
    std::string signature_nonce;
    int64_t signature_timestamp = 0;

    bool operator==(const PostTransactionCallback&) const = default;

    /// nonce|timestamp
    [[nodiscard]] std::string SignablePayload() const;
    [[nodiscard]] PostTransactionCallback SignedWith(std::string new_signature) const;

    [[nodiscard]] utilities::JsonObject ToJsonObject() const;
    [[nodiscard]] Result<std::string, UmaFailure> ToJson() const;
    [[nodiscard]] static Result<PostTransactionCallback, UmaFailure> FromJson(std::string_view json);
};

} // namespace uma::protocol
