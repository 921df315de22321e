#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace uma::protocol::interfaces {

/// Produces the encoded Lightning invoice returned in a pay response.
class IInvoiceCreator {
public:
    virtual ~IInvoiceCreator() = default;

    [[nodiscard]] virtual Result<std::string, UmaFailure> CreateUmaInvoice(
        int64_t amount_msats,
        std::string_view metadata,
        const std::optional<std::string>& receiver_identifier) = 0;
};

}
