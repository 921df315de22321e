#pragma once
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <string>
#include <string_view>
namespace uma::protocol::interfaces {

/// Blocking HTTP GET used to fetch counterparty public keys.
class IUmaRequester {
public:
    virtual ~IUmaRequester() = default;

    [[nodiscard]] virtual Result<std::string, UmaFailure> MakeGetRequest(std::string_view url) = 0;
};

}
