#pragma once
#include "uma/interfaces/i_invoice_creator.hpp"
#include "uma/interfaces/i_uma_requester.hpp"
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace uma::protocol::test_helpers {

using interfaces::IInvoiceCreator;
using interfaces::IUmaRequester;

class MockUmaRequester : public IUmaRequester {
public:
    void SetResponse(std::string url, std::string body) {
        std::lock_guard guard(lock_);
        responses_[std::move(url)] = std::move(body);
    }

    [[nodiscard]] Result<std::string, UmaFailure> MakeGetRequest(const std::string_view url) override {
        std::lock_guard guard(lock_);
        ++request_count_;
        const auto it = responses_.find(std::string(url));
        if (it == responses_.end()) {
            return Result<std::string, UmaFailure>::Err(
                UmaFailure::PubKeyFetch("Mock requester: no response for " + std::string(url)));
        }
        return Result<std::string, UmaFailure>::Ok(it->second);
    }

    [[nodiscard]] size_t RequestCount() const {
        std::lock_guard guard(lock_);
        return request_count_;
    }

private:
    mutable std::mutex lock_;
    std::map<std::string, std::string> responses_;
    size_t request_count_ = 0;
};

/// Records the last invoice request and hands back a fixed invoice string.
class MockInvoiceCreator : public IInvoiceCreator {
public:
    [[nodiscard]] Result<std::string, UmaFailure> CreateUmaInvoice(
        const int64_t amount_msats,
        const std::string_view metadata,
        const std::optional<std::string>& receiver_identifier) override {
        last_amount_msats = amount_msats;
        last_metadata = std::string(metadata);
        last_receiver_identifier = receiver_identifier;
        return Result<std::string, UmaFailure>::Ok("lntb100n1p0abcdef");
    }

    int64_t last_amount_msats = 0;
    std::string last_metadata;
    std::optional<std::string> last_receiver_identifier;
};

} // namespace uma::protocol::test_helpers
