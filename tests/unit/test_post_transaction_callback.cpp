#include <catch2/catch_test_macros.hpp>
#include "uma/protocol/post_transaction_callback.hpp"
using namespace uma::protocol;

TEST_CASE("PostTransactionCallback - JSON", "[post_tx][protocol]") {
    PostTransactionCallback callback;
    callback.utxos = {UtxoWithAmount{"abcd:0", 1000}, UtxoWithAmount{"ef01:1", 2500}};
    callback.vasp_domain = "vasp2.com";
    callback.signature = "3045";
    callback.signature_nonce = "888";
    callback.signature_timestamp = 1700000200;

    SECTION("Round trip") {
        const auto json = callback.ToJson().Unwrap();
        REQUIRE(json.find(R"("amountMsats":2500)") != std::string::npos);
        REQUIRE(PostTransactionCallback::FromJson(json).Unwrap() == callback);
    }

    SECTION("Payload is nonce and timestamp") {
        REQUIRE(callback.SignablePayload() == "888|1700000200");
        REQUIRE(callback.SignedWith("3046").signature == "3046");
    }

    SECTION("Missing fields report a callback parse error") {
        auto result = PostTransactionCallback::FromJson(R"({"utxos":[],"vaspDomain":"vasp2.com"})");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == ErrorCode::ParseUtxoCallbackError);
    }
}

TEST_CASE("TransactionStatus - Names", "[post_tx][protocol]") {
    REQUIRE(TransactionStatusToString(TransactionStatus::Completed) == "COMPLETED");
    REQUIRE(TransactionStatusFromString("FAILED") == TransactionStatus::Failed);
    REQUIRE_FALSE(TransactionStatusFromString("PENDING").has_value());
}
