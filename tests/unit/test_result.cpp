#include <catch2/catch_test_macros.hpp>
#include "uma/core/result.hpp"
#include "uma/core/failures.hpp"
#include <string>
using namespace uma::protocol;

namespace {

Result<int, UmaFailure> ParsePositive(const int value) {
    if (value <= 0) {
        return Result<int, UmaFailure>::Err(UmaFailure::InvalidInput("not positive"));
    }
    return Result<int, UmaFailure>::Ok(value);
}

Result<int, UmaFailure> DoublePositive(const int value) {
    UMA_TRY_ASSIGN(const int parsed, ParsePositive(value));
    return Result<int, UmaFailure>::Ok(parsed * 2);
}

Result<Unit, UmaFailure> RequirePositive(const int value) {
    UMA_TRY(ParsePositive(value));
    return Result<Unit, UmaFailure>::Ok(unit);
}

} // namespace

TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS(result.Unwrap());
    }
    SECTION("IsErrAnd inspects the error") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErrAnd([](const std::string& e) { return e == "error"; }));
    }
}

TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto mapped = Result<int, std::string>::Err("error").MapErr([](std::string s) { return s + "!"; });
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind short-circuits on Err") {
        auto bound = Result<int, UmaFailure>::Ok(-1).Bind(ParsePositive);
        REQUIRE(bound.IsErr());
        REQUIRE(bound.UnwrapErr().code == ErrorCode::InvalidInput);
    }
    SECTION("UnwrapOr returns default on Err") {
        REQUIRE(Result<int, std::string>::Err("error").UnwrapOr(7) == 7);
    }
}

TEST_CASE("Result<T, E> - Propagation macros", "[result][core]") {
    SECTION("UMA_TRY_ASSIGN binds the Ok value") {
        auto result = DoublePositive(4);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 8);
    }
    SECTION("UMA_TRY_ASSIGN returns the callee's error") {
        auto result = DoublePositive(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "not positive");
    }
    SECTION("UMA_TRY propagates into a different Ok type") {
        REQUIRE(RequirePositive(3).IsOk());
        REQUIRE(RequirePositive(-3).UnwrapErr().code == ErrorCode::InvalidInput);
    }
}
