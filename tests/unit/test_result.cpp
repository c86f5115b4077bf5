#include <catch2/catch_test_macros.hpp>
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include <memory>
#include <string>

using namespace gambit;

TEST_CASE("Result - Ok and Err", "[result][core]") {
    SECTION("Ok holds the value") {
        auto result = Result<int, std::string>::Ok(7);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 7);
    }
    SECTION("Err holds the error") {
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::IllegalMove("e5 is not legal"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::IllegalMove);
        REQUIRE(result.UnwrapErr().message == "e5 is not legal");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("bad");
        REQUIRE_THROWS(result.Unwrap());
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE_THROWS(result.UnwrapErr());
    }
}

TEST_CASE("Result - Combinators", "[result][core]") {
    SECTION("Map only touches Ok") {
        auto doubled = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(doubled.Unwrap() == 42);

        auto untouched = Result<int, std::string>::Err("no").Map([](int x) { return x * 2; });
        REQUIRE(untouched.UnwrapErr() == "no");
    }
    SECTION("MapErr converts the error type") {
        auto mapped = Result<int, std::string>::Err("decode").MapErr([](std::string message) {
            return ProtocolFailure::Decode(std::move(message));
        });
        REQUIRE(mapped.UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Bind short-circuits on the first error") {
        int calls = 0;
        auto step = [&calls](int x) {
            ++calls;
            return x > 0 ? Result<int, std::string>::Ok(x - 1) : Result<int, std::string>::Err("exhausted");
        };
        auto result = Result<int, std::string>::Ok(1).Bind(step).Bind(step).Bind(step);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "exhausted");
        REQUIRE(calls == 2);
    }
    SECTION("UnwrapOr falls back on Err") {
        REQUIRE(Result<int, std::string>::Err("x").UnwrapOr(3) == 3);
        REQUIRE(Result<int, std::string>::Ok(4).UnwrapOr(3) == 4);
    }
    SECTION("Move-only values") {
        auto owned = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(9));
        std::unique_ptr<int> taken = std::move(owned).Unwrap();
        REQUIRE(*taken == 9);
    }
}

TEST_CASE("ProtocolFailure - Category names", "[result][core]") {
    REQUIRE(ToString(ProtocolFailureType::ReplayAttack) == "ReplayAttack");
    REQUIRE(ToString(ProtocolFailureType::EncryptionUnavailable) == "EncryptionUnavailable");
    REQUIRE(ToString(ProtocolFailureType::Teardown) == "Teardown");
    REQUIRE(ProtocolFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom")).type ==
            ProtocolFailureType::Generic);
}
