#include <catch2/catch_test_macros.hpp>
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include <memory>
#include <string>
using namespace signet::protocol;
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
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("Move-only values") {
        auto result = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
        auto owned = std::move(result).Unwrap();
        REQUIRE(*owned == 7);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind short-circuits on Err") {
        auto result = Result<int, std::string>::Err("first");
        bool called = false;
        auto bound = std::move(result).Bind([&called](int x) {
            called = true;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE_FALSE(called);
        REQUIRE(bound.UnwrapErr() == "first");
    }
    SECTION("IsErrAnd inspects the error") {
        auto result = Result<int, HandleFailure>::Err(HandleFailure::InvalidState("gone"));
        REQUIRE(result.IsErrAnd([](const HandleFailure& f) { return f.IsInvalidState(); }));
    }
}
TEST_CASE("Result<T, E> - Error propagation", "[result][core]") {
    SECTION("PropagateErr carries the error into another value type") {
        auto result = Result<int, HandleFailure>::Err(
            HandleFailure::NativeOperation(6, "Decode: bad bytes"));
        auto propagated = std::move(result).PropagateErr<std::string>();
        REQUIRE(propagated.IsErr());
        REQUIRE(propagated.UnwrapErr().native_code == 6);
        REQUIRE(propagated.UnwrapErr().message == "Decode: bad bytes");
    }
    SECTION("Err() extracts an optional error") {
        auto ok = Result<int, std::string>::Ok(1);
        REQUIRE_FALSE(std::move(ok).Err().has_value());
        auto err = Result<int, std::string>::Err("boom");
        REQUIRE(std::move(err).Err() == std::optional<std::string>("boom"));
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
}
TEST_CASE("HandleFailure - classification", "[result][core]") {
    SECTION("Deserialization is a native operation failure") {
        const auto failure = HandleFailure::Deserialization(6, "bad");
        REQUIRE(failure.IsNativeOperation());
        REQUIRE(failure.IsDeserialization());
        REQUIRE_FALSE(failure.IsInvalidState());
    }
    SECTION("Native operation failure is not a deserialization failure") {
        const auto failure = HandleFailure::NativeOperation(5, "mismatch");
        REQUIRE(failure.IsNativeOperation());
        REQUIRE_FALSE(failure.IsDeserialization());
    }
    SECTION("Invalid state carries no native code") {
        const auto failure = HandleFailure::InvalidState("destroyed");
        REQUIRE(failure.IsInvalidState());
        REQUIRE_FALSE(failure.IsNativeOperation());
        REQUIRE(failure.native_code == 0);
    }
    SECTION("Allocation failures become out-of-memory protocol failures") {
        const auto failure = ProtocolFailure::FromSodiumFailure(
            SodiumFailure::AllocationFailed("sodium_malloc"));
        REQUIRE(failure.type == ProtocolFailureType::OutOfMemory);
        const auto generic = ProtocolFailure::FromSodiumFailure(
            SodiumFailure::ReadOperationFailed("read"));
        REQUIRE(generic.type == ProtocolFailureType::Generic);
    }
}
