#include <catch2/catch_test_macros.hpp>
#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"
#include <string>
using namespace tallow::transfer;

namespace {

    Result<int, TransferFailure> ParseChunkCount(const int value) {
        if (value <= 0) {
            return Result<int, TransferFailure>::Err(TransferFailure::InvalidInput("Chunk count must be positive"));
        }
        return Result<int, TransferFailure>::Ok(value);
    }

    Result<int, TransferFailure> DoubleCount(const int value) {
        TALLOW_TRY(ParseChunkCount(value));
        return Result<int, TransferFailure>::Ok(value * 2);
    }

    Result<Unit, TransferFailure> CheckWithSodium(const bool fail) {
        auto inner = fail
            ? Result<Unit, SodiumFailure>::Err(SodiumFailure::AllocationFailed("no memory"))
            : Result<Unit, SodiumFailure>::Ok(unit);
        TALLOW_TRY(std::move(inner).MapErr(TransferFailure::FromSodiumFailure));
        return Result<Unit, TransferFailure>::Ok(unit);
    }

}

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
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unwrap on the wrong side throws") {
        auto ok = Result<int, std::string>::Ok(1);
        auto err = Result<int, std::string>::Err("nope");
        REQUIRE_THROWS_AS(ok.UnwrapErr(), std::runtime_error);
        REQUIRE_THROWS_AS(err.Unwrap(), std::runtime_error);
    }
}

TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr converts sodium failures") {
        auto mapped = Result<int, SodiumFailure>::Err(SodiumFailure::AllocationFailed("oom"))
            .MapErr(TransferFailure::FromSodiumFailure);
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().message.find("oom") != std::string::npos);
    }
}

TEST_CASE("Result<T, E> - TALLOW_TRY propagation", "[result][core]") {
    REQUIRE(DoubleCount(4).Unwrap() == 8);
    REQUIRE(DoubleCount(-1).UnwrapErr().type == TransferFailureType::InvalidInput);
    REQUIRE(CheckWithSodium(false).IsOk());
    REQUIRE(CheckWithSodium(true).IsErr());
}

TEST_CASE("TransferFailure - Classification", "[result][core]") {
    REQUIRE(TransferFailure::Transport("link down").IsRecoverable());
    REQUIRE(TransferFailure::Storage("disk full").IsRecoverable());
    REQUIRE_FALSE(TransferFailure::Authentication("bad tag").IsRecoverable());
    REQUIRE(TransferFailure::Authentication("bad tag").IsChunkLocal());
    REQUIRE(TransferFailure::Integrity("hash").IsChunkLocal());
    REQUIRE_FALSE(TransferFailure::Cancelled("user").IsChunkLocal());
    REQUIRE(TransferFailure::NotFound("x").Describe().find("x") != std::string::npos);
}
