#include <catch2/catch_test_macros.hpp>
#include "tallow/configuration/transfer_config.hpp"
#include "tallow/core/constants.hpp"

using namespace tallow::transfer;
using namespace tallow::transfer::configuration;
using namespace std::chrono_literals;

TEST_CASE("TransferConfig - Defaults are valid", "[config]") {
    SECTION("Default") {
        const auto config = TransferConfig::Default();
        REQUIRE(config.Validate().IsOk());
        REQUIRE(config.ChunkSize() == kChunkSize64K);
        REQUIRE(config.AutoResume());
        REQUIRE(config.ResumeTimeout() == 30000ms);
        REQUIRE(config.MaxResumeAttempts() == 3);
        REQUIRE(config.CleanupAfterDays() == 7);
    }
}

TEST_CASE("TransferConfig - Chunk size must come from the allowed set", "[config]") {
    for (const uint32_t allowed : kAllowedChunkSizes) {
        REQUIRE(TransferConfig::IsAllowedChunkSize(allowed));
        auto config = TransferConfig::Default();
        REQUIRE(config.WithChunkSize(allowed).Validate().IsOk());
    }
    for (const uint32_t rejected : {0u, 1024u, 48u * 1024u, 512u * 1024u}) {
        REQUIRE_FALSE(TransferConfig::IsAllowedChunkSize(rejected));
        auto config = TransferConfig::Default();
        auto result = config.WithChunkSize(rejected).Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
}

TEST_CASE("TransferConfig - Range checks", "[config]") {
    auto config = TransferConfig::Default();

    SECTION("Zero resume attempts") {
        REQUIRE(config.WithMaxResumeAttempts(0).Validate().IsErr());
    }

    SECTION("Non-positive resume timeout") {
        REQUIRE(config.WithResumeTimeout(0ms).Validate().IsErr());
    }

    SECTION("Zero retention") {
        REQUIRE(config.WithCleanupAfterDays(0).Validate().IsErr());
    }

    SECTION("Receive window narrower than the in-flight window") {
        REQUIRE(config.WithMaxInFlightChunks(32).WithReceiveWindow(16).Validate().IsErr());
    }

    SECTION("Rekey interval not longer than the in-flight window") {
        REQUIRE(config.WithMaxInFlightChunks(16).WithRekeyAfterChunks(16).Validate().IsErr());
        REQUIRE(config.WithRekeyAfterChunks(17).Validate().IsOk());
    }

    SECTION("Worker thread bounds") {
        REQUIRE(config.WithWorkerThreads(0).Validate().IsErr());
        REQUIRE(config.WithWorkerThreads(65).Validate().IsErr());
        REQUIRE(config.WithWorkerThreads(8).Validate().IsOk());
    }
}

TEST_CASE("TransferConfig - Exponential resume backoff", "[config]") {
    auto config = TransferConfig::Default();
    config.WithResumeBackoffBase(100ms);

    REQUIRE(config.BackoffBeforeAttempt(1) == 0ms);
    REQUIRE(config.BackoffBeforeAttempt(2) == 100ms);
    REQUIRE(config.BackoffBeforeAttempt(3) == 200ms);
    REQUIRE(config.BackoffBeforeAttempt(4) == 400ms);
    REQUIRE(config.BackoffBeforeAttempt(100) > config.BackoffBeforeAttempt(4));
}
