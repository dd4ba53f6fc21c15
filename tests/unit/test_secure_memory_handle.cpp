#include <catch2/catch_test_macros.hpp>
#include "tallow/crypto/secure_memory_handle.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <vector>
using namespace tallow::transfer;
using namespace tallow::transfer::crypto;

TEST_CASE("SecureMemoryHandle - Allocation", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocates a chain key sized region") {
        auto result = SecureMemoryHandle::Allocate(kChainKeyBytes);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == kChainKeyBytes);
    }
    SECTION("Zero size is rejected") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
}

TEST_CASE("SecureMemoryHandle - Move semantics", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kRootKeyBytes, 0x5A);
    auto original = SecureMemoryHandle::FromBytes(key).Unwrap();

    SECTION("Move construction leaves the source disposed") {
        SecureMemoryHandle moved(std::move(original));
        REQUIRE(original.IsInvalid());
        REQUIRE(original.Size() == 0);
        REQUIRE(moved.ReadBytes(kRootKeyBytes).Unwrap() == key);
    }
    SECTION("Move assignment releases the previous region") {
        auto target = SecureMemoryHandle::Allocate(8).Unwrap();
        target = std::move(original);
        REQUIRE(target.Size() == kRootKeyBytes);
        REQUIRE(target.ReadBytes(kRootKeyBytes).Unwrap() == key);
    }
    SECTION("Operations on a disposed handle fail") {
        SecureMemoryHandle moved(std::move(original));
        std::vector<uint8_t> out(kRootKeyBytes);
        REQUIRE(original.Read(out).IsErr());
        REQUIRE(original.Write(key).IsErr());
        REQUIRE(original.Clone().IsErr());
        REQUIRE(original.WithReadAccess([](std::span<const uint8_t>) { return 0; }).IsErr());
    }
}

TEST_CASE("SecureMemoryHandle - Read and write", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(kMessageKeyBytes).Unwrap();

    SECTION("Round trip") {
        const std::vector<uint8_t> data(kMessageKeyBytes, 0xC3);
        REQUIRE(handle.Write(data).IsOk());
        std::vector<uint8_t> out(kMessageKeyBytes);
        REQUIRE(handle.Read(out).IsOk());
        REQUIRE(out == data);
    }
    SECTION("Short write zero-fills the tail") {
        const std::vector<uint8_t> data(kMessageKeyBytes, 0xFF);
        REQUIRE(handle.Write(data).IsOk());
        const std::vector<uint8_t> prefix = {1, 2, 3};
        REQUIRE(handle.Write(prefix).IsOk());
        auto bytes = handle.ReadBytes(kMessageKeyBytes).Unwrap();
        REQUIRE(bytes[0] == 1);
        REQUIRE(bytes[2] == 3);
        for (size_t i = prefix.size(); i < bytes.size(); ++i) {
            REQUIRE(bytes[i] == 0);
        }
    }
    SECTION("Oversized write is rejected") {
        const std::vector<uint8_t> data(kMessageKeyBytes + 1, 0x01);
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Undersized output is rejected") {
        std::vector<uint8_t> out(kMessageKeyBytes - 1);
        REQUIRE(handle.Read(out).IsErr());
        REQUIRE(handle.ReadBytes(kMessageKeyBytes + 1).IsErr());
    }
    SECTION("WithWriteAccess mutates in place") {
        auto written = handle.WithWriteAccess([](std::span<uint8_t> span) {
            span[0] = 0x42;
            return span.size();
        });
        REQUIRE(written.Unwrap() == kMessageKeyBytes);
        REQUIRE(handle.ReadBytes(1).Unwrap()[0] == 0x42);
    }
}

TEST_CASE("SecureMemoryHandle - Clone is independent", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kChainKeyBytes, 0x11);
    auto handle = SecureMemoryHandle::FromBytes(key).Unwrap();
    auto copy = handle.Clone().Unwrap();

    REQUIRE(handle.Write(std::vector<uint8_t>(kChainKeyBytes, 0x22)).IsOk());
    REQUIRE(copy.ReadBytes(kChainKeyBytes).Unwrap() == key);
    REQUIRE(handle.ReadBytes(kChainKeyBytes).Unwrap() != key);
}
