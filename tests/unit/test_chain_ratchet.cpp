#include <catch2/catch_test_macros.hpp>
#include "tallow/ratchet/chain_ratchet.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <set>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::ratchet;

namespace {
    const std::vector<uint8_t> kChainKey(kChainKeyBytes, 0x5C);

    ChainRatchet MakeChain(uint64_t frontier = 0, uint64_t ceiling = 1000, uint32_t window = 8) {
        auto chain = ChainRatchet::Create(kChainKey, frontier, ceiling, window, 0);
        REQUIRE(chain.IsOk());
        return std::move(chain).Unwrap();
    }

    std::vector<uint8_t> KeyBytes(const MessageKey& key) {
        return {key.Bytes().begin(), key.Bytes().end()};
    }
}

TEST_CASE("ChainRatchet - Creation checks", "[ratchet]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> short_key(16, 0x01);
    REQUIRE(ChainRatchet::Create(short_key, 0, 10, 8, 0).IsErr());
    REQUIRE(ChainRatchet::Create(kChainKey, 0, 10, 0, 0).IsErr());
    REQUIRE(ChainRatchet::Create(kChainKey, 11, 10, 8, 0).IsErr());
}

TEST_CASE("ChainRatchet - Derivation within the window", "[ratchet]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto chain = MakeChain();

    SECTION("Repeated derivation of a retained index yields the same key") {
        auto first = chain.Derive(3);
        auto second = chain.Derive(3);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(KeyBytes(first.Unwrap()) == KeyBytes(second.Unwrap()));
        REQUIRE(chain.DerivationCount() == 4);
    }

    SECTION("Out of order indices are served from the cache") {
        auto late = chain.Derive(5);
        auto early = chain.Derive(2);
        REQUIRE(late.IsOk());
        REQUIRE(early.IsOk());
        REQUIRE(KeyBytes(late.Unwrap()) != KeyBytes(early.Unwrap()));
        REQUIRE(chain.CachedKeys() == 6);
        REQUIRE(chain.Head() == 6);
    }

    SECTION("Indices past the window are refused") {
        auto result = chain.Derive(8);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }

    SECTION("Ceiling reports exhaustion") {
        auto bounded = MakeChain(0, 4, 8);
        auto result = bounded.Derive(4);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::RatchetExhausted);
    }
}

TEST_CASE("ChainRatchet - Released keys are gone", "[ratchet][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto chain = MakeChain();
    REQUIRE(chain.Derive(0).IsOk());
    REQUIRE(chain.Derive(1).IsOk());
    REQUIRE(chain.Derive(2).IsOk());

    SECTION("Release at the frontier advances it") {
        REQUIRE(chain.Release(0).IsOk());
        REQUIRE(chain.Frontier() == 1);
        auto replay = chain.Derive(0);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().type == TransferFailureType::ReplayAttack);
    }

    SECTION("Release ahead of the frontier waits for the gap") {
        REQUIRE(chain.Release(2).IsOk());
        REQUIRE(chain.Frontier() == 0);
        REQUIRE(chain.Derive(2).IsErr());
        REQUIRE(chain.Release(1).IsOk());
        REQUIRE(chain.Release(0).IsOk());
        REQUIRE(chain.Frontier() == 3);
        REQUIRE(chain.CachedKeys() == 0);
    }

    SECTION("Releasing the same index twice is harmless") {
        REQUIRE(chain.Release(0).IsOk());
        REQUIRE(chain.Release(0).IsOk());
        REQUIRE(chain.Frontier() == 1);
    }

    SECTION("Window slides with the frontier") {
        REQUIRE(chain.Derive(8).IsErr());
        REQUIRE(chain.Release(0).IsOk());
        REQUIRE(chain.Derive(8).IsOk());
    }
}

TEST_CASE("ChainRatchet - Every chunk gets a distinct key", "[ratchet][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    constexpr uint64_t kChunks = 10000;
    auto chain = MakeChain(0, kChunks, 16);

    std::set<std::vector<uint8_t>> seen;
    for (uint64_t index = 0; index < kChunks; ++index) {
        auto key = chain.Derive(index);
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap().Index() == index);
        REQUIRE(seen.insert(KeyBytes(key.Unwrap())).second);
        REQUIRE(chain.Release(index).IsOk());
    }
    REQUIRE(seen.size() == kChunks);
    REQUIRE(chain.DerivationCount() == kChunks);
    REQUIRE(chain.CachedKeys() == 0);
}

TEST_CASE("ChainRatchet - Frontier chain key restores the chain", "[ratchet]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto original = MakeChain();
    for (uint64_t index = 0; index < 5; ++index) {
        REQUIRE(original.Derive(index).IsOk());
    }
    for (uint64_t index = 0; index < 3; ++index) {
        REQUIRE(original.Release(index).IsOk());
    }
    auto frontier_key = original.FrontierChainKey();
    REQUIRE(frontier_key.IsOk());

    auto restored = ChainRatchet::Create(frontier_key.Unwrap(), original.Frontier(), 1000, 8, 0);
    REQUIRE(restored.IsOk());
    auto chain = std::move(restored).Unwrap();
    for (uint64_t index = 3; index < 7; ++index) {
        auto expected = original.Derive(index);
        auto actual = chain.Derive(index);
        REQUIRE(expected.IsOk());
        REQUIRE(actual.IsOk());
        REQUIRE(KeyBytes(expected.Unwrap()) == KeyBytes(actual.Unwrap()));
    }
}
