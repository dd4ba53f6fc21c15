#include <catch2/catch_test_macros.hpp>
#include "tallow/crypto/hkdf.hpp"
#include "tallow/core/constants.hpp"
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::crypto;

namespace {
    // RFC 5869, test case 1
    const std::vector<uint8_t> kIkm(22, 0x0b);
    const std::vector<uint8_t> kSalt = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c};
    const std::vector<uint8_t> kInfo = {0xf0, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7, 0xf8, 0xf9};
    const std::vector<uint8_t> kPrk = {
        0x07, 0x77, 0x09, 0x36, 0x2c, 0x2e, 0x32, 0xdf, 0x0d, 0xdc, 0x3f, 0x0d, 0xc4, 0x7b, 0xba, 0x63,
        0x90, 0xb6, 0xc7, 0x3b, 0xb5, 0x0f, 0x9c, 0x31, 0x22, 0xec, 0x84, 0x4a, 0xd7, 0xc2, 0xb3, 0xe5};
    const std::vector<uint8_t> kOkm = {
        0x3c, 0xb2, 0x5f, 0x25, 0xfa, 0xac, 0xd5, 0x7a, 0x90, 0x43, 0x4f, 0x64, 0xd0, 0x36, 0x2f, 0x2a,
        0x2d, 0x2d, 0x0a, 0x90, 0xcf, 0x1a, 0x5a, 0x4c, 0x5d, 0xb0, 0x2d, 0x56, 0xec, 0xc4, 0xc5, 0xbf,
        0x34, 0x00, 0x72, 0x08, 0xd5, 0xb8, 0x87, 0x18, 0x58, 0x65};
}

TEST_CASE("Hkdf - RFC 5869 vector", "[hkdf]") {
    SECTION("Extract and expand in one call") {
        auto okm = Hkdf::DeriveKeyBytes(kIkm, kOkm.size(), kSalt, kInfo);
        REQUIRE(okm.IsOk());
        REQUIRE(okm.Unwrap() == kOkm);
    }

    SECTION("Extract then expand") {
        auto prk = Hkdf::Extract(kIkm, kSalt);
        REQUIRE(prk.IsOk());
        REQUIRE(prk.Unwrap() == kPrk);

        std::vector<uint8_t> okm(kOkm.size());
        REQUIRE(Hkdf::Expand(prk.Unwrap(), okm, kInfo).IsOk());
        REQUIRE(okm == kOkm);
    }
}

TEST_CASE("Hkdf - Domain separation by label", "[hkdf]") {
    const std::vector<uint8_t> chain_key(kChainKeyBytes, 0x31);

    auto message_key = Hkdf::DeriveLabeled(chain_key, kMessageKeyBytes, {}, kMessageInfo);
    auto next_chain_key = Hkdf::DeriveLabeled(chain_key, kChainKeyBytes, {}, kChainInfo);
    REQUIRE(message_key.IsOk());
    REQUIRE(next_chain_key.IsOk());
    REQUIRE(message_key.Unwrap() != next_chain_key.Unwrap());

    auto again = Hkdf::DeriveLabeled(chain_key, kMessageKeyBytes, {}, kMessageInfo);
    REQUIRE(again.IsOk());
    REQUIRE(again.Unwrap() == message_key.Unwrap());
}

TEST_CASE("Hkdf - Input validation", "[hkdf]") {
    SECTION("Empty input key material") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }

    SECTION("Output longer than 255 blocks") {
        auto result = Hkdf::DeriveKeyBytes(kIkm, Hkdf::kMaxOutputBytes + 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }

    SECTION("Expand with a short PRK") {
        std::vector<uint8_t> output(32);
        const std::vector<uint8_t> short_prk(16, 0x01);
        REQUIRE(Hkdf::Expand(short_prk, output).IsErr());
    }
}
