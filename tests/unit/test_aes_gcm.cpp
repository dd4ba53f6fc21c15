#include <catch2/catch_test_macros.hpp>
#include "tallow/crypto/aes_gcm.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <string_view>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::crypto;

namespace {
    std::vector<uint8_t> Bytes(std::string_view text) {
        return {text.begin(), text.end()};
    }
}

TEST_CASE("AesGcm - Seal and open", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0x4B);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x07);

    SECTION("Ciphertext carries a trailing tag") {
        const auto plaintext = Bytes("chunk payload");
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext, Bytes("aad"));
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);

        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap(), Bytes("aad"));
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }

    SECTION("Empty plaintext still authenticates") {
        auto sealed = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == kAesGcmTagBytes);
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }

    SECTION("A full 256 KiB chunk") {
        const std::vector<uint8_t> plaintext(kChunkSize256K, 0x5A);
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(sealed.IsOk());
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
}

TEST_CASE("AesGcm - Authentication failures", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0x21);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x42);
    const auto plaintext = Bytes("do not touch");
    auto sealed = AesGcm::Encrypt(key, nonce, plaintext, Bytes("header"));
    REQUIRE(sealed.IsOk());
    auto ciphertext = sealed.Unwrap();

    SECTION("Flipped ciphertext bit") {
        ciphertext[0] ^= 0x01;
        auto opened = AesGcm::Decrypt(key, nonce, ciphertext, Bytes("header"));
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Flipped tag bit") {
        ciphertext.back() ^= 0x80;
        auto opened = AesGcm::Decrypt(key, nonce, ciphertext, Bytes("header"));
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Different associated data") {
        auto opened = AesGcm::Decrypt(key, nonce, ciphertext, Bytes("other"));
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Different key") {
        const std::vector<uint8_t> other_key(kAesKeyBytes, 0x22);
        auto opened = AesGcm::Decrypt(other_key, nonce, ciphertext, Bytes("header"));
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }
}

TEST_CASE("AesGcm - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x01);
    const auto plaintext = Bytes("x");

    SECTION("Short key") {
        const std::vector<uint8_t> key(16, 0x01);
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == TransferFailureType::InvalidInput);
    }

    SECTION("Wrong nonce length") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        const std::vector<uint8_t> bad_nonce(8, 0x01);
        auto sealed = AesGcm::Encrypt(key, bad_nonce, plaintext);
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == TransferFailureType::InvalidInput);
    }

    SECTION("Ciphertext shorter than the tag") {
        const std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        const std::vector<uint8_t> truncated(kAesGcmTagBytes - 1, 0x00);
        auto opened = AesGcm::Decrypt(key, nonce, truncated);
        REQUIRE(opened.IsErr());
    }
}
