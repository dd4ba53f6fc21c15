#include <catch2/catch_test_macros.hpp>
#include "tallow/cipher/control_cipher.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <string_view>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::cipher;

namespace {
    const std::vector<uint8_t> kControlKey(kControlKeyBytes, 0x61);
    const std::vector<uint8_t> kTransferId(kTransferIdBytes, 0x0F);
    constexpr uint32_t kAckType = 5;
    constexpr uint32_t kControlType = 6;

    std::vector<uint8_t> Bytes(std::string_view text) {
        return {text.begin(), text.end()};
    }
}

TEST_CASE("ControlCipher - Sealed frames open under the same key", "[cipher]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto body = Bytes("pause");
    auto sealed = ControlCipher::Seal(kControlKey, kTransferId, kControlType, 3, body);
    REQUIRE(sealed.IsOk());
    REQUIRE(sealed.Unwrap().epoch == 3);
    REQUIRE(sealed.Unwrap().ciphertext.size() == body.size() + kAesGcmTagBytes);

    auto opened = ControlCipher::Open(kControlKey, kTransferId, kControlType, sealed.Unwrap());
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == body);

    auto again = ControlCipher::Seal(kControlKey, kTransferId, kControlType, 3, body);
    REQUIRE(again.Unwrap().nonce != sealed.Unwrap().nonce);
}

TEST_CASE("ControlCipher - Bindings are authenticated", "[cipher][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sealed = ControlCipher::Seal(kControlKey, kTransferId, kAckType, 0, Bytes("ack 1..7")).Unwrap();

    SECTION("Replayed as another frame type") {
        auto opened = ControlCipher::Open(kControlKey, kTransferId, kControlType, sealed);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Claimed epoch changed") {
        sealed.epoch = 1;
        auto opened = ControlCipher::Open(kControlKey, kTransferId, kAckType, sealed);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Forged with a different key") {
        const std::vector<uint8_t> forged_key(kControlKeyBytes, 0x62);
        auto opened = ControlCipher::Open(forged_key, kTransferId, kAckType, sealed);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Truncated below the tag") {
        sealed.ciphertext.resize(kAesGcmTagBytes - 1);
        auto opened = ControlCipher::Open(kControlKey, kTransferId, kAckType, sealed);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }
}
