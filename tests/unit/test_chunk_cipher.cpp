#include <catch2/catch_test_macros.hpp>
#include "tallow/cipher/chunk_cipher.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <algorithm>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::cipher;
using ratchet::MessageKey;

namespace {
    const std::vector<uint8_t> kTransferId(kTransferIdBytes, 0x3D);
    const std::vector<uint8_t> kKeyBytes(kMessageKeyBytes, 0x9E);

    std::vector<uint8_t> Payload(size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>(i * 31 + 7);
        }
        return data;
    }
}

TEST_CASE("ChunkCipher - Nonce and AAD layout", "[cipher]") {
    const auto nonce = ChunkCipher::NonceFor(0x0102030405060708ull);
    const Nonce expected = {0, 0, 0, 0, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    REQUIRE(nonce == expected);
    REQUIRE(ChunkCipher::NonceFor(1) != ChunkCipher::NonceFor(2));

    const auto aad = ChunkCipher::BuildAad(kTransferId, 5, 2);
    REQUIRE(aad.size() == kChunkAadLabel.size() + kTransferIdBytes + 8);
    REQUIRE(std::equal(kChunkAadLabel.begin(), kChunkAadLabel.end(), aad.begin()));
    REQUIRE(aad[aad.size() - 5] == 5);
    REQUIRE(aad.back() == 2);
}

TEST_CASE("ChunkCipher - Encrypt and decrypt", "[cipher]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const MessageKey key(12, 0, kKeyBytes);
    const auto plaintext = Payload(kChunkSize16K + 3);

    auto sealed = ChunkCipher::Encrypt(key, kTransferId, 12, plaintext);
    REQUIRE(sealed.IsOk());
    REQUIRE(sealed.Unwrap().ciphertext.size() == kSha256Bytes + plaintext.size());

    auto opened = ChunkCipher::Decrypt(key, kTransferId, 12, sealed.Unwrap().ciphertext, sealed.Unwrap().tag);
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap().plaintext == plaintext);
    REQUIRE(opened.Unwrap().plaintext_hash == crypto::Digest::Sha256(plaintext));
}

TEST_CASE("ChunkCipher - Rejections", "[cipher][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const MessageKey key(4, 1, kKeyBytes);
    const auto plaintext = Payload(1000);
    auto sealed = ChunkCipher::Encrypt(key, kTransferId, 4, plaintext).Unwrap();

    SECTION("Flipped ciphertext byte") {
        sealed.ciphertext[500] ^= 0x10;
        auto opened = ChunkCipher::Decrypt(key, kTransferId, 4, sealed.ciphertext, sealed.tag);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Flipped tag byte") {
        sealed.tag[0] ^= 0x01;
        auto opened = ChunkCipher::Decrypt(key, kTransferId, 4, sealed.ciphertext, sealed.tag);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Chunk moved to another index") {
        const MessageKey other(5, 1, kKeyBytes);
        auto opened = ChunkCipher::Decrypt(other, kTransferId, 5, sealed.ciphertext, sealed.tag);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Chunk replayed into another epoch") {
        const MessageKey next_epoch(4, 2, kKeyBytes);
        auto opened = ChunkCipher::Decrypt(next_epoch, kTransferId, 4, sealed.ciphertext, sealed.tag);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Chunk from another transfer") {
        const std::vector<uint8_t> other_id(kTransferIdBytes, 0x3E);
        auto opened = ChunkCipher::Decrypt(key, other_id, 4, sealed.ciphertext, sealed.tag);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }

    SECTION("Key for a different index") {
        auto opened = ChunkCipher::Decrypt(key, kTransferId, 7, sealed.ciphertext, sealed.tag);
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::InvalidInput);
    }

    SECTION("Truncated tag") {
        auto opened = ChunkCipher::Decrypt(key, kTransferId, 4, sealed.ciphertext,
                                           std::span<const uint8_t>(sealed.tag.data(), 8));
        REQUIRE(opened.UnwrapErr().type == TransferFailureType::Authentication);
    }
}

TEST_CASE("ChunkFailureTracker - Counts consecutive failures per chunk", "[cipher]") {
    ChunkFailureTracker tracker;
    REQUIRE(tracker.RecordFailure(9) == 1);
    REQUIRE(tracker.RecordFailure(9) == 2);
    REQUIRE_FALSE(tracker.LimitReached(9));
    REQUIRE(tracker.FailuresFor(3) == 0);

    SECTION("A success clears the count") {
        tracker.RecordSuccess(9);
        REQUIRE(tracker.FailuresFor(9) == 0);
        REQUIRE(tracker.RecordFailure(9) == 1);
    }

    SECTION("Third failure reaches the limit") {
        REQUIRE(tracker.RecordFailure(9) == kMaxConsecutiveChunkFailures);
        REQUIRE(tracker.LimitReached(9));
        REQUIRE_FALSE(tracker.LimitReached(10));
        tracker.Reset();
        REQUIRE_FALSE(tracker.LimitReached(9));
    }
}
