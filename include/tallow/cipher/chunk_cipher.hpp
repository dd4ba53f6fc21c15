#pragma once

#include "tallow/core/constants.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/crypto/digest.hpp"
#include "tallow/ratchet/message_key.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <span>
#include <vector>

namespace tallow::transfer::cipher {

using Nonce = std::array<uint8_t, kAesGcmNonceBytes>;
using Tag = std::array<uint8_t, kAesGcmTagBytes>;

struct SealedChunk {
    std::vector<uint8_t> ciphertext;
    Tag tag{};
};

struct OpenedChunk {
    std::vector<uint8_t> plaintext;
    crypto::Sha256Digest plaintext_hash{};
};

/**
 * @brief AES-256-GCM sealing of one chunk under its message key
 *
 * Sealed plaintext: sha256(chunk) || chunk
 * Nonce:            0x00000000 || big-endian u64 index
 * AAD:              "tallow-chunk-v1" || transfer_id || u32 index || u32 epoch
 *
 * Each message key seals exactly one chunk, so the index-derived nonce is
 * unique per key. The embedded hash is checked after the tag, so a decryptor
 * fault that still passes GCM is caught as an Integrity failure.
 */
class ChunkCipher {
public:
    static Result<SealedChunk, TransferFailure> Encrypt(
        const ratchet::MessageKey& key,
        std::span<const uint8_t> transfer_id,
        uint32_t index,
        std::span<const uint8_t> plaintext);

    /**
     * Errors:
     * - Authentication: tag mismatch (tampering or wrong key)
     * - Integrity: tag valid but the embedded hash does not match
     * - InvalidInput: key/index mismatch or malformed sizes
     */
    static Result<OpenedChunk, TransferFailure> Decrypt(
        const ratchet::MessageKey& key,
        std::span<const uint8_t> transfer_id,
        uint32_t index,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag);

    [[nodiscard]] static Nonce NonceFor(uint64_t index) noexcept;

    [[nodiscard]] static std::vector<uint8_t> BuildAad(
        std::span<const uint8_t> transfer_id,
        uint32_t index,
        uint32_t epoch);

private:
    ChunkCipher() = delete;
};

/// Consecutive Authentication/Integrity failures per chunk index.
class ChunkFailureTracker {
public:
    explicit ChunkFailureTracker(uint32_t limit = kMaxConsecutiveChunkFailures) noexcept
        : limit_(limit) {}

    /// Returns the failure count for index after this one.
    uint32_t RecordFailure(uint32_t index);

    void RecordSuccess(uint32_t index);

    [[nodiscard]] bool LimitReached(uint32_t index) const noexcept;

    [[nodiscard]] uint32_t FailuresFor(uint32_t index) const noexcept;

    void Reset() noexcept { failures_.clear(); }

private:
    uint32_t limit_;
    std::map<uint32_t, uint32_t> failures_;
};

}
