#pragma once

#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <cstdint>
#include <span>

namespace tallow::transfer::crypto {

using Sha256Digest = std::array<uint8_t, kSha256Bytes>;
using StoreDigest = std::array<uint8_t, kStoreDigestBytes>;

/// libsodium hash primitives: SHA-256 for content, BLAKE2b for record
/// integrity, HMAC-SHA256 for key confirmation.
class Digest {
public:
    [[nodiscard]] static Sha256Digest Sha256(std::span<const uint8_t> data) noexcept;

    /// Keyed when key is non-empty (16..64 bytes); unkeyed otherwise.
    [[nodiscard]] static Result<StoreDigest, TransferFailure> Blake2b(
        std::span<const uint8_t> data,
        std::span<const uint8_t> key = {});

    [[nodiscard]] static Result<std::array<uint8_t, kHmacBytes>, TransferFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

private:
    Digest() = delete;
};

/// Incremental SHA-256 for whole-file hashes.
class Sha256Stream {
public:
    Sha256Stream() noexcept;
    void Update(std::span<const uint8_t> data) noexcept;
    [[nodiscard]] Sha256Digest Finish() noexcept;

private:
    crypto_hash_sha256_state state_{};
};

}
