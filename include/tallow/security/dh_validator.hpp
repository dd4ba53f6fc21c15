#pragma once
#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace tallow::transfer::security {

/// Rejects peer X25519 public keys that would make the key exchange
/// contribute no secret: wrong size, small-order points, and non-canonical
/// field encodings.
class DhValidator {
public:
    static Result<Unit, TransferFailure> ValidateX25519PublicKey(std::span<const uint8_t> public_key);

    static bool HasSmallOrder(std::span<const uint8_t> public_key);

    /// True when the little-endian value (high bit masked) is below 2^255 - 19.
    static bool IsCanonicalFieldElement(std::span<const uint8_t> public_key);

private:
    DhValidator() = delete;
};

}
