#include "tallow/security/dh_validator.hpp"
#include "tallow/core/constants.hpp"
#include <algorithm>
#include <format>

namespace tallow::transfer::security {

namespace {
    using Point = std::array<uint8_t, 32>;

    // Canonical encodings of the points of order 1, 2, 4 and 8 on Curve25519.
    constexpr std::array<Point, 5> kSmallOrderPoints = {{
        {0x00},
        {0x01},
        {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae, 0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
         0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd, 0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
        {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24, 0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
         0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86, 0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
        {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    }};

    // 2^255 - 19, little-endian.
    constexpr Point kFieldPrime = {
        0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f};

    bool ConstantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b) {
        if (a.size() != b.size()) {
            return false;
        }
        uint8_t diff = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<uint8_t>(a[i] ^ b[i]);
        }
        return diff == 0;
    }
}

Result<Unit, TransferFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Invalid X25519 public key size: expected {}, got {}",
                            kX25519PublicKeyBytes, public_key.size())));
    }
    if (HasSmallOrder(public_key)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("X25519 public key is a small-order point"));
    }
    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("X25519 public key is not a canonical field element"));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    if (public_key.size() != kFieldPrime.size()) {
        return false;
    }
    // X25519 ignores the top bit, so compare with it cleared.
    Point masked{};
    std::copy(public_key.begin(), public_key.end(), masked.begin());
    masked.back() &= 0x7f;
    bool found = false;
    for (const auto& point : kSmallOrderPoints) {
        found |= ConstantTimeEquals(masked, point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    if (public_key.size() != kFieldPrime.size()) {
        return false;
    }
    // Compare from the most significant byte down.
    for (size_t i = kFieldPrime.size(); i-- > 0;) {
        const uint8_t byte = (i == kFieldPrime.size() - 1)
                                 ? static_cast<uint8_t>(public_key[i] & 0x7f)
                                 : public_key[i];
        if (byte < kFieldPrime[i]) {
            return true;
        }
        if (byte > kFieldPrime[i]) {
            return false;
        }
    }
    return false;
}

}
