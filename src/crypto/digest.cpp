#include "tallow/crypto/digest.hpp"

#include <format>

namespace tallow::transfer::crypto {

Sha256Digest Digest::Sha256(std::span<const uint8_t> data) noexcept {
    Sha256Digest out{};
    crypto_hash_sha256(out.data(), data.data(), data.size());
    return out;
}

Result<StoreDigest, TransferFailure> Digest::Blake2b(
    std::span<const uint8_t> data,
    std::span<const uint8_t> key) {
    if (!key.empty() &&
        (key.size() < crypto_generichash_KEYBYTES_MIN || key.size() > crypto_generichash_KEYBYTES_MAX)) {
        return Result<StoreDigest, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("BLAKE2b key must be {}..{} bytes",
                            crypto_generichash_KEYBYTES_MIN, crypto_generichash_KEYBYTES_MAX)));
    }
    StoreDigest out{};
    if (crypto_generichash(out.data(), out.size(), data.data(), data.size(),
                           key.empty() ? nullptr : key.data(), key.size()) != 0) {
        return Result<StoreDigest, TransferFailure>::Err(
            TransferFailure::Generic("BLAKE2b computation failed"));
    }
    return Result<StoreDigest, TransferFailure>::Ok(out);
}

Result<std::array<uint8_t, kHmacBytes>, TransferFailure> Digest::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (key.size() != crypto_auth_hmacsha256_KEYBYTES) {
        return Result<std::array<uint8_t, kHmacBytes>, TransferFailure>::Err(
            TransferFailure::InvalidInput("HMAC key must be 32 bytes"));
    }
    std::array<uint8_t, kHmacBytes> mac{};
    crypto_auth_hmacsha256(mac.data(), data.data(), data.size(), key.data());
    return Result<std::array<uint8_t, kHmacBytes>, TransferFailure>::Ok(mac);
}

Sha256Stream::Sha256Stream() noexcept {
    crypto_hash_sha256_init(&state_);
}

void Sha256Stream::Update(std::span<const uint8_t> data) noexcept {
    crypto_hash_sha256_update(&state_, data.data(), data.size());
}

Sha256Digest Sha256Stream::Finish() noexcept {
    Sha256Digest out{};
    crypto_hash_sha256_final(&state_, out.data());
    crypto_hash_sha256_init(&state_);
    return out;
}

}
