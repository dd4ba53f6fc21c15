#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include "tallow/core/constants.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace tallow::transfer::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium initialization failed"));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium is not initialized"));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > kMaxBufferBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}", buffer.size(), kMaxBufferBytes)));
    }

    if (buffer.size() <= kSmallBufferThreshold) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed("libsodium is not initialized"));
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            TransferFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    auto derive_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return crypto_scalarmult_base(pk_bytes.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return KeyPairResult::Err(
            TransferFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != 0) {
        return KeyPairResult::Err(
            TransferFailure::KeyGeneration(
                "Failed to derive " + std::string(key_purpose) + " public key"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<SecureMemoryHandle, TransferFailure> SodiumInterop::ComputeX25519SharedSecret(
    const SecureMemoryHandle& private_key,
    std::span<const uint8_t> peer_public_key) {

    if (private_key.Size() != kX25519PrivateKeyBytes ||
        peer_public_key.size() != kX25519PublicKeyBytes) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::InvalidInput("Invalid X25519 key sizes"));
    }

    auto shared_result = SecureMemoryHandle::Allocate(kX25519SharedSecretBytes);
    if (shared_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(shared_result.UnwrapErr()));
    }
    auto shared = std::move(shared_result).Unwrap();

    int status = -1;
    auto access_result = private_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return shared.WithWriteAccess([&](std::span<uint8_t> out) {
            status = crypto_scalarmult(out.data(), sk.data(), peer_public_key.data());
            return status;
        });
    });
    if (access_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(access_result.UnwrapErr()));
    }
    if (auto inner = std::move(access_result).Unwrap(); inner.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(inner.UnwrapErr()));
    }
    if (status != 0) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::Handshake("X25519 produced an all-zero shared secret"));
    }
    return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(shared));
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) noexcept {
    randombytes_buf(buffer.data(), buffer.size());
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
