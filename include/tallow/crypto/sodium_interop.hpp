#pragma once

#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tallow::transfer::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium operations used by the transfer engine
 *
 * Initialization, secure wiping, constant-time comparison, X25519 key
 * agreement and the CSPRNG. Everything that touches secret bytes goes
 * through here so wiping is uniform.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every public engine entry point calls it.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different (including size mismatch)
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief Generate an ephemeral X25519 key pair
     *
     * The secret scalar lives in a SecureMemoryHandle; the public key is
     * returned as plain bytes.
     *
     * @param key_purpose Used only in error messages
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, TransferFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief X25519 scalar multiplication with a peer public key
     *
     * Fails with Handshake when the result is the all-zero point.
     */
    static Result<SecureMemoryHandle, TransferFailure> ComputeX25519SharedSecret(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> peer_public_key);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t kMaxBufferBytes = 1'000'000'000;
    static constexpr size_t kSmallBufferThreshold = 64;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

/// Wipes a temporary and deliberately drops the wipe result; used on cleanup
/// paths where an error is already being returned.
inline void WipeQuietly(std::span<uint8_t> buffer) {
    auto _wipe = SodiumInterop::SecureWipe(buffer);
    (void) _wipe;
}

}
