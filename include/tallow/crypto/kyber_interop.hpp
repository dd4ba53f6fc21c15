#ifndef TALLOW_CRYPTO_KYBER_INTEROP_HPP
#define TALLOW_CRYPTO_KYBER_INTEROP_HPP

#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tallow::transfer::crypto {

/// KyberInterop - liboqs Kyber-768 (ML-KEM, FIPS 203) wrapper
///
/// Secret keys and shared secrets are returned in SecureMemoryHandle.
/// liboqs randomness is routed through libsodium's CSPRNG by Initialize().
///
/// **Sizes (Kyber-768)**:
/// - Public Key:    1184 bytes
/// - Secret Key:    2400 bytes
/// - Ciphertext:    1088 bytes
/// - Shared Secret:   32 bytes
class KyberInterop {
public:
    static constexpr size_t kPublicKeyBytes = 1184;
    static constexpr size_t kSecretKeyBytes = 2400;
    static constexpr size_t kCiphertextBytes = 1088;
    static constexpr size_t kSharedSecretBytes = 32;

    /// Generates an ephemeral Kyber-768 key pair
    ///
    /// @return (secret key in secure memory, public key bytes)
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateKyber768KeyPair(std::string_view purpose);

    /// Encapsulates a fresh shared secret to a peer public key
    ///
    /// @return (ciphertext to send, shared secret in secure memory)
    static Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>
    Encapsulate(std::span<const uint8_t> public_key);

    /// Recovers the shared secret from a ciphertext with our secret key
    static Result<SecureMemoryHandle, SodiumFailure>
    Decapsulate(std::span<const uint8_t> ciphertext, const SecureMemoryHandle& secret_key_handle);

    /// Combines the classical and post-quantum secrets into one 32-byte secret
    ///
    /// PRK = HKDF-Extract(salt = "Tallow-PQ-Hybrid-v1::" || context, ikm = x25519_ss || kyber_ss)
    /// out = HKDF-Expand(PRK, info = context, 32)
    ///
    /// Secure as long as either input secret is.
    static Result<SecureMemoryHandle, TransferFailure> CombineHybridSecrets(
        const SecureMemoryHandle& x25519_shared_secret,
        const SecureMemoryHandle& kyber_shared_secret,
        std::span<const uint8_t> context);

    static Result<Unit, SodiumFailure> ValidatePublicKey(std::span<const uint8_t> public_key);

    static Result<Unit, SodiumFailure> ValidateCiphertext(std::span<const uint8_t> ciphertext);

    static Result<Unit, SodiumFailure> ValidateSecretKey(const SecureMemoryHandle& secret_key_handle);

    /// Binds liboqs randomness to libsodium. Idempotent.
    static Result<Unit, SodiumFailure> Initialize();

private:
    KyberInterop() = delete;
};

}

#endif
