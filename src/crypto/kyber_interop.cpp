#include "tallow/crypto/kyber_interop.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/crypto/hkdf.hpp"
#include "tallow/core/constants.hpp"
#include <sodium.h>
#include <oqs/oqs.h>
#include <oqs/rand.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>

namespace tallow::transfer::crypto {

namespace {
    struct OqsKemDeleter {
        void operator()(OQS_KEM *kem) const {
            OQS_KEM_free(kem);
        }
    };
    using OqsKemPtr = std::unique_ptr<OQS_KEM, OqsKemDeleter>;

    bool IsAllZero(std::span<const uint8_t> bytes) {
        return std::all_of(bytes.begin(), bytes.end(), [](const uint8_t b) { return b == 0; });
    }

    Result<OqsKemPtr, SodiumFailure> CreateKyber768() {
        auto init_result = KyberInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<OqsKemPtr, SodiumFailure>::Err(init_result.UnwrapErr());
        }
        OqsKemPtr kem(OQS_KEM_new(OQS_KEM_alg_kyber_768));
        if (!kem) {
            return Result<OqsKemPtr, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed("Failed to create Kyber-768 KEM instance (liboqs)"));
        }
        if (kem->length_public_key != KyberInterop::kPublicKeyBytes ||
            kem->length_secret_key != KyberInterop::kSecretKeyBytes ||
            kem->length_ciphertext != KyberInterop::kCiphertextBytes ||
            kem->length_shared_secret != KyberInterop::kSharedSecretBytes) {
            return Result<OqsKemPtr, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed("Kyber-768 sizes do not match FIPS 203"));
        }
        return Result<OqsKemPtr, SodiumFailure>::Ok(std::move(kem));
    }
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t> >, SodiumFailure>
KyberInterop::GenerateKyber768KeyPair(std::string_view purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t> >, SodiumFailure>;
    auto kem_result = CreateKyber768();
    if (kem_result.IsErr()) {
        return KeyPairResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto sk_handle_result = SecureMemoryHandle::Allocate(kSecretKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(sk_handle_result.UnwrapErr());
    }
    auto sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(kPublicKeyBytes);
    auto write_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk_span) {
        return OQS_KEM_keypair(kem.get(), pk.data(), sk_span.data());
    });
    if (write_result.IsErr()) {
        return KeyPairResult::Err(write_result.UnwrapErr());
    }
    if (write_result.Unwrap() != OQS_SUCCESS) {
        return KeyPairResult::Err(
            SodiumFailure::InvalidOperation(
                "Kyber-768 key generation failed for " + std::string(purpose)));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>
KyberInterop::Encapsulate(std::span<const uint8_t> public_key) {
    using EncapResult = Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>;
    if (auto validation = ValidatePublicKey(public_key); validation.IsErr()) {
        return EncapResult::Err(validation.UnwrapErr());
    }
    auto kem_result = CreateKyber768();
    if (kem_result.IsErr()) {
        return EncapResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto ss_handle_result = SecureMemoryHandle::Allocate(kSharedSecretBytes);
    if (ss_handle_result.IsErr()) {
        return EncapResult::Err(ss_handle_result.UnwrapErr());
    }
    auto ss_handle = std::move(ss_handle_result).Unwrap();

    std::vector<uint8_t> ciphertext(kCiphertextBytes);
    auto write_result = ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) {
        return OQS_KEM_encaps(kem.get(), ciphertext.data(), ss_span.data(), public_key.data());
    });
    if (write_result.IsErr()) {
        return EncapResult::Err(write_result.UnwrapErr());
    }
    if (write_result.Unwrap() != OQS_SUCCESS) {
        return EncapResult::Err(SodiumFailure::InvalidOperation("Kyber-768 encapsulation failed"));
    }
    return EncapResult::Ok(std::make_pair(std::move(ciphertext), std::move(ss_handle)));
}

Result<SecureMemoryHandle, SodiumFailure>
KyberInterop::Decapsulate(
    std::span<const uint8_t> ciphertext,
    const SecureMemoryHandle &secret_key_handle
) {
    if (auto ct_validation = ValidateCiphertext(ciphertext); ct_validation.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(ct_validation.UnwrapErr());
    }
    if (auto sk_validation = ValidateSecretKey(secret_key_handle); sk_validation.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(sk_validation.UnwrapErr());
    }
    auto kem_result = CreateKyber768();
    if (kem_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto ss_handle_result = SecureMemoryHandle::Allocate(kSharedSecretBytes);
    if (ss_handle_result.IsErr()) {
        return ss_handle_result;
    }
    auto ss_handle = std::move(ss_handle_result).Unwrap();

    auto access_result = secret_key_handle.WithReadAccess([&](std::span<const uint8_t> sk_span) {
        return ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) {
            return OQS_KEM_decaps(kem.get(), ss_span.data(), ciphertext.data(), sk_span.data());
        });
    });
    if (access_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(access_result.UnwrapErr());
    }
    auto inner = std::move(access_result).Unwrap();
    if (inner.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(inner.UnwrapErr());
    }
    if (inner.Unwrap() != OQS_SUCCESS) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Kyber-768 decapsulation failed"));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(ss_handle));
}

Result<SecureMemoryHandle, TransferFailure>
KyberInterop::CombineHybridSecrets(
    const SecureMemoryHandle &x25519_shared_secret,
    const SecureMemoryHandle &kyber_shared_secret,
    std::span<const uint8_t> context
) {
    if (x25519_shared_secret.Size() != kX25519SharedSecretBytes) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::InvalidInput("X25519 shared secret must be 32 bytes"));
    }
    if (kyber_shared_secret.Size() != kSharedSecretBytes) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::InvalidInput("Kyber shared secret must be 32 bytes"));
    }

    std::vector<uint8_t> ikm(kX25519SharedSecretBytes + kSharedSecretBytes);
    auto read_x = x25519_shared_secret.Read(std::span<uint8_t>(ikm).first(kX25519SharedSecretBytes));
    auto read_k = kyber_shared_secret.Read(std::span<uint8_t>(ikm).subspan(kX25519SharedSecretBytes));
    if (read_x.IsErr() || read_k.IsErr()) {
        WipeQuietly(ikm);
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::DeriveKey("Failed to read hybrid input secrets"));
    }

    std::vector<uint8_t> salt(kHybridSaltPrefix.begin(), kHybridSaltPrefix.end());
    salt.insert(salt.end(), context.begin(), context.end());

    auto prk_result = Hkdf::Extract(ikm, salt);
    WipeQuietly(ikm);
    if (prk_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(prk_result.UnwrapErr());
    }
    auto prk = std::move(prk_result).Unwrap();

    std::vector<uint8_t> hybrid(kSharedSecretBytes);
    auto expand_result = Hkdf::Expand(prk, hybrid, context);
    WipeQuietly(prk);
    if (expand_result.IsErr()) {
        WipeQuietly(hybrid);
        return Result<SecureMemoryHandle, TransferFailure>::Err(expand_result.UnwrapErr());
    }

    auto handle_result = SecureMemoryHandle::FromBytes(hybrid);
    WipeQuietly(hybrid);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(handle_result).Unwrap());
}

Result<Unit, SodiumFailure>
KyberInterop::ValidatePublicKey(std::span<const uint8_t> public_key) {
    if (public_key.size() != kPublicKeyBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 public key size (expected 1184 bytes)"));
    }
    if (IsAllZero(public_key)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 public key (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure>
KyberInterop::ValidateCiphertext(std::span<const uint8_t> ciphertext) {
    if (ciphertext.size() != kCiphertextBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 ciphertext size (expected 1088 bytes)"));
    }
    if (IsAllZero(ciphertext)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 ciphertext (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure>
KyberInterop::ValidateSecretKey(const SecureMemoryHandle &secret_key_handle) {
    if (secret_key_handle.Size() != kSecretKeyBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 secret key size (expected 2400 bytes)"));
    }
    auto zero_check = secret_key_handle.WithReadAccess([](std::span<const uint8_t> sk) {
        return IsAllZero(sk);
    });
    if (zero_check.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(zero_check.UnwrapErr());
    }
    if (zero_check.Unwrap()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 secret key (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> KyberInterop::Initialize() {
    static std::once_flag rng_init_flag;
    static std::atomic<bool> initialized{false};
    std::call_once(rng_init_flag, []() {
        if (SodiumInterop::Initialize().IsErr()) {
            return;
        }
        OQS_init();
        OQS_randombytes_custom_algorithm(
            [](uint8_t *buf, size_t len) { randombytes_buf(buf, len); });
        initialized.store(true, std::memory_order_release);
    });
    if (!initialized.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("KyberInterop initialization failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

}
