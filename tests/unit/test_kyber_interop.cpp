#include <catch2/catch_test_macros.hpp>
#include "tallow/crypto/kyber_interop.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include "tallow/core/constants.hpp"
#include <string_view>
#include <vector>
using namespace tallow::transfer;
using namespace tallow::transfer::crypto;

namespace {

    std::vector<uint8_t> Context(std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

}

TEST_CASE("KyberInterop - Key generation", "[kyber][crypto][pq]") {
    REQUIRE(KyberInterop::Initialize().IsOk());
    auto result = KyberInterop::GenerateKyber768KeyPair("transfer ephemeral");
    REQUIRE(result.IsOk());
    auto& [secret_key, public_key] = result.Unwrap();
    REQUIRE(public_key.size() == KyberInterop::kPublicKeyBytes);
    REQUIRE(secret_key.Size() == KyberInterop::kSecretKeyBytes);
    REQUIRE(KyberInterop::ValidatePublicKey(public_key).IsOk());
    REQUIRE(KyberInterop::ValidateSecretKey(secret_key).IsOk());

    auto second = KyberInterop::GenerateKyber768KeyPair("transfer ephemeral");
    REQUIRE(second.Unwrap().second != public_key);
}

TEST_CASE("KyberInterop - Encapsulation agreement", "[kyber][crypto][pq]") {
    REQUIRE(KyberInterop::Initialize().IsOk());
    auto keypair = KyberInterop::GenerateKyber768KeyPair("receiver").Unwrap();

    auto encap = KyberInterop::Encapsulate(keypair.second);
    REQUIRE(encap.IsOk());
    auto& [ciphertext, sender_secret] = encap.Unwrap();
    REQUIRE(ciphertext.size() == KyberInterop::kCiphertextBytes);

    SECTION("Decapsulation recovers the secret") {
        auto receiver_secret = KyberInterop::Decapsulate(ciphertext, keypair.first);
        REQUIRE(receiver_secret.IsOk());
        REQUIRE(receiver_secret.Unwrap().ReadBytes(kKyberSharedSecretBytes).Unwrap() ==
                sender_secret.ReadBytes(kKyberSharedSecretBytes).Unwrap());
    }
    SECTION("Tampered ciphertext yields a different secret") {
        std::vector<uint8_t> tampered = ciphertext;
        tampered[100] ^= 0x01;
        auto receiver_secret = KyberInterop::Decapsulate(tampered, keypair.first);
        REQUIRE(receiver_secret.IsOk());
        REQUIRE(receiver_secret.Unwrap().ReadBytes(kKyberSharedSecretBytes).Unwrap() !=
                sender_secret.ReadBytes(kKyberSharedSecretBytes).Unwrap());
    }
}

TEST_CASE("KyberInterop - Input validation", "[kyber][crypto][pq]") {
    REQUIRE(KyberInterop::Initialize().IsOk());
    SECTION("Public key") {
        REQUIRE(KyberInterop::ValidatePublicKey(std::vector<uint8_t>(100, 1)).IsErr());
        REQUIRE(KyberInterop::ValidatePublicKey(std::vector<uint8_t>(KyberInterop::kPublicKeyBytes, 0)).IsErr());
        REQUIRE(KyberInterop::Encapsulate(std::vector<uint8_t>(KyberInterop::kPublicKeyBytes, 0)).IsErr());
    }
    SECTION("Ciphertext") {
        REQUIRE(KyberInterop::ValidateCiphertext(std::vector<uint8_t>(KyberInterop::kCiphertextBytes - 1, 1)).IsErr());
        REQUIRE(KyberInterop::ValidateCiphertext(std::vector<uint8_t>(KyberInterop::kCiphertextBytes, 0)).IsErr());
    }
    SECTION("Secret key") {
        auto zeros = SecureMemoryHandle::Allocate(KyberInterop::kSecretKeyBytes).Unwrap();
        REQUIRE(zeros.Write(std::vector<uint8_t>(KyberInterop::kSecretKeyBytes, 0)).IsOk());
        REQUIRE(KyberInterop::ValidateSecretKey(zeros).IsErr());
        auto short_key = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE(KyberInterop::ValidateSecretKey(short_key).IsErr());
    }
}

TEST_CASE("KyberInterop - Hybrid secret combination", "[kyber][crypto][pq]") {
    REQUIRE(KyberInterop::Initialize().IsOk());
    auto x25519 = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(kX25519SharedSecretBytes, 0x01)).Unwrap();
    auto kyber = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(kKyberSharedSecretBytes, 0x02)).Unwrap();
    const auto context = Context("transfer-0001");

    auto first = KyberInterop::CombineHybridSecrets(x25519, kyber, context);
    auto second = KyberInterop::CombineHybridSecrets(x25519, kyber, context);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    const auto first_bytes = first.Unwrap().ReadBytes(kSharedSecretBytes).Unwrap();
    REQUIRE(first_bytes == second.Unwrap().ReadBytes(kSharedSecretBytes).Unwrap());

    SECTION("Context separates outputs") {
        auto other = KyberInterop::CombineHybridSecrets(x25519, kyber, Context("transfer-0002"));
        REQUIRE(other.Unwrap().ReadBytes(kSharedSecretBytes).Unwrap() != first_bytes);
    }
    SECTION("Either input changes the output") {
        auto other_kyber = SecureMemoryHandle::FromBytes(
            std::vector<uint8_t>(kKyberSharedSecretBytes, 0x03)).Unwrap();
        auto other = KyberInterop::CombineHybridSecrets(x25519, other_kyber, context);
        REQUIRE(other.Unwrap().ReadBytes(kSharedSecretBytes).Unwrap() != first_bytes);
    }
    SECTION("Wrong sized inputs are rejected") {
        auto short_secret = SecureMemoryHandle::Allocate(16).Unwrap();
        auto result = KyberInterop::CombineHybridSecrets(short_secret, kyber, context);
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    }
}
