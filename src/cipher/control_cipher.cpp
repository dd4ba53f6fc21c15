#include "tallow/cipher/control_cipher.hpp"
#include "tallow/crypto/aes_gcm.hpp"
#include "tallow/crypto/sodium_interop.hpp"

namespace tallow::transfer::cipher {

using crypto::AesGcm;

std::vector<uint8_t> ControlCipher::BuildAad(
    std::span<const uint8_t> transfer_id,
    const uint32_t frame_type,
    const uint32_t epoch) {
    std::vector<uint8_t> aad;
    aad.reserve(kControlAadLabel.size() + transfer_id.size() + 8);
    aad.insert(aad.end(), kControlAadLabel.begin(), kControlAadLabel.end());
    aad.insert(aad.end(), transfer_id.begin(), transfer_id.end());
    for (const uint32_t value : {frame_type, epoch}) {
        aad.push_back(static_cast<uint8_t>(value >> 24));
        aad.push_back(static_cast<uint8_t>(value >> 16));
        aad.push_back(static_cast<uint8_t>(value >> 8));
        aad.push_back(static_cast<uint8_t>(value));
    }
    return aad;
}

Result<SealedControl, TransferFailure> ControlCipher::Seal(
    std::span<const uint8_t> control_key,
    std::span<const uint8_t> transfer_id,
    const uint32_t frame_type,
    const uint32_t epoch,
    std::span<const uint8_t> plaintext) {
    SealedControl sealed;
    sealed.epoch = epoch;
    crypto::SodiumInterop::FillRandom(sealed.nonce);
    const auto aad = BuildAad(transfer_id, frame_type, epoch);
    auto encrypt_result = AesGcm::Encrypt(control_key, sealed.nonce, plaintext, aad);
    if (encrypt_result.IsErr()) {
        return Result<SealedControl, TransferFailure>::Err(encrypt_result.UnwrapErr());
    }
    sealed.ciphertext = std::move(encrypt_result).Unwrap();
    return Result<SealedControl, TransferFailure>::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, TransferFailure> ControlCipher::Open(
    std::span<const uint8_t> control_key,
    std::span<const uint8_t> transfer_id,
    const uint32_t frame_type,
    const SealedControl& sealed) {
    if (sealed.ciphertext.size() < kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Authentication("Control frame is shorter than its tag"));
    }
    const auto aad = BuildAad(transfer_id, frame_type, sealed.epoch);
    return AesGcm::Decrypt(control_key, sealed.nonce, sealed.ciphertext, aad);
}

}
