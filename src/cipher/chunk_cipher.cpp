#include "tallow/cipher/chunk_cipher.hpp"
#include "tallow/crypto/aes_gcm.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include <algorithm>
#include <format>

namespace tallow::transfer::cipher {

using crypto::AesGcm;
using crypto::Digest;
using crypto::SodiumInterop;

namespace {
    void AppendU32(std::vector<uint8_t>& out, const uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    Result<Unit, TransferFailure> ValidateKeyFor(const ratchet::MessageKey& key,
                                                 std::span<const uint8_t> transfer_id,
                                                 const uint32_t index) {
        if (key.Index() != index) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    std::format("Message key for index {} used on chunk {}", key.Index(), index)));
        }
        if (transfer_id.size() != kTransferIdBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Invalid transfer id size"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }
}

Nonce ChunkCipher::NonceFor(const uint64_t index) noexcept {
    Nonce nonce{};
    for (size_t i = 0; i < 8; ++i) {
        nonce[kAesGcmNonceBytes - 1 - i] = static_cast<uint8_t>(index >> (8 * i));
    }
    return nonce;
}

std::vector<uint8_t> ChunkCipher::BuildAad(
    std::span<const uint8_t> transfer_id,
    const uint32_t index,
    const uint32_t epoch) {
    std::vector<uint8_t> aad;
    aad.reserve(kChunkAadLabel.size() + transfer_id.size() + 8);
    aad.insert(aad.end(), kChunkAadLabel.begin(), kChunkAadLabel.end());
    aad.insert(aad.end(), transfer_id.begin(), transfer_id.end());
    AppendU32(aad, index);
    AppendU32(aad, epoch);
    return aad;
}

Result<SealedChunk, TransferFailure> ChunkCipher::Encrypt(
    const ratchet::MessageKey& key,
    std::span<const uint8_t> transfer_id,
    const uint32_t index,
    std::span<const uint8_t> plaintext) {
    if (auto valid = ValidateKeyFor(key, transfer_id, index); valid.IsErr()) {
        return Result<SealedChunk, TransferFailure>::Err(valid.UnwrapErr());
    }
    const auto hash = Digest::Sha256(plaintext);
    std::vector<uint8_t> framed;
    framed.reserve(hash.size() + plaintext.size());
    framed.insert(framed.end(), hash.begin(), hash.end());
    framed.insert(framed.end(), plaintext.begin(), plaintext.end());

    const auto nonce = NonceFor(index);
    const auto aad = BuildAad(transfer_id, index, key.Epoch());
    auto encrypt_result = AesGcm::Encrypt(key.Bytes(), nonce, framed, aad);
    crypto::WipeQuietly(framed);
    if (encrypt_result.IsErr()) {
        return Result<SealedChunk, TransferFailure>::Err(encrypt_result.UnwrapErr());
    }
    auto combined = std::move(encrypt_result).Unwrap();
    SealedChunk sealed;
    std::copy(combined.end() - kAesGcmTagBytes, combined.end(), sealed.tag.begin());
    combined.resize(combined.size() - kAesGcmTagBytes);
    sealed.ciphertext = std::move(combined);
    return Result<SealedChunk, TransferFailure>::Ok(std::move(sealed));
}

Result<OpenedChunk, TransferFailure> ChunkCipher::Decrypt(
    const ratchet::MessageKey& key,
    std::span<const uint8_t> transfer_id,
    const uint32_t index,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> tag) {
    if (auto valid = ValidateKeyFor(key, transfer_id, index); valid.IsErr()) {
        return Result<OpenedChunk, TransferFailure>::Err(valid.UnwrapErr());
    }
    if (tag.size() != kAesGcmTagBytes) {
        return Result<OpenedChunk, TransferFailure>::Err(
            TransferFailure::Authentication(
                std::format("Chunk {} carries a {}-byte tag", index, tag.size())));
    }
    if (ciphertext.size() < kSha256Bytes) {
        return Result<OpenedChunk, TransferFailure>::Err(
            TransferFailure::Authentication(
                std::format("Chunk {} ciphertext is too short", index)));
    }

    std::vector<uint8_t> combined;
    combined.reserve(ciphertext.size() + tag.size());
    combined.insert(combined.end(), ciphertext.begin(), ciphertext.end());
    combined.insert(combined.end(), tag.begin(), tag.end());

    const auto nonce = NonceFor(index);
    const auto aad = BuildAad(transfer_id, index, key.Epoch());
    auto decrypt_result = AesGcm::Decrypt(key.Bytes(), nonce, combined, aad);
    if (decrypt_result.IsErr()) {
        auto failure = decrypt_result.UnwrapErr();
        failure.message = std::format("Chunk {}: {}", index, failure.message);
        return Result<OpenedChunk, TransferFailure>::Err(std::move(failure));
    }
    auto framed = std::move(decrypt_result).Unwrap();

    OpenedChunk opened;
    std::copy_n(framed.begin(), kSha256Bytes, opened.plaintext_hash.begin());
    opened.plaintext.assign(framed.begin() + kSha256Bytes, framed.end());
    crypto::WipeQuietly(framed);

    const auto actual = Digest::Sha256(opened.plaintext);
    auto equal_result = SodiumInterop::ConstantTimeEquals(actual, opened.plaintext_hash);
    if (equal_result.IsErr() || !equal_result.Unwrap()) {
        crypto::WipeQuietly(opened.plaintext);
        return Result<OpenedChunk, TransferFailure>::Err(
            TransferFailure::Integrity(
                std::format("Chunk {} hash does not match its contents", index)));
    }
    return Result<OpenedChunk, TransferFailure>::Ok(std::move(opened));
}

uint32_t ChunkFailureTracker::RecordFailure(const uint32_t index) {
    return ++failures_[index];
}

void ChunkFailureTracker::RecordSuccess(const uint32_t index) {
    failures_.erase(index);
}

bool ChunkFailureTracker::LimitReached(const uint32_t index) const noexcept {
    return FailuresFor(index) >= limit_;
}

uint32_t ChunkFailureTracker::FailuresFor(const uint32_t index) const noexcept {
    const auto it = failures_.find(index);
    return it == failures_.end() ? 0 : it->second;
}

}
