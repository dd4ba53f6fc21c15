#pragma once
#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace tallow::transfer::crypto {

/**
 * AES-256-GCM authenticated encryption (OpenSSL EVP).
 *
 * Stateless primitive: the caller guarantees a (key, nonce) pair is never
 * used twice. Chunk encryption satisfies this by using each message key for
 * exactly one chunk and deriving the nonce from the chunk index.
 *
 * Output of Encrypt is ciphertext || 16-byte tag. Decrypt reports a tag
 * mismatch as an Authentication failure; malformed arguments are InvalidInput.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
