#pragma once

#include "tallow/core/result.hpp"
#include "tallow/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tallow::transfer::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Every key in the engine (root, chain, message, manifest, confirmation)
 * comes out of DeriveKey with a distinct info label.
 */
class Hkdf {
public:
    /**
     * @brief Extract-then-expand into a caller buffer
     *
     * @param ikm Input key material (must not be empty)
     * @param output Filled with output.size() derived bytes
     * @param salt Optional salt
     * @param info Optional context label
     */
    static Result<Unit, TransferFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, TransferFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Same as DeriveKeyBytes with a string label as info.
    static Result<std::vector<uint8_t>, TransferFailure> DeriveLabeled(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view label);

    /**
     * @brief HKDF-Extract; always 32 bytes
     */
    static Result<std::vector<uint8_t>, TransferFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF-Expand from a 32-byte PRK
     */
    static Result<Unit, TransferFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t kHashBytes = 32;
    static constexpr size_t kMaxOutputBytes = 255 * kHashBytes;

private:
    Hkdf() = delete;
};

}
