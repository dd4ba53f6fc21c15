#pragma once

#include "tallow/cipher/chunk_cipher.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace tallow::transfer::cipher {

struct SealedControl {
    uint32_t epoch = 0;
    Nonce nonce{};
    /// ciphertext || tag
    std::vector<uint8_t> ciphertext;
};

/**
 * @brief Seals Ack and Control frame bodies under the epoch control key
 *
 * Control keys are long-lived within an epoch, so nonces are random rather
 * than counter-derived. AAD binds the label, transfer id, frame type and
 * epoch so a body cannot be replayed under a different frame type.
 */
class ControlCipher {
public:
    static Result<SealedControl, TransferFailure> Seal(
        std::span<const uint8_t> control_key,
        std::span<const uint8_t> transfer_id,
        uint32_t frame_type,
        uint32_t epoch,
        std::span<const uint8_t> plaintext);

    /// Tag mismatch is an Authentication failure.
    static Result<std::vector<uint8_t>, TransferFailure> Open(
        std::span<const uint8_t> control_key,
        std::span<const uint8_t> transfer_id,
        uint32_t frame_type,
        const SealedControl& sealed);

private:
    static std::vector<uint8_t> BuildAad(
        std::span<const uint8_t> transfer_id,
        uint32_t frame_type,
        uint32_t epoch);

    ControlCipher() = delete;
};

}
