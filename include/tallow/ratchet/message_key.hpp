#pragma once

#include "tallow/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace tallow::transfer::ratchet {

/**
 * @brief Single-use chunk key
 *
 * Move-only; the bytes are wiped when the key is destroyed or moved from.
 * Index and epoch travel with the key so the cipher cannot pair it with the
 * wrong chunk nonce.
 */
class MessageKey {
public:
    MessageKey(uint64_t index, uint32_t epoch, std::span<const uint8_t> key_bytes) noexcept;

    MessageKey(MessageKey&& other) noexcept;
    MessageKey& operator=(MessageKey&& other) noexcept;

    MessageKey(const MessageKey&) = delete;
    MessageKey& operator=(const MessageKey&) = delete;

    ~MessageKey();

    [[nodiscard]] uint64_t Index() const noexcept { return index_; }
    [[nodiscard]] uint32_t Epoch() const noexcept { return epoch_; }
    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return key_; }

private:
    void Wipe() noexcept;

    uint64_t index_;
    uint32_t epoch_;
    std::array<uint8_t, kMessageKeyBytes> key_{};
};

}
