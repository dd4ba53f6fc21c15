#pragma once

#include "tallow/core/constants.hpp"
#include <cstdint>
#include <vector>

namespace tallow::transfer::models {

/**
 * @brief Persisted snapshot of a RatchetEngine
 *
 * Each chain key is the key at that direction's frontier (the lowest index
 * not yet Acknowledged or Verified), and the counter is that frontier. A
 * session restored from it can re-derive exactly the unfinished indices and
 * nothing below them.
 *
 * Key buffers are wiped when the checkpoint is destroyed.
 */
struct RatchetCheckpoint {
    std::vector<uint8_t> root_key;
    std::vector<uint8_t> send_chain_key;
    std::vector<uint8_t> recv_chain_key;
    uint64_t send_counter = 0;
    uint64_t recv_counter = 0;
    uint32_t epoch = 0;
    /// First chunk index of the current epoch.
    uint64_t epoch_base = 0;

    RatchetCheckpoint() = default;
    RatchetCheckpoint(const RatchetCheckpoint&) = default;
    RatchetCheckpoint(RatchetCheckpoint&&) noexcept = default;
    RatchetCheckpoint& operator=(const RatchetCheckpoint& other);
    RatchetCheckpoint& operator=(RatchetCheckpoint&& other) noexcept;
    ~RatchetCheckpoint();

    [[nodiscard]] bool IsComplete() const noexcept {
        return root_key.size() == kRootKeyBytes &&
               send_chain_key.size() == kChainKeyBytes &&
               recv_chain_key.size() == kChainKeyBytes;
    }

    void Wipe() noexcept;
};

}
