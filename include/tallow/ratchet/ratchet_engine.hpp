#pragma once

#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include "tallow/models/ratchet_checkpoint.hpp"
#include "tallow/ratchet/chain_ratchet.hpp"
#include "tallow/ratchet/message_key.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace tallow::transfer::ratchet {

enum class RatchetRole {
    Initiator,
    Responder
};

enum class RatchetPhase {
    Seeded,
    Active,
    Exhausted
};

struct RatchetLimits {
    /// Receive-side reorder tolerance; the send side uses it as well.
    uint32_t window = kDefaultReceiveWindow;
    /// Chunks per epoch before the root chain must be rotated.
    uint64_t rekey_after = kDefaultRekeyAfterChunks;
};

/**
 * @brief Root, sending and receiving chains of one transfer session
 *
 * Seeding:
 *   root = HKDF(ikm = shared_secret, salt = transfer_id, info = "Tallow-Root")
 *   (a || b) = HKDF(ikm = root, salt = transfer_id, info = "Tallow-ChainInit", 64)
 *   the initiator sends on a and receives on b; the responder mirrors.
 *
 * Rotation (Reseed):
 *   root' = HKDF(ikm = new_secret, salt = root, info = "Tallow-Root-Rotation")
 *   chains re-derived from root', both restarting at the rotation index.
 *
 * The two chains are independent, so a stalled direction never holds up the
 * other. The engine itself is not synchronized: one session thread owns it
 * and hands derived MessageKeys to workers.
 */
class RatchetEngine {
public:
    static Result<std::unique_ptr<RatchetEngine>, TransferFailure> Seed(
        RatchetRole role,
        const crypto::SecureMemoryHandle& shared_secret,
        std::span<const uint8_t> transfer_id,
        const RatchetLimits& limits);

    /**
     * @brief Rebuild from a persisted checkpoint
     *
     * @param released_send Indices at or above the send frontier already
     *        acknowledged before the checkpoint was taken
     * @param released_recv Same for the receive frontier
     */
    static Result<std::unique_ptr<RatchetEngine>, TransferFailure> FromCheckpoint(
        RatchetRole role,
        const models::RatchetCheckpoint& checkpoint,
        std::span<const uint8_t> transfer_id,
        const RatchetLimits& limits,
        std::span<const uint64_t> released_send = {},
        std::span<const uint64_t> released_recv = {});

    RatchetEngine(const RatchetEngine&) = delete;
    RatchetEngine& operator=(const RatchetEngine&) = delete;
    RatchetEngine(RatchetEngine&&) = delete;
    RatchetEngine& operator=(RatchetEngine&&) = delete;
    ~RatchetEngine() = default;

    Result<MessageKey, TransferFailure> DeriveSendKey(uint64_t index);
    Result<MessageKey, TransferFailure> DeriveRecvKey(uint64_t index);

    /// Called once the chunk is Acknowledged.
    Result<Unit, TransferFailure> ReleaseSend(uint64_t index);
    /// Called once the chunk is Verified.
    Result<Unit, TransferFailure> ReleaseRecv(uint64_t index);

    [[nodiscard]] Result<models::RatchetCheckpoint, TransferFailure> Checkpoint() const;

    /// True once index lies past the current epoch's allowance.
    [[nodiscard]] bool NeedsRotation(uint64_t next_index) const noexcept;

    /**
     * @brief Mix a freshly negotiated secret into the root chain
     *
     * Cached keys of the old epoch are wiped; callers drain in-flight chunks
     * first.
     */
    Result<Unit, TransferFailure> Reseed(
        const crypto::SecureMemoryHandle& new_secret,
        uint64_t base_index);

    /// AES-256 key for sealing control frames in the current epoch.
    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> DeriveControlKey() const;

    [[nodiscard]] uint32_t Epoch() const noexcept { return epoch_; }
    [[nodiscard]] uint64_t EpochBase() const noexcept { return epoch_base_; }
    [[nodiscard]] RatchetPhase Phase() const noexcept { return phase_; }
    [[nodiscard]] RatchetRole Role() const noexcept { return role_; }
    [[nodiscard]] const ChainRatchet& SendChain() const noexcept { return send_chain_; }
    [[nodiscard]] const ChainRatchet& RecvChain() const noexcept { return recv_chain_; }

private:
    RatchetEngine(RatchetRole role, crypto::SecureMemoryHandle root_key,
                  ChainRatchet send_chain, ChainRatchet recv_chain,
                  std::vector<uint8_t> transfer_id, RatchetLimits limits,
                  uint32_t epoch, uint64_t epoch_base) noexcept;

    Result<MessageKey, TransferFailure> DeriveFrom(ChainRatchet& chain, uint64_t index);

    RatchetRole role_;
    crypto::SecureMemoryHandle root_key_;
    ChainRatchet send_chain_;
    ChainRatchet recv_chain_;
    std::vector<uint8_t> transfer_id_;
    RatchetLimits limits_;
    uint32_t epoch_;
    uint64_t epoch_base_;
    RatchetPhase phase_ = RatchetPhase::Seeded;
};

}
