#pragma once

#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include "tallow/ratchet/message_key.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <span>
#include <vector>

namespace tallow::transfer::ratchet {

/**
 * @brief One direction's symmetric key chain
 *
 * CK(i+1) = HKDF(CK(i), info="Tallow-Chain")
 * MK(i)   = HKDF(CK(i), info="Tallow-Msg")
 *
 * The chain only steps forward. Keys for indices in [frontier, head) stay
 * cached until released so a retransmitted or reordered chunk gets the same
 * key again; a released index can never be derived again. The cache is
 * bounded by the window: head - frontier never exceeds it.
 *
 * Not thread-safe; the owning RatchetEngine is confined to one thread.
 */
class ChainRatchet {
public:
    static Result<ChainRatchet, TransferFailure> Create(
        std::span<const uint8_t> chain_key,
        uint64_t frontier,
        uint64_t ceiling,
        uint32_t window,
        uint32_t epoch);

    ChainRatchet(ChainRatchet&&) noexcept = default;
    /// Wipes this chain's cached keys before taking over other's.
    ChainRatchet& operator=(ChainRatchet&& other) noexcept;
    ChainRatchet(const ChainRatchet&) = delete;
    ChainRatchet& operator=(const ChainRatchet&) = delete;
    ~ChainRatchet();

    /**
     * @brief Message key for index
     *
     * Idempotent while the index is cached.
     *
     * Errors:
     * - ReplayAttack: index is below the frontier or already released
     * - InvalidInput: index is more than window ahead of the frontier
     * - RatchetExhausted: index reached the epoch ceiling
     */
    Result<MessageKey, TransferFailure> Derive(uint64_t index);

    /**
     * @brief Drop the cached key for index; it cannot be derived again
     *
     * Releasing an index that was never derived marks it as skipped, so the
     * chain steps over it without caching. Releasing twice is a no-op.
     */
    Result<Unit, TransferFailure> Release(uint64_t index);

    /// Chain key at the frontier, for checkpoints.
    Result<std::vector<uint8_t>, TransferFailure> FrontierChainKey() const;

    [[nodiscard]] uint64_t Frontier() const noexcept { return frontier_; }
    [[nodiscard]] uint64_t Head() const noexcept { return head_; }
    [[nodiscard]] uint64_t Ceiling() const noexcept { return ceiling_; }
    [[nodiscard]] size_t CachedKeys() const noexcept { return pending_.size(); }
    [[nodiscard]] uint64_t DerivationCount() const noexcept { return derivation_count_; }

private:
    struct PendingKey {
        std::vector<uint8_t> message_key;
        std::vector<uint8_t> chain_key;
    };

    ChainRatchet(crypto::SecureMemoryHandle head_key, uint64_t frontier,
                 uint64_t ceiling, uint32_t window, uint32_t epoch) noexcept;

    Result<Unit, TransferFailure> StepHead(bool cache);
    void Evict(std::map<uint64_t, PendingKey>::iterator it);
    void WipeCache() noexcept;
    Result<Unit, TransferFailure> AdvanceFrontier();

    crypto::SecureMemoryHandle head_key_;
    uint64_t head_;
    uint64_t frontier_;
    uint64_t ceiling_;
    uint32_t window_;
    uint32_t epoch_;
    uint64_t derivation_count_ = 0;
    std::map<uint64_t, PendingKey> pending_;
    std::set<uint64_t> released_ahead_;
};

}
