#include "tallow/ratchet/ratchet_engine.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/crypto/hkdf.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include <algorithm>
#include <format>

namespace tallow::transfer::ratchet {

using crypto::Hkdf;
using crypto::SecureMemoryHandle;
using crypto::WipeQuietly;

namespace {
    uint64_t CeilingFor(const uint64_t epoch_base, const uint64_t rekey_after) noexcept {
        constexpr uint64_t kIndexSpace = kMaxChunkIndex + 1;
        if (epoch_base >= kIndexSpace || rekey_after >= kIndexSpace - epoch_base) {
            return kIndexSpace;
        }
        return epoch_base + rekey_after;
    }

    Result<Unit, TransferFailure> ValidateLimits(const RatchetLimits& limits) {
        if (limits.window == 0 || limits.rekey_after == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Ratchet window and rekey interval must be positive"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    struct ChainPair {
        ChainRatchet send;
        ChainRatchet recv;
    };

    /// Splits ChainInit output into per-direction chains; the responder's
    /// send chain is the initiator's receive chain.
    Result<ChainPair, TransferFailure> InitializeChains(
        const RatchetRole role,
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> transfer_id,
        const RatchetLimits& limits,
        const uint32_t epoch,
        const uint64_t base_index) {
        auto chain_init_result = Hkdf::DeriveLabeled(
            root_key, kChainKeyBytes * 2, transfer_id, kChainInitInfo);
        if (chain_init_result.IsErr()) {
            return Result<ChainPair, TransferFailure>::Err(chain_init_result.UnwrapErr());
        }
        auto chain_init = std::move(chain_init_result).Unwrap();
        const std::span<const uint8_t> first(chain_init.data(), kChainKeyBytes);
        const std::span<const uint8_t> second(chain_init.data() + kChainKeyBytes, kChainKeyBytes);
        const auto send_key = role == RatchetRole::Initiator ? first : second;
        const auto recv_key = role == RatchetRole::Initiator ? second : first;

        const uint64_t ceiling = CeilingFor(base_index, limits.rekey_after);
        auto send_result = ChainRatchet::Create(send_key, base_index, ceiling, limits.window, epoch);
        auto recv_result = ChainRatchet::Create(recv_key, base_index, ceiling, limits.window, epoch);
        WipeQuietly(chain_init);
        if (send_result.IsErr()) {
            return Result<ChainPair, TransferFailure>::Err(send_result.UnwrapErr());
        }
        if (recv_result.IsErr()) {
            return Result<ChainPair, TransferFailure>::Err(recv_result.UnwrapErr());
        }
        return Result<ChainPair, TransferFailure>::Ok(
            ChainPair{std::move(send_result).Unwrap(), std::move(recv_result).Unwrap()});
    }

    Result<Unit, TransferFailure> MarkReleased(ChainRatchet& chain, std::span<const uint64_t> indices) {
        for (const uint64_t index : indices) {
            auto release_result = chain.Release(index);
            if (release_result.IsErr()) {
                return release_result;
            }
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }
}

RatchetEngine::RatchetEngine(const RatchetRole role, SecureMemoryHandle root_key,
                             ChainRatchet send_chain, ChainRatchet recv_chain,
                             std::vector<uint8_t> transfer_id, const RatchetLimits limits,
                             const uint32_t epoch, const uint64_t epoch_base) noexcept
    : role_(role),
      root_key_(std::move(root_key)),
      send_chain_(std::move(send_chain)),
      recv_chain_(std::move(recv_chain)),
      transfer_id_(std::move(transfer_id)),
      limits_(limits),
      epoch_(epoch),
      epoch_base_(epoch_base) {}

Result<std::unique_ptr<RatchetEngine>, TransferFailure> RatchetEngine::Seed(
    const RatchetRole role,
    const SecureMemoryHandle& shared_secret,
    std::span<const uint8_t> transfer_id,
    const RatchetLimits& limits) {
    if (auto limits_result = ValidateLimits(limits); limits_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(limits_result.UnwrapErr());
    }
    if (shared_secret.Size() != kSharedSecretBytes || transfer_id.size() != kTransferIdBytes) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::InvalidInput("Invalid shared secret or transfer id size"));
    }
    auto secret_result = shared_secret.ReadBytes(kSharedSecretBytes);
    if (secret_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(secret_result.UnwrapErr()));
    }
    auto secret = std::move(secret_result).Unwrap();
    auto root_result = Hkdf::DeriveLabeled(secret, kRootKeyBytes, transfer_id, kRootInfo);
    WipeQuietly(secret);
    if (root_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(root_result.UnwrapErr());
    }
    auto root = std::move(root_result).Unwrap();

    auto chains_result = InitializeChains(role, root, transfer_id, limits, 0, 0);
    auto root_handle_result = SecureMemoryHandle::FromBytes(root);
    WipeQuietly(root);
    if (chains_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(chains_result.UnwrapErr());
    }
    if (root_handle_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(root_handle_result.UnwrapErr()));
    }
    auto chains = std::move(chains_result).Unwrap();
    auto engine = std::unique_ptr<RatchetEngine>(new RatchetEngine(
        role,
        std::move(root_handle_result).Unwrap(),
        std::move(chains.send),
        std::move(chains.recv),
        std::vector<uint8_t>(transfer_id.begin(), transfer_id.end()),
        limits,
        0,
        0));
    return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Ok(std::move(engine));
}

Result<std::unique_ptr<RatchetEngine>, TransferFailure> RatchetEngine::FromCheckpoint(
    const RatchetRole role,
    const models::RatchetCheckpoint& checkpoint,
    std::span<const uint8_t> transfer_id,
    const RatchetLimits& limits,
    std::span<const uint64_t> released_send,
    std::span<const uint64_t> released_recv) {
    if (auto limits_result = ValidateLimits(limits); limits_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(limits_result.UnwrapErr());
    }
    if (!checkpoint.IsComplete()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::InvalidState("Ratchet checkpoint is missing key material"));
    }
    if (transfer_id.size() != kTransferIdBytes) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::InvalidInput("Invalid transfer id size"));
    }
    if (checkpoint.send_counter < checkpoint.epoch_base || checkpoint.recv_counter < checkpoint.epoch_base) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::InvalidState("Checkpoint counters precede the epoch base"));
    }

    const uint64_t ceiling = CeilingFor(checkpoint.epoch_base, limits.rekey_after);
    auto send_result = ChainRatchet::Create(
        checkpoint.send_chain_key, checkpoint.send_counter, ceiling, limits.window, checkpoint.epoch);
    if (send_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(send_result.UnwrapErr());
    }
    auto recv_result = ChainRatchet::Create(
        checkpoint.recv_chain_key, checkpoint.recv_counter, ceiling, limits.window, checkpoint.epoch);
    if (recv_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(recv_result.UnwrapErr());
    }
    auto send_chain = std::move(send_result).Unwrap();
    auto recv_chain = std::move(recv_result).Unwrap();
    if (auto marked = MarkReleased(send_chain, released_send); marked.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(marked.UnwrapErr());
    }
    if (auto marked = MarkReleased(recv_chain, released_recv); marked.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(marked.UnwrapErr());
    }

    auto root_handle_result = SecureMemoryHandle::FromBytes(checkpoint.root_key);
    if (root_handle_result.IsErr()) {
        return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(root_handle_result.UnwrapErr()));
    }
    auto engine = std::unique_ptr<RatchetEngine>(new RatchetEngine(
        role,
        std::move(root_handle_result).Unwrap(),
        std::move(send_chain),
        std::move(recv_chain),
        std::vector<uint8_t>(transfer_id.begin(), transfer_id.end()),
        limits,
        checkpoint.epoch,
        checkpoint.epoch_base));
    return Result<std::unique_ptr<RatchetEngine>, TransferFailure>::Ok(std::move(engine));
}

Result<MessageKey, TransferFailure> RatchetEngine::DeriveFrom(ChainRatchet& chain, const uint64_t index) {
    auto key_result = chain.Derive(index);
    if (key_result.IsOk()) {
        phase_ = RatchetPhase::Active;
    } else if (key_result.UnwrapErr().type == TransferFailureType::RatchetExhausted) {
        if (phase_ != RatchetPhase::Exhausted) {
            TALLOW_LOG_DEBUG("Ratchet epoch {} exhausted at index {}", epoch_, index);
        }
        phase_ = RatchetPhase::Exhausted;
    }
    return key_result;
}

Result<MessageKey, TransferFailure> RatchetEngine::DeriveSendKey(const uint64_t index) {
    return DeriveFrom(send_chain_, index);
}

Result<MessageKey, TransferFailure> RatchetEngine::DeriveRecvKey(const uint64_t index) {
    return DeriveFrom(recv_chain_, index);
}

Result<Unit, TransferFailure> RatchetEngine::ReleaseSend(const uint64_t index) {
    return send_chain_.Release(index);
}

Result<Unit, TransferFailure> RatchetEngine::ReleaseRecv(const uint64_t index) {
    return recv_chain_.Release(index);
}

Result<models::RatchetCheckpoint, TransferFailure> RatchetEngine::Checkpoint() const {
    models::RatchetCheckpoint checkpoint;
    auto root_result = root_key_.ReadBytes(kRootKeyBytes);
    if (root_result.IsErr()) {
        return Result<models::RatchetCheckpoint, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(root_result.UnwrapErr()));
    }
    auto send_result = send_chain_.FrontierChainKey();
    if (send_result.IsErr()) {
        return Result<models::RatchetCheckpoint, TransferFailure>::Err(send_result.UnwrapErr());
    }
    auto recv_result = recv_chain_.FrontierChainKey();
    if (recv_result.IsErr()) {
        return Result<models::RatchetCheckpoint, TransferFailure>::Err(recv_result.UnwrapErr());
    }
    checkpoint.root_key = std::move(root_result).Unwrap();
    checkpoint.send_chain_key = std::move(send_result).Unwrap();
    checkpoint.recv_chain_key = std::move(recv_result).Unwrap();
    checkpoint.send_counter = send_chain_.Frontier();
    checkpoint.recv_counter = recv_chain_.Frontier();
    checkpoint.epoch = epoch_;
    checkpoint.epoch_base = epoch_base_;
    return Result<models::RatchetCheckpoint, TransferFailure>::Ok(std::move(checkpoint));
}

bool RatchetEngine::NeedsRotation(const uint64_t next_index) const noexcept {
    return next_index >= send_chain_.Ceiling() && send_chain_.Ceiling() <= kMaxChunkIndex;
}

Result<Unit, TransferFailure> RatchetEngine::Reseed(
    const SecureMemoryHandle& new_secret,
    const uint64_t base_index) {
    if (new_secret.Size() != kSharedSecretBytes) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("Invalid rotation secret size"));
    }
    if (base_index < epoch_base_ || base_index > kMaxChunkIndex) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Rotation index {} is outside [{}, {}]", base_index, epoch_base_, kMaxChunkIndex)));
    }
    auto secret_result = new_secret.ReadBytes(kSharedSecretBytes);
    if (secret_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(secret_result.UnwrapErr()));
    }
    auto old_root_result = root_key_.ReadBytes(kRootKeyBytes);
    if (old_root_result.IsErr()) {
        auto secret = std::move(secret_result).Unwrap();
        WipeQuietly(secret);
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(old_root_result.UnwrapErr()));
    }
    auto secret = std::move(secret_result).Unwrap();
    auto old_root = std::move(old_root_result).Unwrap();
    auto new_root_result = Hkdf::DeriveLabeled(secret, kRootKeyBytes, old_root, kRootRotationInfo);
    WipeQuietly(secret);
    WipeQuietly(old_root);
    if (new_root_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(new_root_result.UnwrapErr());
    }
    auto new_root = std::move(new_root_result).Unwrap();

    const uint32_t next_epoch = epoch_ + 1;
    auto chains_result = InitializeChains(role_, new_root, transfer_id_, limits_, next_epoch, base_index);
    if (chains_result.IsErr()) {
        WipeQuietly(new_root);
        return Result<Unit, TransferFailure>::Err(chains_result.UnwrapErr());
    }
    auto write_result = root_key_.Write(new_root);
    WipeQuietly(new_root);
    if (write_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    auto chains = std::move(chains_result).Unwrap();
    send_chain_ = std::move(chains.send);
    recv_chain_ = std::move(chains.recv);
    epoch_ = next_epoch;
    epoch_base_ = base_index;
    phase_ = RatchetPhase::Seeded;
    TALLOW_LOG_INFO("Ratchet rotated to epoch {} at index {}", epoch_, epoch_base_);
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, TransferFailure> RatchetEngine::DeriveControlKey() const {
    auto root_result = root_key_.ReadBytes(kRootKeyBytes);
    if (root_result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(root_result.UnwrapErr()));
    }
    auto root = std::move(root_result).Unwrap();
    auto control_key_result = Hkdf::DeriveLabeled(root, kControlKeyBytes, transfer_id_, kControlKeyInfo);
    WipeQuietly(root);
    return control_key_result;
}

}
