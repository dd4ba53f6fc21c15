#include "tallow/ratchet/chain_ratchet.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/crypto/hkdf.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include <format>
#include <utility>

namespace tallow::transfer::ratchet {

using crypto::Hkdf;
using crypto::SecureMemoryHandle;
using crypto::WipeQuietly;

namespace {
    Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, TransferFailure>
    DeriveMessageAndChainKey(std::span<const uint8_t> chain_key) {
        auto message_key_result = Hkdf::DeriveLabeled(chain_key, kMessageKeyBytes, {}, kMessageInfo);
        if (message_key_result.IsErr()) {
            return Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, TransferFailure>::Err(
                message_key_result.UnwrapErr());
        }
        auto next_chain_key_result = Hkdf::DeriveLabeled(chain_key, kChainKeyBytes, {}, kChainInfo);
        if (next_chain_key_result.IsErr()) {
            auto message_key = std::move(message_key_result).Unwrap();
            WipeQuietly(message_key);
            return Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, TransferFailure>::Err(
                next_chain_key_result.UnwrapErr());
        }
        return Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, TransferFailure>::Ok(
            std::make_pair(std::move(message_key_result).Unwrap(), std::move(next_chain_key_result).Unwrap()));
    }
}

ChainRatchet::ChainRatchet(SecureMemoryHandle head_key, const uint64_t frontier,
                           const uint64_t ceiling, const uint32_t window, const uint32_t epoch) noexcept
    : head_key_(std::move(head_key)),
      head_(frontier),
      frontier_(frontier),
      ceiling_(ceiling),
      window_(window),
      epoch_(epoch) {}

Result<ChainRatchet, TransferFailure> ChainRatchet::Create(
    std::span<const uint8_t> chain_key,
    const uint64_t frontier,
    const uint64_t ceiling,
    const uint32_t window,
    const uint32_t epoch) {
    if (chain_key.size() != kChainKeyBytes) {
        return Result<ChainRatchet, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Chain key must be {} bytes, got {}", kChainKeyBytes, chain_key.size())));
    }
    if (window == 0) {
        return Result<ChainRatchet, TransferFailure>::Err(
            TransferFailure::InvalidInput("Ratchet window must be at least 1"));
    }
    if (frontier > ceiling) {
        return Result<ChainRatchet, TransferFailure>::Err(
            TransferFailure::InvalidInput("Chain frontier lies beyond its ceiling"));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(chain_key);
    if (handle_result.IsErr()) {
        return Result<ChainRatchet, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<ChainRatchet, TransferFailure>::Ok(
        ChainRatchet(std::move(handle_result).Unwrap(), frontier, ceiling, window, epoch));
}

ChainRatchet& ChainRatchet::operator=(ChainRatchet&& other) noexcept {
    if (this != &other) {
        WipeCache();
        head_key_ = std::move(other.head_key_);
        head_ = other.head_;
        frontier_ = other.frontier_;
        ceiling_ = other.ceiling_;
        window_ = other.window_;
        epoch_ = other.epoch_;
        derivation_count_ = other.derivation_count_;
        pending_ = std::move(other.pending_);
        released_ahead_ = std::move(other.released_ahead_);
        other.pending_.clear();
        other.released_ahead_.clear();
    }
    return *this;
}

ChainRatchet::~ChainRatchet() {
    WipeCache();
}

void ChainRatchet::WipeCache() noexcept {
    for (auto& [index, entry] : pending_) {
        WipeQuietly(entry.message_key);
        WipeQuietly(entry.chain_key);
    }
    pending_.clear();
}

Result<MessageKey, TransferFailure> ChainRatchet::Derive(const uint64_t index) {
    if (index < frontier_ || released_ahead_.contains(index)) {
        return Result<MessageKey, TransferFailure>::Err(
            TransferFailure::ReplayAttack(
                std::format("Message key {} was already released", index)));
    }
    if (auto it = pending_.find(index); it != pending_.end()) {
        return Result<MessageKey, TransferFailure>::Ok(
            MessageKey(index, epoch_, it->second.message_key));
    }
    if (index >= ceiling_) {
        return Result<MessageKey, TransferFailure>::Err(
            TransferFailure::RatchetExhausted(
                std::format("Index {} reached the epoch ceiling {}", index, ceiling_)));
    }
    if (index - frontier_ >= window_) {
        return Result<MessageKey, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Index {} is outside the window [{}, {})", index, frontier_, frontier_ + window_)));
    }

    while (head_ <= index) {
        const bool cache = !released_ahead_.contains(head_);
        auto step_result = StepHead(cache);
        if (step_result.IsErr()) {
            return Result<MessageKey, TransferFailure>::Err(step_result.UnwrapErr());
        }
    }
    auto it = pending_.find(index);
    if (it == pending_.end()) {
        return Result<MessageKey, TransferFailure>::Err(
            TransferFailure::InvalidState("Derived message key missing from cache"));
    }
    return Result<MessageKey, TransferFailure>::Ok(
        MessageKey(index, epoch_, it->second.message_key));
}

Result<Unit, TransferFailure> ChainRatchet::StepHead(const bool cache) {
    auto chain_key_result = head_key_.ReadBytes(kChainKeyBytes);
    if (chain_key_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(chain_key_result.UnwrapErr()));
    }
    auto chain_key = std::move(chain_key_result).Unwrap();
    auto derived_result = DeriveMessageAndChainKey(chain_key);
    if (derived_result.IsErr()) {
        WipeQuietly(chain_key);
        return Result<Unit, TransferFailure>::Err(derived_result.UnwrapErr());
    }
    auto [message_key, next_chain_key] = std::move(derived_result).Unwrap();

    auto write_result = head_key_.Write(next_chain_key);
    WipeQuietly(next_chain_key);
    if (write_result.IsErr()) {
        WipeQuietly(chain_key);
        WipeQuietly(message_key);
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    if (cache) {
        pending_.emplace(head_, PendingKey{std::move(message_key), std::move(chain_key)});
    } else {
        WipeQuietly(chain_key);
        WipeQuietly(message_key);
    }
    ++head_;
    ++derivation_count_;
    return Result<Unit, TransferFailure>::Ok(unit);
}

void ChainRatchet::Evict(std::map<uint64_t, PendingKey>::iterator it) {
    WipeQuietly(it->second.message_key);
    WipeQuietly(it->second.chain_key);
    pending_.erase(it);
}

Result<Unit, TransferFailure> ChainRatchet::Release(const uint64_t index) {
    if (index < frontier_ || released_ahead_.contains(index)) {
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    if (index >= ceiling_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Cannot release index {} beyond ceiling {}", index, ceiling_)));
    }
    if (auto it = pending_.find(index); it != pending_.end()) {
        Evict(it);
    }
    released_ahead_.insert(index);
    return AdvanceFrontier();
}

Result<Unit, TransferFailure> ChainRatchet::AdvanceFrontier() {
    while (released_ahead_.contains(frontier_)) {
        released_ahead_.erase(frontier_);
        ++frontier_;
    }
    // Skipped indices past the head still have to be stepped over so the
    // frontier chain key stays known.
    while (head_ < frontier_) {
        auto step_result = StepHead(false);
        if (step_result.IsErr()) {
            return step_result;
        }
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, TransferFailure> ChainRatchet::FrontierChainKey() const {
    if (frontier_ == head_) {
        auto read_result = head_key_.ReadBytes(kChainKeyBytes);
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(read_result).Unwrap());
    }
    auto it = pending_.find(frontier_);
    if (it == pending_.end()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidState(
                std::format("No chain key cached for frontier {}", frontier_)));
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(it->second.chain_key);
}

}
