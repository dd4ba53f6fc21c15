#pragma once
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include "transfer/frame.pb.h"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace tallow::transfer::negotiation {

/**
 * @brief Context bytes mixed into the hybrid combiner
 *
 * transfer_id for the initial negotiation; transfer_id || u32 epoch for a
 * rotation, so every epoch's secret is bound to its transfer and position.
 */
[[nodiscard]] std::vector<uint8_t> NegotiationContext(
    std::span<const uint8_t> transfer_id,
    uint32_t next_epoch);

/**
 * @brief Offering side of the hybrid X25519 + Kyber-768 exchange
 *
 * Start() generates both ephemeral key pairs and the offer; Finish() takes
 * the peer's accept, verifies its key confirmation and returns the combined
 * 32-byte secret. The ephemeral secret keys are released when Finish returns,
 * whether it succeeded or not.
 */
class NegotiationInitiator {
public:
    [[nodiscard]] static Result<std::unique_ptr<NegotiationInitiator>, TransferFailure> Start(
        std::span<const uint8_t> context,
        tallow::proto::transfer::HandshakePurpose purpose,
        uint64_t rekey_at_index);

    [[nodiscard]] const tallow::proto::transfer::HandshakeOffer& Offer() const { return offer_; }

    [[nodiscard]] Result<crypto::SecureMemoryHandle, TransferFailure> Finish(
        const tallow::proto::transfer::HandshakeAccept& accept);

    NegotiationInitiator(const NegotiationInitiator&) = delete;
    NegotiationInitiator& operator=(const NegotiationInitiator&) = delete;
    ~NegotiationInitiator();

private:
    NegotiationInitiator() = default;

    struct State;
    std::unique_ptr<State> state_{};
    std::vector<uint8_t> context_{};
    tallow::proto::transfer::HandshakeOffer offer_{};
};

/// Answering side: validates an offer and produces the accept and the secret.
class NegotiationResponder {
public:
    /// Malformed or invalid peer keys fail with Handshake.
    [[nodiscard]] static Result<std::unique_ptr<NegotiationResponder>, TransferFailure> Process(
        const tallow::proto::transfer::HandshakeOffer& offer,
        std::span<const uint8_t> context);

    [[nodiscard]] const tallow::proto::transfer::HandshakeAccept& Accept() const { return accept_; }

    /// Hands the secret over once; a second call is InvalidState.
    [[nodiscard]] Result<crypto::SecureMemoryHandle, TransferFailure> TakeSharedSecret();

    NegotiationResponder(const NegotiationResponder&) = delete;
    NegotiationResponder& operator=(const NegotiationResponder&) = delete;
    ~NegotiationResponder() = default;

private:
    NegotiationResponder() = default;

    crypto::SecureMemoryHandle shared_secret_{};
    tallow::proto::transfer::HandshakeAccept accept_{};
};

}
