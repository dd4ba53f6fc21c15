#include "tallow/negotiation/session_negotiator.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/crypto/digest.hpp"
#include "tallow/crypto/hkdf.hpp"
#include "tallow/crypto/kyber_interop.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/security/dh_validator.hpp"
#include <string>

namespace tallow::transfer::negotiation {

using crypto::Digest;
using crypto::Hkdf;
using crypto::KyberInterop;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using security::DhValidator;
namespace pb = tallow::proto::transfer;

struct NegotiationInitiator::State {
    SecureMemoryHandle x25519_private;
    SecureMemoryHandle kyber_secret;
};

NegotiationInitiator::~NegotiationInitiator() = default;

namespace {
    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    TransferFailure AsHandshake(const TransferFailure& failure) {
        return TransferFailure::Handshake(failure.message);
    }

    TransferFailure AsHandshake(const SodiumFailure& failure) {
        return TransferFailure::Handshake(failure.message);
    }

    Result<Unit, TransferFailure> ValidateOffer(const pb::HandshakeOffer& offer) {
        if (offer.protocol_version() != kProtocolVersion) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Handshake("Unsupported protocol version in offer"));
        }
        if (auto dh_check = DhValidator::ValidateX25519PublicKey(AsBytes(offer.x25519_public()));
            dh_check.IsErr()) {
            return Result<Unit, TransferFailure>::Err(AsHandshake(dh_check.UnwrapErr()));
        }
        if (auto pq_check = KyberInterop::ValidatePublicKey(AsBytes(offer.kyber_public()));
            pq_check.IsErr()) {
            return Result<Unit, TransferFailure>::Err(AsHandshake(pq_check.UnwrapErr()));
        }
        return Result<Unit, TransferFailure>::Ok(Unit{});
    }

    Result<Unit, TransferFailure> ValidateAccept(const pb::HandshakeAccept& accept) {
        if (auto dh_check = DhValidator::ValidateX25519PublicKey(AsBytes(accept.x25519_public()));
            dh_check.IsErr()) {
            return Result<Unit, TransferFailure>::Err(AsHandshake(dh_check.UnwrapErr()));
        }
        if (auto pq_check = KyberInterop::ValidateCiphertext(AsBytes(accept.kyber_ciphertext()));
            pq_check.IsErr()) {
            return Result<Unit, TransferFailure>::Err(AsHandshake(pq_check.UnwrapErr()));
        }
        if (accept.key_confirmation().size() != kHmacBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Handshake("Invalid key confirmation size"));
        }
        return Result<Unit, TransferFailure>::Ok(Unit{});
    }

    /// HMAC over offer x25519 || offer kyber pk || accept x25519 || kyber ct.
    Result<std::array<uint8_t, kHmacBytes>, TransferFailure> ComputeKeyConfirmation(
        const SecureMemoryHandle& shared_secret,
        std::span<const uint8_t> context,
        const pb::HandshakeOffer& offer,
        const std::string& accept_x25519,
        const std::string& kyber_ciphertext) {
        using MacResult = Result<std::array<uint8_t, kHmacBytes>, TransferFailure>;
        auto key_result = shared_secret.WithReadAccess([&](std::span<const uint8_t> secret) {
            return Hkdf::DeriveLabeled(secret, kHmacBytes, context, kKeyConfirmInfo);
        });
        if (key_result.IsErr()) {
            return MacResult::Err(TransferFailure::FromSodiumFailure(key_result.UnwrapErr()));
        }
        auto derived = std::move(key_result).Unwrap();
        if (derived.IsErr()) {
            return MacResult::Err(derived.UnwrapErr());
        }
        auto confirm_key = std::move(derived).Unwrap();

        std::vector<uint8_t> transcript;
        transcript.reserve(offer.x25519_public().size() + offer.kyber_public().size() +
                           accept_x25519.size() + kyber_ciphertext.size());
        for (const std::string* part : {&offer.x25519_public(), &offer.kyber_public(),
                                        &accept_x25519, &kyber_ciphertext}) {
            transcript.insert(transcript.end(), part->begin(), part->end());
        }
        auto mac_result = Digest::HmacSha256(confirm_key, transcript);
        crypto::WipeQuietly(confirm_key);
        return mac_result;
    }
}

std::vector<uint8_t> NegotiationContext(std::span<const uint8_t> transfer_id, const uint32_t next_epoch) {
    std::vector<uint8_t> context(transfer_id.begin(), transfer_id.end());
    if (next_epoch > 0) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            context.push_back(static_cast<uint8_t>(next_epoch >> shift));
        }
    }
    return context;
}

Result<std::unique_ptr<NegotiationInitiator>, TransferFailure> NegotiationInitiator::Start(
    std::span<const uint8_t> context,
    const pb::HandshakePurpose purpose,
    const uint64_t rekey_at_index) {
    using StartResult = Result<std::unique_ptr<NegotiationInitiator>, TransferFailure>;
    if (context.empty()) {
        return StartResult::Err(TransferFailure::InvalidInput("Negotiation context is empty"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return StartResult::Err(TransferFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto x25519_result = SodiumInterop::GenerateX25519KeyPair("negotiation");
    if (x25519_result.IsErr()) {
        return StartResult::Err(x25519_result.UnwrapErr());
    }
    auto [x25519_private, x25519_public] = std::move(x25519_result).Unwrap();

    auto kyber_result = KyberInterop::GenerateKyber768KeyPair("negotiation");
    if (kyber_result.IsErr()) {
        return StartResult::Err(
            TransferFailure::KeyGeneration(kyber_result.UnwrapErr().message));
    }
    auto [kyber_secret, kyber_public] = std::move(kyber_result).Unwrap();

    std::unique_ptr<NegotiationInitiator> initiator(new NegotiationInitiator());
    initiator->state_ = std::make_unique<State>(State{std::move(x25519_private), std::move(kyber_secret)});
    initiator->context_.assign(context.begin(), context.end());
    initiator->offer_.set_protocol_version(kProtocolVersion);
    initiator->offer_.set_x25519_public(x25519_public.data(), x25519_public.size());
    initiator->offer_.set_kyber_public(kyber_public.data(), kyber_public.size());
    initiator->offer_.set_purpose(purpose);
    initiator->offer_.set_rekey_at_index(rekey_at_index);
    return StartResult::Ok(std::move(initiator));
}

Result<SecureMemoryHandle, TransferFailure> NegotiationInitiator::Finish(const pb::HandshakeAccept& accept) {
    if (!state_) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::InvalidState("Negotiation already finished"));
    }
    // Ephemeral secrets are dropped on every path out of here.
    const std::unique_ptr<State> state = std::move(state_);

    TALLOW_TRY(ValidateAccept(accept));

    auto x25519_ss_result = SodiumInterop::ComputeX25519SharedSecret(
        state->x25519_private, AsBytes(accept.x25519_public()));
    if (x25519_ss_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(AsHandshake(x25519_ss_result.UnwrapErr()));
    }
    auto x25519_ss = std::move(x25519_ss_result).Unwrap();

    auto kyber_ss_result = KyberInterop::Decapsulate(AsBytes(accept.kyber_ciphertext()), state->kyber_secret);
    if (kyber_ss_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::Handshake("Kyber decapsulation failed: " + kyber_ss_result.UnwrapErr().message));
    }
    auto kyber_ss = std::move(kyber_ss_result).Unwrap();

    auto combined_result = KyberInterop::CombineHybridSecrets(x25519_ss, kyber_ss, context_);
    if (combined_result.IsErr()) {
        return combined_result;
    }
    auto combined = std::move(combined_result).Unwrap();

    auto expected_result = ComputeKeyConfirmation(
        combined, context_, offer_, accept.x25519_public(), accept.kyber_ciphertext());
    if (expected_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(expected_result.UnwrapErr());
    }
    auto expected = expected_result.Unwrap();
    auto equal_result = SodiumInterop::ConstantTimeEquals(expected, AsBytes(accept.key_confirmation()));
    crypto::WipeQuietly(expected);
    if (equal_result.IsErr()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::FromSodiumFailure(equal_result.UnwrapErr()));
    }
    if (!equal_result.Unwrap()) {
        TALLOW_LOG_WARN("Key confirmation mismatch during negotiation");
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::Handshake("Key confirmation MAC mismatch"));
    }
    return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(combined));
}

Result<std::unique_ptr<NegotiationResponder>, TransferFailure> NegotiationResponder::Process(
    const pb::HandshakeOffer& offer,
    std::span<const uint8_t> context) {
    using ProcessResult = Result<std::unique_ptr<NegotiationResponder>, TransferFailure>;
    if (context.empty()) {
        return ProcessResult::Err(TransferFailure::InvalidInput("Negotiation context is empty"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return ProcessResult::Err(TransferFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    TALLOW_TRY(ValidateOffer(offer));

    auto x25519_result = SodiumInterop::GenerateX25519KeyPair("negotiation");
    if (x25519_result.IsErr()) {
        return ProcessResult::Err(x25519_result.UnwrapErr());
    }
    auto [x25519_private, x25519_public] = std::move(x25519_result).Unwrap();

    auto x25519_ss_result = SodiumInterop::ComputeX25519SharedSecret(
        x25519_private, AsBytes(offer.x25519_public()));
    if (x25519_ss_result.IsErr()) {
        return ProcessResult::Err(AsHandshake(x25519_ss_result.UnwrapErr()));
    }
    auto x25519_ss = std::move(x25519_ss_result).Unwrap();
    x25519_private = SecureMemoryHandle();

    auto encap_result = KyberInterop::Encapsulate(AsBytes(offer.kyber_public()));
    if (encap_result.IsErr()) {
        return ProcessResult::Err(
            TransferFailure::Handshake("Kyber encapsulation failed: " + encap_result.UnwrapErr().message));
    }
    auto [kyber_ciphertext, kyber_ss] = std::move(encap_result).Unwrap();

    auto combined_result = KyberInterop::CombineHybridSecrets(x25519_ss, kyber_ss, context);
    if (combined_result.IsErr()) {
        return ProcessResult::Err(combined_result.UnwrapErr());
    }

    std::unique_ptr<NegotiationResponder> responder(new NegotiationResponder());
    responder->shared_secret_ = std::move(combined_result).Unwrap();
    responder->accept_.set_x25519_public(x25519_public.data(), x25519_public.size());
    responder->accept_.set_kyber_ciphertext(kyber_ciphertext.data(), kyber_ciphertext.size());

    auto mac_result = ComputeKeyConfirmation(
        responder->shared_secret_, context, offer,
        responder->accept_.x25519_public(), responder->accept_.kyber_ciphertext());
    if (mac_result.IsErr()) {
        return ProcessResult::Err(mac_result.UnwrapErr());
    }
    const auto& mac = mac_result.Unwrap();
    responder->accept_.set_key_confirmation(mac.data(), mac.size());
    return ProcessResult::Ok(std::move(responder));
}

Result<SecureMemoryHandle, TransferFailure> NegotiationResponder::TakeSharedSecret() {
    if (shared_secret_.IsInvalid()) {
        return Result<SecureMemoryHandle, TransferFailure>::Err(
            TransferFailure::InvalidState("Shared secret already taken"));
    }
    return Result<SecureMemoryHandle, TransferFailure>::Ok(std::move(shared_secret_));
}

}
