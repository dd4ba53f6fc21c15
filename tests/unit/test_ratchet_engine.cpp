#include <catch2/catch_test_macros.hpp>
#include "tallow/ratchet/ratchet_engine.hpp"
#include "tallow/crypto/secure_memory_handle.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::ratchet;
using crypto::SecureMemoryHandle;

namespace {
    const std::vector<uint8_t> kTransferId(kTransferIdBytes, 0xA7);

    SecureMemoryHandle Secret(uint8_t fill) {
        auto handle = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(kSharedSecretBytes, fill));
        REQUIRE(handle.IsOk());
        return std::move(handle).Unwrap();
    }

    std::unique_ptr<RatchetEngine> Seeded(RatchetRole role, const RatchetLimits& limits = {}) {
        auto engine = RatchetEngine::Seed(role, Secret(0x11), kTransferId, limits);
        REQUIRE(engine.IsOk());
        return std::move(engine).Unwrap();
    }

    std::vector<uint8_t> KeyBytes(const MessageKey& key) {
        return {key.Bytes().begin(), key.Bytes().end()};
    }
}

TEST_CASE("RatchetEngine - Peers derive mirrored chains", "[ratchet]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sender = Seeded(RatchetRole::Initiator);
    auto receiver = Seeded(RatchetRole::Responder);
    REQUIRE(sender->Phase() == RatchetPhase::Seeded);

    for (uint64_t index = 0; index < 20; ++index) {
        auto send_key = sender->DeriveSendKey(index);
        auto recv_key = receiver->DeriveRecvKey(index);
        REQUIRE(send_key.IsOk());
        REQUIRE(recv_key.IsOk());
        REQUIRE(KeyBytes(send_key.Unwrap()) == KeyBytes(recv_key.Unwrap()));
        REQUIRE(sender->ReleaseSend(index).IsOk());
        REQUIRE(receiver->ReleaseRecv(index).IsOk());
    }
    REQUIRE(sender->Phase() == RatchetPhase::Active);

    auto own_recv = sender->DeriveRecvKey(20);
    auto own_send = sender->DeriveSendKey(20);
    REQUIRE(KeyBytes(own_recv.Unwrap()) != KeyBytes(own_send.Unwrap()));

    auto sender_control = sender->DeriveControlKey();
    auto receiver_control = receiver->DeriveControlKey();
    REQUIRE(sender_control.IsOk());
    REQUIRE(sender_control.Unwrap() == receiver_control.Unwrap());
}

TEST_CASE("RatchetEngine - Different secrets or transfers diverge", "[ratchet][security]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto base = Seeded(RatchetRole::Initiator);
    auto other_secret = RatchetEngine::Seed(RatchetRole::Initiator, Secret(0x12), kTransferId, {});
    const std::vector<uint8_t> other_id(kTransferIdBytes, 0xA8);
    auto other_transfer = RatchetEngine::Seed(RatchetRole::Initiator, Secret(0x11), other_id, {});
    REQUIRE(other_secret.IsOk());
    REQUIRE(other_transfer.IsOk());

    const auto reference = KeyBytes(base->DeriveSendKey(0).Unwrap());
    REQUIRE(KeyBytes(other_secret.Unwrap()->DeriveSendKey(0).Unwrap()) != reference);
    REQUIRE(KeyBytes(other_transfer.Unwrap()->DeriveSendKey(0).Unwrap()) != reference);
}

TEST_CASE("RatchetEngine - Checkpoint and restore", "[ratchet]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto sender = Seeded(RatchetRole::Initiator);
    auto receiver = Seeded(RatchetRole::Responder);
    for (uint64_t index = 0; index < 6; ++index) {
        REQUIRE(sender->DeriveSendKey(index).IsOk());
    }
    for (uint64_t index : {0, 1, 2, 4}) {
        REQUIRE(sender->ReleaseSend(index).IsOk());
    }

    auto checkpoint = sender->Checkpoint();
    REQUIRE(checkpoint.IsOk());
    REQUIRE(checkpoint.Unwrap().send_counter == 3);
    REQUIRE(checkpoint.Unwrap().recv_counter == 0);
    REQUIRE(checkpoint.Unwrap().IsComplete());

    const std::vector<uint64_t> released = {4};
    auto restored = RatchetEngine::FromCheckpoint(
        RatchetRole::Initiator, checkpoint.Unwrap(), kTransferId, {}, released);
    REQUIRE(restored.IsOk());
    auto engine = std::move(restored).Unwrap();

    SECTION("Unacknowledged indices re-derive the original keys") {
        for (uint64_t index : {3, 5}) {
            auto key = engine->DeriveSendKey(index);
            REQUIRE(key.IsOk());
            REQUIRE(KeyBytes(key.Unwrap()) == KeyBytes(receiver->DeriveRecvKey(index).Unwrap()));
        }
    }

    SECTION("Acknowledged indices stay released") {
        REQUIRE(engine->DeriveSendKey(2).UnwrapErr().type == TransferFailureType::ReplayAttack);
        REQUIRE(engine->DeriveSendKey(4).UnwrapErr().type == TransferFailureType::ReplayAttack);
    }

    SECTION("Incomplete checkpoints are refused") {
        models::RatchetCheckpoint broken = checkpoint.Unwrap();
        broken.root_key.clear();
        REQUIRE(RatchetEngine::FromCheckpoint(RatchetRole::Initiator, broken, kTransferId, {}).IsErr());
    }
}

TEST_CASE("RatchetEngine - Rotation at the rekey ceiling", "[ratchet]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const RatchetLimits limits{8, 10};
    auto sender = Seeded(RatchetRole::Initiator, limits);
    auto receiver = Seeded(RatchetRole::Responder, limits);
    for (uint64_t index = 0; index < 10; ++index) {
        REQUIRE(sender->DeriveSendKey(index).IsOk());
        REQUIRE(sender->ReleaseSend(index).IsOk());
        REQUIRE(receiver->DeriveRecvKey(index).IsOk());
        REQUIRE(receiver->ReleaseRecv(index).IsOk());
    }

    REQUIRE_FALSE(sender->NeedsRotation(9));
    REQUIRE(sender->NeedsRotation(10));
    auto exhausted = sender->DeriveSendKey(10);
    REQUIRE(exhausted.IsErr());
    REQUIRE(exhausted.UnwrapErr().type == TransferFailureType::RatchetExhausted);
    REQUIRE(sender->Phase() == RatchetPhase::Exhausted);

    const auto old_control = sender->DeriveControlKey().Unwrap();
    REQUIRE(sender->Reseed(Secret(0x33), 10).IsOk());
    REQUIRE(receiver->Reseed(Secret(0x33), 10).IsOk());
    REQUIRE(sender->Epoch() == 1);
    REQUIRE(sender->EpochBase() == 10);
    REQUIRE(sender->Phase() == RatchetPhase::Seeded);
    REQUIRE_FALSE(sender->NeedsRotation(19));
    REQUIRE(sender->NeedsRotation(20));

    auto send_key = sender->DeriveSendKey(10);
    auto recv_key = receiver->DeriveRecvKey(10);
    REQUIRE(send_key.IsOk());
    REQUIRE(send_key.Unwrap().Epoch() == 1);
    REQUIRE(KeyBytes(send_key.Unwrap()) == KeyBytes(recv_key.Unwrap()));

    const auto new_control = sender->DeriveControlKey().Unwrap();
    REQUIRE(new_control != old_control);
    REQUIRE(new_control == receiver->DeriveControlKey().Unwrap());

    SECTION("Rotation cannot move backwards") {
        REQUIRE(sender->Reseed(Secret(0x44), 5).IsErr());
    }
}
