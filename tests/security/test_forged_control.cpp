#include <catch2/catch_test_macros.hpp>
#include "helpers/transfer_fixtures.hpp"
#include "tallow/cipher/control_cipher.hpp"
#include "tallow/transport/in_memory_channel.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::test_helpers;
using models::TransferStatus;
using transport::InMemoryChannel;
namespace pb = tallow::proto::transfer;
using namespace std::chrono_literals;

namespace {

    std::string IdBytes(const models::TransferId& transfer_id) {
        return std::string(transfer_id.Bytes().begin(), transfer_id.Bytes().end());
    }

    pb::Frame MakeFrame(pb::FrameType type, const models::TransferId& transfer_id, const std::string& payload) {
        pb::Frame frame;
        frame.set_type(type);
        frame.set_transfer_id(IdBytes(transfer_id));
        frame.set_payload(payload);
        return frame;
    }

    /// Control body sealed the way a peer would, but under a key of the attacker's choosing.
    pb::Frame SealUnder(const std::vector<uint8_t>& key, const models::TransferId& transfer_id,
                        pb::FrameType type, const google::protobuf::Message& body) {
        const std::string plaintext = body.SerializeAsString();
        auto sealed = cipher::ControlCipher::Seal(
            key, transfer_id.Bytes(), static_cast<uint32_t>(type), 0,
            std::span(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()));
        REQUIRE(sealed.IsOk());
        pb::SealedBody envelope;
        envelope.set_epoch(sealed.Unwrap().epoch);
        envelope.set_nonce(std::string(sealed.Unwrap().nonce.begin(), sealed.Unwrap().nonce.end()));
        envelope.set_ciphertext(std::string(sealed.Unwrap().ciphertext.begin(), sealed.Unwrap().ciphertext.end()));
        return MakeFrame(type, transfer_id, envelope.SerializeAsString());
    }

    /// Slows the sender so injected frames land mid-transfer.
    bool Throttle(pb::Frame& frame) {
        if (frame.type() == pb::FRAME_TYPE_CHUNK) {
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }

    configuration::TransferConfig ForgeryConfig() {
        auto config = FastConfig();
        config.WithChunkSize(kChunkSize16K).WithResumeTimeout(5s);
        return config;
    }

}

TEST_CASE("Forged control - Frames without the control key are ignored", "[security][control]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_forged");
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "contract.pdf", 2 * 1024 * 1024, 66);
    const auto config = ForgeryConfig();

    auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
    sender_end->SetSendFilter(Throttle);
    const std::vector<std::filesystem::path> files{source};
    auto send_result = alice.engine->StartSend(files, sender_end, config);
    REQUIRE(send_result.IsOk());
    REQUIRE(bob.engine->StartReceive(receiver_end, config).IsOk());
    const models::TransferId transfer_id = send_result.Unwrap();
    REQUIRE(WaitForChunks(*bob.engine, transfer_id, 8));

    const std::vector<uint8_t> attacker_key = RandomBytes(kControlKeyBytes, 99);

    pb::Control cancel;
    cancel.mutable_cancel();
    REQUIRE(sender_end->Send(SealUnder(attacker_key, transfer_id, pb::FRAME_TYPE_CONTROL, cancel)).IsOk());

    pb::Control abort;
    abort.mutable_abort()->set_reason(static_cast<uint32_t>(TransferFailureType::Integrity));
    abort.mutable_abort()->set_message("forged");
    REQUIRE(receiver_end->Send(SealUnder(attacker_key, transfer_id, pb::FRAME_TYPE_CONTROL, abort)).IsOk());

    pb::Control complete;
    complete.mutable_complete()->set_file_hash(std::string(kSha256Bytes, '\0'));
    REQUIRE(receiver_end->Send(SealUnder(attacker_key, transfer_id, pb::FRAME_TYPE_CONTROL, complete)).IsOk());

    pb::AckFrame ack;
    for (uint32_t index = 0; index < 128; ++index) {
        ack.add_indices(index);
    }
    REQUIRE(receiver_end->Send(SealUnder(attacker_key, transfer_id, pb::FRAME_TYPE_ACK, ack)).IsOk());

    pb::Control retransmit;
    retransmit.mutable_retransmit()->add_indices(0);
    REQUIRE(sender_end->Send(SealUnder(attacker_key, transfer_id, pb::FRAME_TYPE_CONTROL, retransmit)).IsOk());

    REQUIRE(sender_end->Send(MakeFrame(pb::FRAME_TYPE_CONTROL, transfer_id, "not a sealed body")).IsOk());
    REQUIRE(receiver_end->Send(MakeFrame(pb::FRAME_TYPE_ACK, transfer_id, std::string(40, '\x7f'))).IsOk());

    REQUIRE(WaitForStatus(*bob.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(WaitForStatus(*alice.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(HashOf(bob.Downloads() / "contract.pdf") == HashOf(source));

    alice.engine->Shutdown();
    bob.engine->Shutdown();
}

TEST_CASE("Forged control - Sealed bodies are bound to their frame type", "[security][control]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_confused");
    std::mutex captured_lock;
    std::optional<pb::Frame> captured_ack;
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "keys.tar", 2 * 1024 * 1024, 67);
    const auto config = ForgeryConfig();

    auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
    sender_end->SetSendFilter(Throttle);
    receiver_end->SetSendFilter([&](pb::Frame& frame) {
        if (frame.type() == pb::FRAME_TYPE_ACK) {
            std::lock_guard guard(captured_lock);
            if (!captured_ack.has_value()) {
                captured_ack = frame;
            }
        }
        return true;
    });
    const std::vector<std::filesystem::path> files{source};
    auto send_result = alice.engine->StartSend(files, sender_end, config);
    REQUIRE(send_result.IsOk());
    REQUIRE(bob.engine->StartReceive(receiver_end, config).IsOk());
    const models::TransferId transfer_id = send_result.Unwrap();

    REQUIRE(WaitUntil([&] {
        std::lock_guard guard(captured_lock);
        return captured_ack.has_value();
    }));
    pb::Frame confused;
    {
        std::lock_guard guard(captured_lock);
        confused = *captured_ack;
    }
    // A genuine acknowledgement presented as a control frame, and replayed as
    // itself, must neither disturb the sender nor reach the receiver's logic.
    confused.set_type(pb::FRAME_TYPE_CONTROL);
    REQUIRE(receiver_end->Send(confused).IsOk());
    REQUIRE(sender_end->Send(confused).IsOk());
    confused.set_type(pb::FRAME_TYPE_ACK);
    REQUIRE(receiver_end->Send(confused).IsOk());

    pb::Frame foreign = confused;
    foreign.set_transfer_id(IdBytes(models::TransferId::Generate()));
    foreign.set_type(pb::FRAME_TYPE_CONTROL);
    REQUIRE(receiver_end->Send(foreign).IsOk());

    REQUIRE(WaitForStatus(*bob.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(WaitForStatus(*alice.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(HashOf(bob.Downloads() / "keys.tar") == HashOf(source));

    alice.engine->Shutdown();
    bob.engine->Shutdown();
}
