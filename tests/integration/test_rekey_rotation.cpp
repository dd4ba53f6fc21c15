#include <catch2/catch_test_macros.hpp>
#include "helpers/transfer_fixtures.hpp"
#include "tallow/transport/in_memory_channel.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::test_helpers;
using models::TransferStatus;
using transport::InMemoryChannel;
namespace pb = tallow::proto::transfer;
using namespace std::chrono_literals;

namespace {

    constexpr uint64_t kRekeyAfter = 32;

    /// Epoch each chunk index was last sent under.
    class EpochLog {
    public:
        void Record(const pb::Frame& frame) {
            if (frame.type() != pb::FRAME_TYPE_CHUNK) {
                return;
            }
            pb::ChunkFrame chunk;
            if (!chunk.ParseFromString(frame.payload())) {
                return;
            }
            std::lock_guard guard(lock_);
            epochs_[chunk.index()] = chunk.epoch();
        }

        std::map<uint32_t, uint32_t> Epochs() const {
            std::lock_guard guard(lock_);
            return epochs_;
        }

    private:
        mutable std::mutex lock_;
        std::map<uint32_t, uint32_t> epochs_;
    };

    configuration::TransferConfig RekeyConfig() {
        auto config = FastConfig();
        config.WithChunkSize(kChunkSize16K)
            .WithRekeyAfterChunks(kRekeyAfter)
            .WithMaxInFlightChunks(8)
            .WithReceiveWindow(64)
            .WithResumeTimeout(5s);
        return config;
    }

}

TEST_CASE("Rekey - Keys rotate every interval of chunks", "[integration][rekey]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_rekey");
    EpochLog log;
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "long.bin", 100 * 16 * 1024 - 7, 32);
    const auto config = RekeyConfig();

    auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
    sender_end->SetSendFilter([&log](pb::Frame& frame) {
        log.Record(frame);
        return true;
    });
    const std::vector<std::filesystem::path> files{source};
    auto send_result = alice.engine->StartSend(files, sender_end, config);
    REQUIRE(send_result.IsOk());
    REQUIRE(bob.engine->StartReceive(receiver_end, config).IsOk());
    const models::TransferId transfer_id = send_result.Unwrap();

    REQUIRE(WaitForStatus(*bob.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(WaitForStatus(*alice.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(HashOf(bob.Downloads() / "long.bin") == HashOf(source));

    const auto epochs = log.Epochs();
    REQUIRE(epochs.size() == 100);
    for (const auto& [index, epoch] : epochs) {
        REQUIRE(epoch == index / kRekeyAfter);
    }
    REQUIRE(epochs.rbegin()->second == 3);

    alice.engine->Shutdown();
    bob.engine->Shutdown();
}

TEST_CASE("Rekey - Rotated epoch survives a restart", "[integration][rekey]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_rekey_restart");
    ChunkGate gate(70);
    EpochLog log;
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "epochs.bin", 90 * 16 * 1024, 33);
    const auto config = RekeyConfig();

    models::TransferId transfer_id;
    {
        auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
        sender_end->SetSendFilter([&gate](pb::Frame& frame) { return gate.Pass(frame); });
        const std::vector<std::filesystem::path> files{source};
        auto send_result = alice.engine->StartSend(files, sender_end, config);
        REQUIRE(send_result.IsOk());
        REQUIRE(bob.engine->StartReceive(receiver_end, config).IsOk());
        transfer_id = send_result.Unwrap();
        REQUIRE(WaitForChunks(*bob.engine, transfer_id, 70));
        REQUIRE(WaitForChunks(*alice.engine, transfer_id, 70));
        alice.engine->Shutdown();
        bob.engine->Shutdown();
    }
    alice.engine.reset();
    bob.engine.reset();
    alice = MakePeer(workspace.Path() / "alice");
    bob = MakePeer(workspace.Path() / "bob");

    auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
    sender_end->SetSendFilter([&log](pb::Frame& frame) {
        log.Record(frame);
        return true;
    });
    REQUIRE(alice.engine->Resume(transfer_id, sender_end, config).IsOk());
    REQUIRE(bob.engine->StartReceive(receiver_end, config).IsOk());

    REQUIRE(WaitForStatus(*bob.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(WaitForStatus(*alice.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(HashOf(bob.Downloads() / "epochs.bin") == HashOf(source));

    const auto epochs = log.Epochs();
    REQUIRE(epochs.size() == 20);
    REQUIRE(epochs.begin()->first == 70);
    for (const auto& [index, epoch] : epochs) {
        REQUIRE(epoch == index / kRekeyAfter);
    }

    alice.engine->Shutdown();
    bob.engine->Shutdown();
}

TEST_CASE("Rekey - Receiver adopts the sender's ratchet limits", "[integration][rekey]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_rekey_limits");
    EpochLog log;
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "limits.bin", 70 * 16 * 1024 + 3, 34);

    auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
    sender_end->SetSendFilter([&log](pb::Frame& frame) {
        log.Record(frame);
        return true;
    });
    const std::vector<std::filesystem::path> files{source};
    auto send_result = alice.engine->StartSend(files, sender_end, RekeyConfig());
    REQUIRE(send_result.IsOk());
    REQUIRE(bob.engine->StartReceive(receiver_end, FastConfig()).IsOk());
    const models::TransferId transfer_id = send_result.Unwrap();

    REQUIRE(WaitForStatus(*bob.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(WaitForStatus(*alice.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(HashOf(bob.Downloads() / "limits.bin") == HashOf(source));
    REQUIRE(log.Epochs().rbegin()->second == 2);

    bob.engine->Shutdown();
    const models::TransferState record = LoadRecord(bob, transfer_id);
    REQUIRE(record.rekey_after_chunks == kRekeyAfter);
    REQUIRE(record.ratchet_window == 64);

    alice.engine->Shutdown();
}
