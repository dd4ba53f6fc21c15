#include <catch2/catch_test_macros.hpp>
#include "helpers/transfer_fixtures.hpp"
#include "tallow/transport/in_memory_channel.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
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

    using ChunkEdit = std::function<void(pb::ChunkFrame&)>;

    /// Applies edit to chunk target, for the first `times` transmissions.
    class ChunkTamperer {
    public:
        ChunkTamperer(uint32_t target, uint32_t times, ChunkEdit edit)
            : target_(target), remaining_(times), edit_(std::move(edit)) {}

        bool Apply(pb::Frame& frame) {
            if (frame.type() != pb::FRAME_TYPE_CHUNK) {
                return true;
            }
            pb::ChunkFrame chunk;
            if (!chunk.ParseFromString(frame.payload())) {
                return true;
            }
            std::lock_guard guard(lock_);
            ++sends_[chunk.index()];
            if (chunk.index() != target_ || remaining_ == 0) {
                return true;
            }
            --remaining_;
            edit_(chunk);
            frame.set_payload(chunk.SerializeAsString());
            return true;
        }

        uint32_t SendsOf(uint32_t index) const {
            std::lock_guard guard(lock_);
            const auto it = sends_.find(index);
            return it == sends_.end() ? 0 : it->second;
        }

    private:
        mutable std::mutex lock_;
        uint32_t target_;
        uint32_t remaining_;
        ChunkEdit edit_;
        std::map<uint32_t, uint32_t> sends_;
    };

    void FlipCiphertext(pb::ChunkFrame& chunk) {
        std::string ciphertext = chunk.ciphertext();
        ciphertext[ciphertext.size() / 2] ^= 0x01;
        chunk.set_ciphertext(ciphertext);
    }

    void FlipTag(pb::ChunkFrame& chunk) {
        std::string tag = chunk.tag();
        tag[0] ^= 0x80;
        chunk.set_tag(tag);
    }

    void TruncateCiphertext(pb::ChunkFrame& chunk) {
        std::string ciphertext = chunk.ciphertext();
        ciphertext.pop_back();
        chunk.set_ciphertext(ciphertext);
    }

    models::TransferId Start(Peer& sender, Peer& receiver, const std::filesystem::path& source,
                             ChunkTamperer& tamperer) {
        auto config = FastConfig();
        config.WithChunkSize(kChunkSize16K).WithResumeTimeout(5s);
        auto [sender_end, receiver_end] = InMemoryChannel::CreatePair();
        sender_end->SetSendFilter([&tamperer](pb::Frame& frame) { return tamperer.Apply(frame); });
        const std::vector<std::filesystem::path> files{source};
        auto send_result = sender.engine->StartSend(files, sender_end, config);
        REQUIRE(send_result.IsOk());
        REQUIRE(receiver.engine->StartReceive(receiver_end, config).IsOk());
        return send_result.Unwrap();
    }

}

TEST_CASE("Chunk tampering - A corrupted chunk is fetched again", "[security][tampering]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_tamper_once");

    ChunkEdit edit;
    SECTION("Flipped ciphertext bit") { edit = FlipCiphertext; }
    SECTION("Flipped tag bit") { edit = FlipTag; }
    SECTION("Truncated ciphertext") { edit = TruncateCiphertext; }

    ChunkTamperer tamperer(5, 1, edit);
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "ledger.db", 512 * 1024, 55);

    const models::TransferId transfer_id = Start(alice, bob, source, tamperer);
    REQUIRE(WaitForStatus(*bob.engine, transfer_id, TransferStatus::Completed));
    REQUIRE(WaitForStatus(*alice.engine, transfer_id, TransferStatus::Completed));

    REQUIRE(HashOf(bob.Downloads() / "ledger.db") == HashOf(source));
    REQUIRE(tamperer.SendsOf(5) == 2);
    REQUIRE(tamperer.SendsOf(4) == 1);

    alice.engine->Shutdown();
    bob.engine->Shutdown();
}

TEST_CASE("Chunk tampering - Persistent corruption aborts both sides", "[security][tampering]") {
    InitializeCrypto();
    TempDirectory workspace("tallow_tamper_always");
    ChunkTamperer tamperer(7, 1000, FlipCiphertext);
    Peer alice = MakePeer(workspace.Path() / "alice");
    Peer bob = MakePeer(workspace.Path() / "bob");
    const auto source = WriteRandomFile(workspace.Path() / "ledger.db", 512 * 1024, 56);

    const models::TransferId transfer_id = Start(alice, bob, source, tamperer);
    REQUIRE(WaitForTerminal(*bob.engine, transfer_id));
    REQUIRE(WaitForTerminal(*alice.engine, transfer_id));

    for (Peer* peer : {&alice, &bob}) {
        auto progress = peer->engine->GetProgress(transfer_id);
        REQUIRE(progress.IsOk());
        REQUIRE(progress.Unwrap().status == TransferStatus::Aborted);
        REQUIRE(progress.Unwrap().abort_reason.has_value());
        REQUIRE(progress.Unwrap().abort_reason->type == TransferFailureType::Authentication);
    }
    REQUIRE(tamperer.SendsOf(7) == kMaxConsecutiveChunkFailures);
    REQUIRE_FALSE(std::filesystem::exists(bob.Downloads() / "ledger.db"));

    auto progress = bob.engine->GetProgress(transfer_id);
    REQUIRE(progress.Unwrap().chunks_done < progress.Unwrap().total_chunks);
    const auto& missing = progress.Unwrap().missing_chunks;
    REQUIRE(std::find(missing.begin(), missing.end(), 7u) != missing.end());

    alice.engine->Shutdown();
    bob.engine->Shutdown();
}
