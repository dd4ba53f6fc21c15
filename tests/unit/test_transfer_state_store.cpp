#include <catch2/catch_test_macros.hpp>
#include "helpers/transfer_fixtures.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/storage/transfer_state_store.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace tallow::transfer;
using namespace tallow::transfer::models;
using storage::StoreOptions;
using storage::TransferStateStore;
using test_helpers::TempDirectory;

namespace {
    constexpr auto kDay = std::chrono::hours(24);

    TimePoint Now() {
        return std::chrono::floor<std::chrono::seconds>(Clock::now());
    }

    TransferState MakeState(TimePoint now, uint32_t total_chunks = 6,
                            TransferDirection direction = TransferDirection::Send) {
        TransferState state;
        state.transfer_id = TransferId::Generate();
        state.direction = direction;
        state.file_name = "report.pdf";
        state.local_path = "/tmp/report.pdf";
        state.chunk_size = kChunkSize16K;
        state.file_size = static_cast<uint64_t>(total_chunks) * kChunkSize16K - 10;
        state.total_chunks = total_chunks;
        state.file_hash.fill(0xAB);
        state.chunks.resize(total_chunks);
        for (uint32_t i = 0; i < total_chunks; ++i) {
            state.chunks[i].index = i;
            state.chunks[i].plaintext_hash.fill(static_cast<uint8_t>(i));
            state.chunks[i].ciphertext_length = state.ChunkLength(i) + kSha256Bytes;
        }
        state.ratchet_checkpoint.root_key.assign(kRootKeyBytes, 0x01);
        state.ratchet_checkpoint.send_chain_key.assign(kChainKeyBytes, 0x02);
        state.ratchet_checkpoint.recv_chain_key.assign(kChainKeyBytes, 0x03);
        state.status = TransferStatus::Transferring;
        state.created_at = now;
        state.Touch(now);
        return state;
    }

    std::unique_ptr<TransferStateStore> OpenStore(const std::filesystem::path& dir, uint32_t compaction = 64) {
        StoreOptions options;
        options.directory = dir;
        options.sync_writes = false;
        options.compaction_threshold = compaction;
        options.retry_backoff = std::chrono::milliseconds(1);
        auto store = TransferStateStore::Open(std::move(options));
        REQUIRE(store.IsOk());
        return std::move(store).Unwrap();
    }
}

TEST_CASE("TransferStateStore - Save and load", "[storage]") {
    TempDirectory dir("tallow_store");
    auto store = OpenStore(dir.Path());
    const auto now = Now();
    auto state = MakeState(now);
    state.chunks[0].status = ChunkStatus::Acknowledged;
    state.chunks[1].status = ChunkStatus::Sent;
    state.ratchet_checkpoint.send_counter = 1;

    REQUIRE(store->Save(state).IsOk());
    REQUIRE(store->Exists(state.transfer_id));

    auto loaded_result = store->Load(state.transfer_id);
    REQUIRE(loaded_result.IsOk());
    const auto& loaded = loaded_result.Unwrap();
    REQUIRE(loaded.transfer_id == state.transfer_id);
    REQUIRE(loaded.file_name == "report.pdf");
    REQUIRE(loaded.file_size == state.file_size);
    REQUIRE(loaded.total_chunks == 6);
    REQUIRE(loaded.file_hash == state.file_hash);
    REQUIRE(loaded.chunks[0].status == ChunkStatus::Acknowledged);
    REQUIRE(loaded.chunks[1].status == ChunkStatus::Sent);
    REQUIRE(loaded.chunks[5].plaintext_hash == state.chunks[5].plaintext_hash);
    REQUIRE(loaded.ratchet_checkpoint.send_counter == 1);
    REQUIRE(loaded.ratchet_checkpoint.root_key == state.ratchet_checkpoint.root_key);
    REQUIRE(loaded.status == TransferStatus::Transferring);
    REQUIRE(loaded.expires_at == now + kDay * kDefaultCleanupAfterDays);

    SECTION("A fresh store instance reads the same record") {
        auto reopened = OpenStore(dir.Path());
        auto again = reopened->Load(state.transfer_id);
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap().ChunksDone() == 1);
    }

    SECTION("Abort reasons survive") {
        state.status = TransferStatus::Aborted;
        state.abort_reason = AbortReason{TransferFailureType::Transport, "peer gone"};
        REQUIRE(store->Save(state).IsOk());
        auto aborted = store->Load(state.transfer_id);
        REQUIRE(aborted.Unwrap().abort_reason.has_value());
        REQUIRE(aborted.Unwrap().abort_reason->type == TransferFailureType::Transport);
        REQUIRE(aborted.Unwrap().abort_reason->message == "peer gone");
    }
}

TEST_CASE("TransferStateStore - Missing and damaged records", "[storage]") {
    TempDirectory dir("tallow_store_missing");
    auto store = OpenStore(dir.Path());

    auto missing = store->Load(TransferId::Generate());
    REQUIRE(missing.IsErr());
    REQUIRE(missing.UnwrapErr().type == TransferFailureType::NotFound);
    REQUIRE(store->Delete(TransferId::Generate()).UnwrapErr().type == TransferFailureType::NotFound);

    auto state = MakeState(Now());
    REQUIRE(store->Save(state).IsOk());
    const auto record_path = dir.Path() / (state.transfer_id.ToString() + std::string(kRecordSuffix));
    REQUIRE(std::filesystem::exists(record_path));

    auto bytes = test_helpers::ReadFile(record_path);
    bytes[bytes.size() / 2] ^= 0x40;
    test_helpers::WriteFile(record_path, bytes);
    auto damaged = store->Load(state.transfer_id);
    REQUIRE(damaged.IsErr());
    REQUIRE(damaged.UnwrapErr().type == TransferFailureType::Integrity);
}

TEST_CASE("TransferStateStore - Journal updates", "[storage]") {
    TempDirectory dir("tallow_store_journal");
    auto store = OpenStore(dir.Path());
    auto state = MakeState(Now());
    REQUIRE(store->Save(state).IsOk());
    const auto journal_path = dir.Path() / (state.transfer_id.ToString() + std::string(kJournalSuffix));

    state.chunks[0].status = ChunkStatus::Acknowledged;
    state.chunks[2].status = ChunkStatus::Acknowledged;
    state.ratchet_checkpoint.send_counter = 1;
    const std::vector<uint32_t> changed = {0, 2};
    REQUIRE(store->RecordChunkUpdate(state, changed).IsOk());
    REQUIRE(std::filesystem::exists(journal_path));

    SECTION("Load replays the journal over the snapshot") {
        auto reopened = OpenStore(dir.Path());
        auto loaded = reopened->Load(state.transfer_id);
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().chunks[0].status == ChunkStatus::Acknowledged);
        REQUIRE(loaded.Unwrap().chunks[1].status == ChunkStatus::Pending);
        REQUIRE(loaded.Unwrap().chunks[2].status == ChunkStatus::Acknowledged);
        REQUIRE(loaded.Unwrap().ratchet_checkpoint.send_counter == 1);
    }

    SECTION("A torn tail is dropped") {
        {
            std::ofstream out(journal_path, std::ios::binary | std::ios::app);
            const char garbage[] = {0x00, 0x00, 0x10};
            out.write(garbage, sizeof(garbage));
        }
        const auto torn_size = std::filesystem::file_size(journal_path);
        auto reopened = OpenStore(dir.Path());
        auto loaded = reopened->Load(state.transfer_id);
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().ChunksDone() == 2);
        REQUIRE(std::filesystem::file_size(journal_path) == torn_size - 3);
    }

    SECTION("A full save supersedes the journal") {
        state.chunks[1].status = ChunkStatus::Acknowledged;
        REQUIRE(store->Save(state).IsOk());
        REQUIRE_FALSE(std::filesystem::exists(journal_path));
        REQUIRE(store->Load(state.transfer_id).Unwrap().ChunksDone() == 3);
    }
}

TEST_CASE("TransferStateStore - Journal compaction", "[storage]") {
    TempDirectory dir("tallow_store_compact");
    auto store = OpenStore(dir.Path(), 4);
    auto state = MakeState(Now(), 10);
    REQUIRE(store->Save(state).IsOk());
    const auto journal_path = dir.Path() / (state.transfer_id.ToString() + std::string(kJournalSuffix));

    for (uint32_t index = 0; index < 10; ++index) {
        state.chunks[index].status = ChunkStatus::Acknowledged;
        const std::vector<uint32_t> changed = {index};
        REQUIRE(store->RecordChunkUpdate(state, changed).IsOk());
    }
    auto reopened = OpenStore(dir.Path(), 4);
    auto loaded = reopened->Load(state.transfer_id);
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap().ChunksDone() == 10);
    REQUIRE(loaded.Unwrap().Frontier() == 10);
}

TEST_CASE("TransferStateStore - Listing and expiry", "[storage]") {
    TempDirectory dir("tallow_store_expiry");
    auto store = OpenStore(dir.Path());
    const auto now = Now();

    auto fresh = MakeState(now - kDay * 3);
    fresh.status = TransferStatus::Paused;
    auto stale = MakeState(now - kDay * 7 - std::chrono::hours(1));
    stale.status = TransferStatus::Paused;
    auto aborted = MakeState(now - kDay);
    aborted.status = TransferStatus::Aborted;
    aborted.Touch(now - kDay);
    auto completed = MakeState(now - std::chrono::hours(2), 6, TransferDirection::Receive);
    completed.status = TransferStatus::Completed;
    completed.Touch(now - std::chrono::hours(2));

    for (const auto* state : {&fresh, &stale, &aborted, &completed}) {
        REQUIRE(store->Save(*state).IsOk());
    }
    std::filesystem::create_directories(dir.Path() / "nested");
    test_helpers::WriteFile(dir.Path() / "notes.txt", {0x01});

    SECTION("Resumable lists unexpired, incomplete records oldest first") {
        auto listed = store->ListResumable(now);
        REQUIRE(listed.IsOk());
        REQUIRE(listed.Unwrap().size() == 2);
        REQUIRE(listed.Unwrap()[0].transfer_id == fresh.transfer_id);
        REQUIRE(listed.Unwrap()[1].transfer_id == aborted.transfer_id);
    }

    SECTION("Cleanup removes only records past their expiry") {
        std::vector<TransferId> seen;
        auto removed = store->CleanupExpired(now, [&](const TransferState& state) {
            seen.push_back(state.transfer_id);
            return true;
        });
        REQUIRE(removed.IsOk());
        REQUIRE(removed.Unwrap() == 1);
        REQUIRE(seen.size() == 1);
        REQUIRE(seen[0] == stale.transfer_id);
        REQUIRE_FALSE(store->Exists(stale.transfer_id));
        REQUIRE(store->Exists(fresh.transfer_id));
        REQUIRE(store->Exists(completed.transfer_id));
        REQUIRE(std::filesystem::exists(dir.Path() / "notes.txt"));
    }

    SECTION("Cleanup keeps records the caller still needs") {
        auto removed = store->CleanupExpired(now + kDay * 60, [&](const TransferState& state) {
            return state.transfer_id != fresh.transfer_id;
        });
        REQUIRE(removed.IsOk());
        REQUIRE(removed.Unwrap() == 3);
        REQUIRE(store->Exists(fresh.transfer_id));
        REQUIRE_FALSE(store->Exists(stale.transfer_id));
        REQUIRE_FALSE(store->Exists(aborted.transfer_id));
        REQUIRE_FALSE(store->Exists(completed.transfer_id));
    }

    SECTION("Delete removes the record") {
        REQUIRE(store->Delete(fresh.transfer_id).IsOk());
        REQUIRE_FALSE(store->Exists(fresh.transfer_id));
        REQUIRE(store->Load(fresh.transfer_id).UnwrapErr().type == TransferFailureType::NotFound);
    }
}

TEST_CASE("TransferStateStore - Keyed digests", "[storage][security]") {
    TempDirectory dir("tallow_store_keyed");
    StoreOptions options;
    options.directory = dir.Path();
    options.sync_writes = false;
    options.integrity_key.assign(kStoreKeyBytes, 0x55);
    auto store = TransferStateStore::Open(options).Unwrap();
    auto state = MakeState(Now());
    REQUIRE(store->Save(state).IsOk());
    REQUIRE(store->Load(state.transfer_id).IsOk());

    options.integrity_key.assign(kStoreKeyBytes, 0x56);
    auto other = TransferStateStore::Open(options).Unwrap();
    auto result = other->Load(state.transfer_id);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == TransferFailureType::Integrity);

    options.integrity_key.assign(7, 0x01);
    REQUIRE(TransferStateStore::Open(options).IsErr());
}
