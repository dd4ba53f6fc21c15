#include "tallow/storage/transfer_state_store.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/storage/file_io.hpp"
#include "tallow/storage/record_codec.hpp"
#include <algorithm>
#include <fcntl.h>
#include <format>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace tallow::transfer::storage {

using models::TransferId;
using models::TransferState;

namespace {
    constexpr size_t kMaxRecordFileBytes = 512u * 1024u * 1024u;
    constexpr size_t kMaxJournalFileBytes = 64u * 1024u * 1024u;

    uint64_t NextGeneration(const uint64_t previous) {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        const auto wall = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
        return std::max(previous + 1, wall);
    }

    bool HasSuffix(const std::filesystem::path& path, std::string_view suffix) {
        const std::string name = path.filename().string();
        return name.size() > suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

TransferStateStore::TransferStateStore(StoreOptions options)
    : options_(std::move(options)) {}

Result<std::unique_ptr<TransferStateStore>, TransferFailure> TransferStateStore::Open(StoreOptions options) {
    if (options.directory.empty()) {
        return Result<std::unique_ptr<TransferStateStore>, TransferFailure>::Err(
            TransferFailure::InvalidInput("State directory is required"));
    }
    if (!options.integrity_key.empty() && options.integrity_key.size() != kStoreKeyBytes) {
        return Result<std::unique_ptr<TransferStateStore>, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Store integrity key must be {} bytes", kStoreKeyBytes)));
    }
    if (options.compaction_threshold == 0) {
        return Result<std::unique_ptr<TransferStateStore>, TransferFailure>::Err(
            TransferFailure::InvalidInput("Journal compaction threshold must be positive"));
    }
    std::error_code error;
    std::filesystem::create_directories(options.directory, error);
    if (error) {
        return Result<std::unique_ptr<TransferStateStore>, TransferFailure>::Err(
            TransferFailure::Storage(
                std::format("Cannot create {}: {}", options.directory.string(), error.message())));
    }
    return Result<std::unique_ptr<TransferStateStore>, TransferFailure>::Ok(
        std::unique_ptr<TransferStateStore>(new TransferStateStore(std::move(options))));
}

std::filesystem::path TransferStateStore::RecordPath(const TransferId& transfer_id) const {
    return options_.directory / (transfer_id.ToString() + std::string(kRecordSuffix));
}

std::filesystem::path TransferStateStore::JournalPath(const TransferId& transfer_id) const {
    return options_.directory / (transfer_id.ToString() + std::string(kJournalSuffix));
}

template<typename F>
Result<Unit, TransferFailure> TransferStateStore::WithRetry(std::string_view operation, F&& attempt) {
    auto backoff = options_.retry_backoff;
    const uint32_t attempts = std::max<uint32_t>(1, options_.retry_attempts);
    for (uint32_t i = 1;; ++i) {
        auto result = attempt();
        if (result.IsOk() || result.UnwrapErr().type != TransferFailureType::Storage || i >= attempts) {
            return result;
        }
        TALLOW_LOG_WARN("{} failed (attempt {}/{}): {}", operation, i, attempts, result.UnwrapErr().message);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

Result<Unit, TransferFailure> TransferStateStore::Save(const TransferState& state) {
    std::lock_guard guard(lock_);
    return SaveLocked(state);
}

Result<Unit, TransferFailure> TransferStateStore::SaveLocked(const TransferState& state) {
    JournalInfo& info = journals_[state.transfer_id];
    const uint64_t generation = NextGeneration(info.generation);
    auto encoded_result = TransferRecordCodec::EncodeRecord(state, generation, options_.integrity_key);
    if (encoded_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(encoded_result.UnwrapErr());
    }
    auto encoded = std::move(encoded_result).Unwrap();
    const auto record_path = RecordPath(state.transfer_id);
    auto write_result = WithRetry("Record save", [&] {
        return FileIo::WriteFileAtomically(record_path, encoded, options_.sync_writes);
    });
    crypto::WipeQuietly(encoded);
    if (write_result.IsErr()) {
        return write_result;
    }
    info.generation = generation;
    info.entries = 0;
    return FileIo::RemoveIfExists(JournalPath(state.transfer_id));
}

Result<Unit, TransferFailure> TransferStateStore::RecordChunkUpdate(
    const TransferState& state,
    std::span<const uint32_t> changed_indices) {
    std::lock_guard guard(lock_);
    auto it = journals_.find(state.transfer_id);
    if (it == journals_.end() || it->second.generation == 0) {
        return SaveLocked(state);
    }
    JournalInfo& info = it->second;
    if (info.entries + 1 >= options_.compaction_threshold) {
        TALLOW_LOG_DEBUG("Compacting journal of {}", state.transfer_id.ToString());
        return SaveLocked(state);
    }
    auto entry_result = TransferRecordCodec::EncodeJournalEntry(
        state, changed_indices, info.generation, options_.integrity_key);
    if (entry_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(entry_result.UnwrapErr());
    }
    auto entry = std::move(entry_result).Unwrap();
    const auto journal_path = JournalPath(state.transfer_id);
    auto append_result = WithRetry("Journal append", [&]() -> Result<Unit, TransferFailure> {
        auto fd_result = FileIo::Open(journal_path, O_CREAT | O_WRONLY | O_APPEND);
        if (fd_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(fd_result.UnwrapErr());
        }
        auto fd = std::move(fd_result).Unwrap();
        auto write_result = FileIo::WriteAll(fd.Get(), entry);
        if (write_result.IsOk() && options_.sync_writes) {
            write_result = FileIo::Sync(fd.Get(), true);
        }
        if (write_result.IsErr()) {
            return write_result;
        }
        return fd.Close();
    });
    crypto::WipeQuietly(entry);
    if (append_result.IsOk()) {
        ++info.entries;
    }
    return append_result;
}

Result<TransferState, TransferFailure> TransferStateStore::Load(const TransferId& transfer_id) {
    std::lock_guard guard(lock_);
    return LoadLocked(transfer_id);
}

Result<TransferState, TransferFailure> TransferStateStore::LoadLocked(const TransferId& transfer_id) {
    auto bytes_result = FileIo::ReadWholeFile(RecordPath(transfer_id), kMaxRecordFileBytes);
    if (bytes_result.IsErr()) {
        return Result<TransferState, TransferFailure>::Err(bytes_result.UnwrapErr());
    }
    auto bytes = std::move(bytes_result).Unwrap();
    auto decoded_result = TransferRecordCodec::DecodeRecord(bytes, options_.integrity_key);
    crypto::WipeQuietly(bytes);
    if (decoded_result.IsErr()) {
        return Result<TransferState, TransferFailure>::Err(decoded_result.UnwrapErr());
    }
    auto decoded = std::move(decoded_result).Unwrap();
    if (decoded.state.transfer_id != transfer_id) {
        return Result<TransferState, TransferFailure>::Err(
            TransferFailure::Integrity("Record file holds a different transfer id"));
    }

    JournalInfo info{decoded.generation, 0};
    const auto journal_path = JournalPath(transfer_id);
    auto journal_result = FileIo::ReadWholeFile(journal_path, kMaxJournalFileBytes);
    if (journal_result.IsOk()) {
        auto journal = std::move(journal_result).Unwrap();
        auto replay_result = TransferRecordCodec::ReplayJournal(
            journal, options_.integrity_key, decoded.generation, decoded.state);
        crypto::WipeQuietly(journal);
        if (replay_result.IsErr()) {
            return Result<TransferState, TransferFailure>::Err(replay_result.UnwrapErr());
        }
        const auto& replay = replay_result.Unwrap();
        if (replay.torn_tail) {
            TALLOW_LOG_WARN("Discarding torn journal tail of {} after {} bytes",
                            transfer_id.ToString(), replay.valid_bytes);
            if (::truncate(journal_path.c_str(), static_cast<off_t>(replay.valid_bytes)) != 0) {
                return Result<TransferState, TransferFailure>::Err(
                    TransferFailure::Storage(
                        std::format("Cannot truncate {}", journal_path.string())));
            }
        }
        info.entries = static_cast<uint32_t>(replay.applied_entries + replay.stale_entries);
    } else if (journal_result.UnwrapErr().type != TransferFailureType::NotFound) {
        return Result<TransferState, TransferFailure>::Err(journal_result.UnwrapErr());
    }
    journals_[transfer_id] = info;
    return Result<TransferState, TransferFailure>::Ok(std::move(decoded.state));
}

bool TransferStateStore::Exists(const TransferId& transfer_id) const {
    std::error_code error;
    return std::filesystem::exists(RecordPath(transfer_id), error);
}

Result<Unit, TransferFailure> TransferStateStore::Delete(const TransferId& transfer_id) {
    std::lock_guard guard(lock_);
    if (!Exists(transfer_id)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::NotFound(std::format("No record for {}", transfer_id.ToString())));
    }
    journals_.erase(transfer_id);
    if (auto removed = FileIo::RemoveIfExists(JournalPath(transfer_id)); removed.IsErr()) {
        return removed;
    }
    auto removed = FileIo::RemoveIfExists(RecordPath(transfer_id));
    if (removed.IsOk() && options_.sync_writes) {
        return FileIo::SyncParentDirectory(RecordPath(transfer_id));
    }
    return removed;
}

Result<std::vector<TransferState>, TransferFailure> TransferStateStore::LoadAllLocked() {
    std::vector<TransferState> states;
    std::error_code error;
    std::filesystem::directory_iterator it(options_.directory, error);
    if (error) {
        return Result<std::vector<TransferState>, TransferFailure>::Err(
            TransferFailure::Storage(
                std::format("Cannot list {}: {}", options_.directory.string(), error.message())));
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(error) || !HasSuffix(entry.path(), kRecordSuffix)) {
            continue;
        }
        auto id_result = TransferId::Parse(entry.path().stem().string());
        if (id_result.IsErr()) {
            TALLOW_LOG_WARN("Ignoring unexpected file {}", entry.path().string());
            continue;
        }
        auto state_result = LoadLocked(id_result.Unwrap());
        if (state_result.IsErr()) {
            TALLOW_LOG_WARN("Skipping unreadable record {}: {}",
                            entry.path().filename().string(), state_result.UnwrapErr().Describe());
            continue;
        }
        states.push_back(std::move(state_result).Unwrap());
    }
    return Result<std::vector<TransferState>, TransferFailure>::Ok(std::move(states));
}

Result<std::vector<TransferState>, TransferFailure> TransferStateStore::ListResumable(const models::TimePoint now) {
    std::lock_guard guard(lock_);
    auto all_result = LoadAllLocked();
    if (all_result.IsErr()) {
        return all_result;
    }
    auto all = std::move(all_result).Unwrap();
    std::vector<TransferState> resumable;
    for (auto& state : all) {
        if (state.expires_at > now && state.status != models::TransferStatus::Completed) {
            resumable.push_back(std::move(state));
        }
    }
    std::sort(resumable.begin(), resumable.end(), [](const TransferState& a, const TransferState& b) {
        return a.last_updated_at < b.last_updated_at;
    });
    return Result<std::vector<TransferState>, TransferFailure>::Ok(std::move(resumable));
}

Result<size_t, TransferFailure> TransferStateStore::CleanupExpired(
    const models::TimePoint now,
    const std::function<bool(const TransferState&)>& on_remove) {
    std::lock_guard guard(lock_);
    auto all_result = LoadAllLocked();
    if (all_result.IsErr()) {
        return Result<size_t, TransferFailure>::Err(all_result.UnwrapErr());
    }
    size_t removed = 0;
    for (const auto& state : all_result.Unwrap()) {
        if (state.expires_at > now) {
            continue;
        }
        if (on_remove && !on_remove(state)) {
            continue;
        }
        journals_.erase(state.transfer_id);
        if (auto result = FileIo::RemoveIfExists(JournalPath(state.transfer_id)); result.IsErr()) {
            return Result<size_t, TransferFailure>::Err(result.UnwrapErr());
        }
        if (auto result = FileIo::RemoveIfExists(RecordPath(state.transfer_id)); result.IsErr()) {
            return Result<size_t, TransferFailure>::Err(result.UnwrapErr());
        }
        TALLOW_LOG_INFO("Removed expired {} record {}", models::ToString(state.status),
                        state.transfer_id.ToString());
        ++removed;
    }
    return Result<size_t, TransferFailure>::Ok(removed);
}

}
