#pragma once

#include "tallow/core/constants.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/models/transfer_state.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace tallow::transfer::storage {

struct StoreOptions {
    std::filesystem::path directory;
    bool sync_writes = true;
    /// Optional 32-byte key for the record digests.
    std::vector<uint8_t> integrity_key;
    uint32_t compaction_threshold = kJournalCompactionThreshold;
    uint32_t retry_attempts = kDefaultStorageRetryAttempts;
    std::chrono::milliseconds retry_backoff = kDefaultStorageRetryBackoff;
};

/**
 * @brief Durable per-transfer records keyed by transfer id
 *
 * Each transfer has a snapshot "<id>.tstate", replaced atomically by Save,
 * and a journal "<id>.journal" that RecordChunkUpdate appends to so a chunk
 * status change costs one small write instead of a full rewrite. The journal
 * is folded into a new snapshot once it holds compaction_threshold entries.
 *
 * Failed writes are retried retry_attempts times with doubling backoff
 * before a Storage failure is returned.
 *
 * Thread-safe; sessions share one store.
 */
class TransferStateStore {
public:
    static Result<std::unique_ptr<TransferStateStore>, TransferFailure> Open(StoreOptions options);

    TransferStateStore(const TransferStateStore&) = delete;
    TransferStateStore& operator=(const TransferStateStore&) = delete;

    /// Full snapshot; supersedes the journal.
    Result<Unit, TransferFailure> Save(const models::TransferState& state);

    /// Appends the listed chunks and the current checkpoint to the journal.
    Result<Unit, TransferFailure> RecordChunkUpdate(
        const models::TransferState& state,
        std::span<const uint32_t> changed_indices);

    /// Snapshot with the journal replayed on top. A torn journal tail is cut off.
    Result<models::TransferState, TransferFailure> Load(const models::TransferId& transfer_id);

    [[nodiscard]] bool Exists(const models::TransferId& transfer_id) const;

    /// Removes the record and journal. A missing record is NotFound.
    Result<Unit, TransferFailure> Delete(const models::TransferId& transfer_id);

    /// Records with expires_at > now that are not Completed, oldest first.
    Result<std::vector<models::TransferState>, TransferFailure> ListResumable(models::TimePoint now);

    /**
     * @brief Delete every record whose expires_at has passed
     *
     * on_remove sees each record before it goes, so callers can drop
     * partial files that belong to it. A record it returns false for is
     * kept, for transfers that are still running.
     *
     * @return Number of records removed
     */
    Result<size_t, TransferFailure> CleanupExpired(
        models::TimePoint now,
        const std::function<bool(const models::TransferState&)>& on_remove = {});

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return options_.directory; }

private:
    struct JournalInfo {
        uint64_t generation = 0;
        uint32_t entries = 0;
    };

    explicit TransferStateStore(StoreOptions options);

    std::filesystem::path RecordPath(const models::TransferId& transfer_id) const;
    std::filesystem::path JournalPath(const models::TransferId& transfer_id) const;

    Result<Unit, TransferFailure> SaveLocked(const models::TransferState& state);
    Result<models::TransferState, TransferFailure> LoadLocked(const models::TransferId& transfer_id);
    Result<std::vector<models::TransferState>, TransferFailure> LoadAllLocked();

    template<typename F>
    Result<Unit, TransferFailure> WithRetry(std::string_view operation, F&& attempt);

    StoreOptions options_;
    mutable std::mutex lock_;
    std::unordered_map<models::TransferId, JournalInfo> journals_;
};

}
