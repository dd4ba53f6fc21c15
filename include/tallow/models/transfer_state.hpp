#pragma once

#include "tallow/core/constants.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/models/ratchet_checkpoint.hpp"
#include "tallow/models/transfer_id.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tallow::transfer::models {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Values are persisted; append only.
enum class ChunkStatus : uint8_t {
    Pending = 0,
    Sent = 1,
    Acknowledged = 2,
    Received = 3,
    Verified = 4,
    Failed = 5
};

enum class TransferDirection : uint8_t {
    Send = 0,
    Receive = 1
};

enum class TransferStatus : uint8_t {
    Negotiating = 0,
    Transferring = 1,
    Paused = 2,
    Resuming = 3,
    Completed = 4,
    Aborted = 5
};

[[nodiscard]] std::string_view ToString(ChunkStatus status) noexcept;
[[nodiscard]] std::string_view ToString(TransferDirection direction) noexcept;
[[nodiscard]] std::string_view ToString(TransferStatus status) noexcept;

[[nodiscard]] inline bool IsTerminal(const TransferStatus status) noexcept {
    return status == TransferStatus::Completed || status == TransferStatus::Aborted;
}

struct ChunkRecord {
    uint32_t index = 0;
    std::array<uint8_t, kSha256Bytes> plaintext_hash{};
    uint32_t ciphertext_length = 0;
    ChunkStatus status = ChunkStatus::Pending;
};

struct AbortReason {
    TransferFailureType type = TransferFailureType::Generic;
    std::string message;

    [[nodiscard]] static AbortReason FromFailure(const TransferFailure& failure) {
        return AbortReason{failure.type, failure.message};
    }
};

/**
 * @brief Everything needed to continue one transfer after a crash
 *
 * Owned by the session controller for the lifetime of the transfer and
 * persisted by TransferStateStore after every state-changing event.
 * chunks.size() == total_chunks always holds once the manifest is known.
 */
struct TransferState {
    TransferId transfer_id;
    TransferDirection direction = TransferDirection::Send;
    std::string file_name;
    /// Source file on the sender, final destination on the receiver.
    std::string local_path;
    uint64_t file_size = 0;
    uint32_t total_chunks = 0;
    uint32_t chunk_size = kDefaultChunkSize;
    std::array<uint8_t, kSha256Bytes> file_hash{};
    std::vector<ChunkRecord> chunks;
    RatchetCheckpoint ratchet_checkpoint;
    TransferStatus status = TransferStatus::Negotiating;
    std::optional<AbortReason> abort_reason;
    /// Ratchet parameters agreed in the manifest.
    uint32_t ratchet_window = kDefaultReceiveWindow;
    uint64_t rekey_after_chunks = kDefaultRekeyAfterChunks;
    uint32_t cleanup_after_days = kDefaultCleanupAfterDays;
    uint32_t completion_grace_days = kDefaultCleanupAfterDays;
    TimePoint created_at{};
    TimePoint last_updated_at{};
    TimePoint expires_at{};

    /// Acknowledged or Verified on the sending side (a completed sender
    /// marks every chunk Verified), Verified on the receiving side.
    [[nodiscard]] bool IsDoneStatus(const ChunkStatus status) const noexcept {
        if (direction == TransferDirection::Send) {
            return status == ChunkStatus::Acknowledged || status == ChunkStatus::Verified;
        }
        return status == ChunkStatus::Verified;
    }

    [[nodiscard]] bool IsChunkDone(uint32_t index) const noexcept {
        return index < chunks.size() && IsDoneStatus(chunks[index].status);
    }

    [[nodiscard]] uint32_t ChunksDone() const noexcept;

    [[nodiscard]] uint64_t BytesDone() const noexcept;

    /// Lowest index that is not done; total_chunks when every chunk is.
    [[nodiscard]] uint32_t Frontier() const noexcept;

    [[nodiscard]] std::vector<uint32_t> MissingChunks() const;

    /// One bit per chunk, LSB first; set bits are done.
    [[nodiscard]] std::vector<uint8_t> DoneBitmap() const;

    [[nodiscard]] uint32_t ChunkLength(uint32_t index) const noexcept;

    /// Stamps last_updated_at and slides expires_at.
    void Touch(TimePoint now) noexcept;
};

struct ResumableSummary {
    TransferId transfer_id;
    TransferDirection direction = TransferDirection::Send;
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t chunks_done = 0;
    uint32_t total_chunks = 0;
    TransferStatus status = TransferStatus::Paused;
    std::optional<AbortReason> abort_reason;
    TimePoint last_updated_at{};
    TimePoint expires_at{};

    [[nodiscard]] static ResumableSummary FromState(const TransferState& state);
};

[[nodiscard]] bool IsBitSet(const std::vector<uint8_t>& bitmap, uint32_t index) noexcept;

}
