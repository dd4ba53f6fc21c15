#include "tallow/models/transfer_state.hpp"

namespace tallow::transfer::models {

std::string_view ToString(const ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::Pending: return "Pending";
        case ChunkStatus::Sent: return "Sent";
        case ChunkStatus::Acknowledged: return "Acknowledged";
        case ChunkStatus::Received: return "Received";
        case ChunkStatus::Verified: return "Verified";
        case ChunkStatus::Failed: return "Failed";
    }
    return "Unknown";
}

std::string_view ToString(const TransferDirection direction) noexcept {
    return direction == TransferDirection::Send ? "Send" : "Receive";
}

std::string_view ToString(const TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Negotiating: return "Negotiating";
        case TransferStatus::Transferring: return "Transferring";
        case TransferStatus::Paused: return "Paused";
        case TransferStatus::Resuming: return "Resuming";
        case TransferStatus::Completed: return "Completed";
        case TransferStatus::Aborted: return "Aborted";
    }
    return "Unknown";
}

uint32_t TransferState::ChunksDone() const noexcept {
    uint32_t count = 0;
    for (const ChunkRecord& chunk : chunks) {
        if (IsDoneStatus(chunk.status)) {
            ++count;
        }
    }
    return count;
}

uint64_t TransferState::BytesDone() const noexcept {
    uint64_t bytes = 0;
    for (const ChunkRecord& chunk : chunks) {
        if (IsDoneStatus(chunk.status)) {
            bytes += ChunkLength(chunk.index);
        }
    }
    return bytes;
}

uint32_t TransferState::Frontier() const noexcept {
    for (const ChunkRecord& chunk : chunks) {
        if (!IsDoneStatus(chunk.status)) {
            return chunk.index;
        }
    }
    return total_chunks;
}

std::vector<uint32_t> TransferState::MissingChunks() const {
    std::vector<uint32_t> missing;
    for (const ChunkRecord& chunk : chunks) {
        if (!IsDoneStatus(chunk.status)) {
            missing.push_back(chunk.index);
        }
    }
    return missing;
}

std::vector<uint8_t> TransferState::DoneBitmap() const {
    std::vector<uint8_t> bitmap((static_cast<size_t>(total_chunks) + 7) / 8, 0);
    for (const ChunkRecord& chunk : chunks) {
        if (IsDoneStatus(chunk.status)) {
            bitmap[chunk.index / 8] |= static_cast<uint8_t>(1u << (chunk.index % 8));
        }
    }
    return bitmap;
}

uint32_t TransferState::ChunkLength(const uint32_t index) const noexcept {
    if (index >= total_chunks || chunk_size == 0) {
        return 0;
    }
    const uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    const uint64_t remaining = file_size - offset;
    return remaining < chunk_size ? static_cast<uint32_t>(remaining) : chunk_size;
}

void TransferState::Touch(const TimePoint now) noexcept {
    last_updated_at = now;
    const uint32_t days = status == TransferStatus::Completed ? completion_grace_days : cleanup_after_days;
    expires_at = now + std::chrono::hours(24) * days;
}

ResumableSummary ResumableSummary::FromState(const TransferState& state) {
    ResumableSummary summary;
    summary.transfer_id = state.transfer_id;
    summary.direction = state.direction;
    summary.file_name = state.file_name;
    summary.file_size = state.file_size;
    summary.chunks_done = state.ChunksDone();
    summary.total_chunks = state.total_chunks;
    summary.status = state.status;
    summary.abort_reason = state.abort_reason;
    summary.last_updated_at = state.last_updated_at;
    summary.expires_at = state.expires_at;
    return summary;
}

bool IsBitSet(const std::vector<uint8_t>& bitmap, const uint32_t index) noexcept {
    const size_t byte = index / 8;
    if (byte >= bitmap.size()) {
        return false;
    }
    return (bitmap[byte] >> (index % 8)) & 1u;
}

}
