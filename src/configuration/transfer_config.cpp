#include "tallow/configuration/transfer_config.hpp"
#include <format>

namespace tallow::transfer::configuration {

namespace {
    constexpr uint32_t kMaxWorkerThreads = 64;
    constexpr uint32_t kMaxBackoffShift = 16;
}

Result<Unit, TransferFailure> TransferConfig::Validate() const {
    if (!IsAllowedChunkSize(chunk_size_)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Chunk size {} is not one of 16/32/64/128/256 KiB", chunk_size_)));
    }
    if (resume_timeout_.count() <= 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("Resume timeout must be positive"));
    }
    if (max_resume_attempts_ == 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("At least one resume attempt is required"));
    }
    if (resume_backoff_base_.count() < 0 || storage_retry_backoff_.count() < 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("Backoff durations cannot be negative"));
    }
    if (cleanup_after_days_ == 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("cleanupAfterDays must be at least 1"));
    }
    if (max_in_flight_chunks_ == 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("In-flight window must be at least 1 chunk"));
    }
    if (receive_window_ < max_in_flight_chunks_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Receive window {} is smaller than in-flight window {}",
                            receive_window_, max_in_flight_chunks_)));
    }
    if (rekey_after_chunks_ <= max_in_flight_chunks_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("Rekey interval must exceed the in-flight window"));
    }
    if (worker_threads_ == 0 || worker_threads_ > kMaxWorkerThreads) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Worker threads must be within 1..{}", kMaxWorkerThreads)));
    }
    if (handshake_timeout_.count() <= 0 || progress_interval_.count() < 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("Invalid handshake timeout or progress interval"));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

std::chrono::milliseconds TransferConfig::BackoffBeforeAttempt(const uint32_t attempt) const noexcept {
    if (attempt <= 1) {
        return std::chrono::milliseconds::zero();
    }
    const uint32_t shift = std::min(attempt - 2, kMaxBackoffShift);
    return resume_backoff_base_ * (1u << shift);
}

}
