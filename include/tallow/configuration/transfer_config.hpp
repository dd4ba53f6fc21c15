#pragma once

#include "tallow/core/constants.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <chrono>
#include <cstdint>

namespace tallow::transfer::configuration {

/**
 * @brief Per-transfer tuning knobs
 *
 * One instance is fixed when a transfer starts and is recorded alongside the
 * transfer, so a resumed transfer keeps the chunk size it started with.
 *
 * **Resume policy**:
 * A broken channel moves the transfer to Paused. With auto_resume the
 * controller immediately tries to reconnect: each attempt waits up to
 * resume_timeout for the channel and the peer's resume answer, and attempts
 * are separated by resume_backoff_base * 2^(attempt - 1). After
 * max_resume_attempts failures the transfer is Aborted and its record kept.
 *
 * **Re-keying**:
 * After rekey_after_chunks chunks in one epoch the sender drains its
 * in-flight window and runs a fresh hybrid key exchange.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = TransferConfig::Default();
 * config.WithChunkSize(kChunkSize128K).WithMaxResumeAttempts(5);
 * if (auto valid = config.Validate(); valid.IsErr()) { ... }
 * ```
 */
class TransferConfig {
public:
    /**
     * @brief 64 KiB chunks, auto resume, 3 attempts of 30 s, 7 day retention
     */
    [[nodiscard]] static TransferConfig Default() noexcept {
        return TransferConfig();
    }

    [[nodiscard]] static bool IsAllowedChunkSize(uint32_t chunk_size) noexcept {
        for (const uint32_t allowed : kAllowedChunkSizes) {
            if (allowed == chunk_size) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Check every field against its allowed range
     *
     * The receive window must cover the sender's in-flight window, and an
     * epoch must be longer than one window so a rekey can drain.
     */
    [[nodiscard]] Result<Unit, TransferFailure> Validate() const;

    TransferConfig& WithChunkSize(uint32_t value) noexcept { chunk_size_ = value; return *this; }
    TransferConfig& WithAutoResume(bool value) noexcept { auto_resume_ = value; return *this; }
    TransferConfig& WithResumeTimeout(std::chrono::milliseconds value) noexcept { resume_timeout_ = value; return *this; }
    TransferConfig& WithMaxResumeAttempts(uint32_t value) noexcept { max_resume_attempts_ = value; return *this; }
    TransferConfig& WithResumeBackoffBase(std::chrono::milliseconds value) noexcept { resume_backoff_base_ = value; return *this; }
    TransferConfig& WithCleanupAfterDays(uint32_t value) noexcept { cleanup_after_days_ = value; return *this; }
    TransferConfig& WithCompletionGraceDays(uint32_t value) noexcept { completion_grace_days_ = value; return *this; }
    TransferConfig& WithMaxInFlightChunks(uint32_t value) noexcept { max_in_flight_chunks_ = value; return *this; }
    TransferConfig& WithReceiveWindow(uint32_t value) noexcept { receive_window_ = value; return *this; }
    TransferConfig& WithRekeyAfterChunks(uint64_t value) noexcept { rekey_after_chunks_ = value; return *this; }
    TransferConfig& WithProgressInterval(std::chrono::milliseconds value) noexcept { progress_interval_ = value; return *this; }
    TransferConfig& WithStorageRetryAttempts(uint32_t value) noexcept { storage_retry_attempts_ = value; return *this; }
    TransferConfig& WithStorageRetryBackoff(std::chrono::milliseconds value) noexcept { storage_retry_backoff_ = value; return *this; }
    TransferConfig& WithHandshakeTimeout(std::chrono::milliseconds value) noexcept { handshake_timeout_ = value; return *this; }
    TransferConfig& WithWorkerThreads(uint32_t value) noexcept { worker_threads_ = value; return *this; }

    [[nodiscard]] uint32_t ChunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] bool AutoResume() const noexcept { return auto_resume_; }
    [[nodiscard]] std::chrono::milliseconds ResumeTimeout() const noexcept { return resume_timeout_; }
    [[nodiscard]] uint32_t MaxResumeAttempts() const noexcept { return max_resume_attempts_; }
    [[nodiscard]] std::chrono::milliseconds ResumeBackoffBase() const noexcept { return resume_backoff_base_; }
    [[nodiscard]] uint32_t CleanupAfterDays() const noexcept { return cleanup_after_days_; }
    [[nodiscard]] uint32_t CompletionGraceDays() const noexcept { return completion_grace_days_; }
    [[nodiscard]] uint32_t MaxInFlightChunks() const noexcept { return max_in_flight_chunks_; }
    [[nodiscard]] uint32_t ReceiveWindow() const noexcept { return receive_window_; }
    [[nodiscard]] uint64_t RekeyAfterChunks() const noexcept { return rekey_after_chunks_; }
    [[nodiscard]] std::chrono::milliseconds ProgressInterval() const noexcept { return progress_interval_; }
    [[nodiscard]] uint32_t StorageRetryAttempts() const noexcept { return storage_retry_attempts_; }
    [[nodiscard]] std::chrono::milliseconds StorageRetryBackoff() const noexcept { return storage_retry_backoff_; }
    [[nodiscard]] std::chrono::milliseconds HandshakeTimeout() const noexcept { return handshake_timeout_; }
    [[nodiscard]] uint32_t WorkerThreads() const noexcept { return worker_threads_; }

    /// Delay before attempt n (1-based) is made.
    [[nodiscard]] std::chrono::milliseconds BackoffBeforeAttempt(uint32_t attempt) const noexcept;

private:
    TransferConfig() noexcept = default;

    uint32_t chunk_size_ = kDefaultChunkSize;
    bool auto_resume_ = true;
    std::chrono::milliseconds resume_timeout_ = kDefaultResumeTimeout;
    uint32_t max_resume_attempts_ = kDefaultMaxResumeAttempts;
    std::chrono::milliseconds resume_backoff_base_ = kDefaultResumeBackoffBase;
    uint32_t cleanup_after_days_ = kDefaultCleanupAfterDays;
    uint32_t completion_grace_days_ = kDefaultCleanupAfterDays;
    uint32_t max_in_flight_chunks_ = kDefaultMaxInFlightChunks;
    uint32_t receive_window_ = kDefaultReceiveWindow;
    uint64_t rekey_after_chunks_ = kDefaultRekeyAfterChunks;
    std::chrono::milliseconds progress_interval_ = kDefaultProgressInterval;
    uint32_t storage_retry_attempts_ = kDefaultStorageRetryAttempts;
    std::chrono::milliseconds storage_retry_backoff_ = kDefaultStorageRetryBackoff;
    std::chrono::milliseconds handshake_timeout_ = kDefaultHandshakeTimeout;
    uint32_t worker_threads_ = kDefaultWorkerThreads;
};

}
