#pragma once
#include "tallow/models/transfer_state.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace tallow::transfer::engine {

struct TransferEvent {
    models::TransferId transfer_id;
    uint32_t chunks_done = 0;
    uint32_t total_chunks = 0;
    uint64_t bytes_done = 0;
    double bytes_per_second = 0.0;
    models::TransferStatus status = models::TransferStatus::Negotiating;
    std::optional<models::AbortReason> abort_reason;
    /// Last failure behind a Paused or Resuming status; empty for a pause
    /// the user asked for.
    std::optional<models::AbortReason> interruption;
};

/**
 * @brief Bounded queue between the sessions and the application
 *
 * Sessions never block on a slow consumer: when the queue is full the oldest
 * event is discarded and counted.
 */
class EventQueue {
public:
    explicit EventQueue(size_t capacity);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void Publish(TransferEvent event);

    std::optional<TransferEvent> Poll();

    std::optional<TransferEvent> WaitNext(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t Size() const;

    [[nodiscard]] uint64_t DroppedCount() const;

private:
    size_t capacity_;
    mutable std::mutex lock_;
    std::condition_variable available_;
    std::deque<TransferEvent> events_;
    uint64_t dropped_ = 0;
};

/**
 * @brief Rate limit for progress events of one session
 *
 * A progress event goes out only when at least one chunk finished since the
 * last one and the interval has elapsed, so the stream is never denser than
 * one event per chunk or one per interval, whichever is coarser.
 */
class ProgressMeter {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit ProgressMeter(std::chrono::milliseconds interval) noexcept
        : interval_(interval) {}

    /// Returns the throughput since the last emission when one is due.
    std::optional<double> Sample(SteadyClock::time_point now, uint32_t chunks_done, uint64_t bytes_done);

    /// Restart the measurement, e.g. after a status change or a resume.
    void Reset(SteadyClock::time_point now, uint32_t chunks_done, uint64_t bytes_done) noexcept;

private:
    std::chrono::milliseconds interval_;
    std::optional<SteadyClock::time_point> last_emit_;
    uint32_t last_chunks_ = 0;
    uint64_t last_bytes_ = 0;
};

}
