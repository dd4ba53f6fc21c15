#include "tallow/engine/event_queue.hpp"
#include <algorithm>

namespace tallow::transfer::engine {

EventQueue::EventQueue(const size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

void EventQueue::Publish(TransferEvent event) {
    {
        std::lock_guard guard(lock_);
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
    }
    available_.notify_one();
}

std::optional<TransferEvent> EventQueue::Poll() {
    std::lock_guard guard(lock_);
    if (events_.empty()) {
        return std::nullopt;
    }
    TransferEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<TransferEvent> EventQueue::WaitNext(const std::chrono::milliseconds timeout) {
    std::unique_lock guard(lock_);
    if (!available_.wait_for(guard, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    TransferEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t EventQueue::Size() const {
    std::lock_guard guard(lock_);
    return events_.size();
}

uint64_t EventQueue::DroppedCount() const {
    std::lock_guard guard(lock_);
    return dropped_;
}

std::optional<double> ProgressMeter::Sample(
    const SteadyClock::time_point now,
    const uint32_t chunks_done,
    const uint64_t bytes_done) {
    if (chunks_done == last_chunks_) {
        return std::nullopt;
    }
    if (last_emit_.has_value() && now - *last_emit_ < interval_) {
        return std::nullopt;
    }
    double rate = 0.0;
    if (last_emit_.has_value()) {
        const std::chrono::duration<double> elapsed = now - *last_emit_;
        if (elapsed.count() > 0.0 && bytes_done >= last_bytes_) {
            rate = static_cast<double>(bytes_done - last_bytes_) / elapsed.count();
        }
    }
    last_emit_ = now;
    last_chunks_ = chunks_done;
    last_bytes_ = bytes_done;
    return rate;
}

void ProgressMeter::Reset(const SteadyClock::time_point now, const uint32_t chunks_done, const uint64_t bytes_done) noexcept {
    last_emit_ = now;
    last_chunks_ = chunks_done;
    last_bytes_ = bytes_done;
}

}
