#include "tallow/transport/in_memory_channel.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/transport/frame_codec.hpp"
#include <array>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace tallow::transfer::transport {

namespace pb = tallow::proto::transfer;

struct InMemoryChannel::Link {
    mutable std::mutex lock;
    std::condition_variable changed;
    std::array<std::deque<std::vector<uint8_t>>, 2> inbox;
    std::array<SendFilter, 2> filters;
    std::array<bool, 2> closed{false, false};
    std::array<uint64_t, 2> frames_sent{0, 0};
    bool up = true;
};

InMemoryChannel::InMemoryChannel(std::shared_ptr<Link> link, const int side) noexcept
    : link_(std::move(link)), side_(side) {}

InMemoryChannel::~InMemoryChannel() {
    Close();
}

std::pair<std::shared_ptr<InMemoryChannel>, std::shared_ptr<InMemoryChannel>> InMemoryChannel::CreatePair() {
    auto link = std::make_shared<Link>();
    std::shared_ptr<InMemoryChannel> first(new InMemoryChannel(link, 0));
    std::shared_ptr<InMemoryChannel> second(new InMemoryChannel(link, 1));
    return {std::move(first), std::move(second)};
}

Result<Unit, TransferFailure> InMemoryChannel::Send(const pb::Frame& frame) {
    SendFilter filter;
    {
        std::lock_guard guard(link_->lock);
        if (link_->closed[side_] || link_->closed[1 - side_] || !link_->up) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::Transport("Link is down"));
        }
        filter = link_->filters[side_];
    }
    pb::Frame outgoing = frame;
    // The filter may cut the link, so it runs unlocked.
    if (filter && !filter(outgoing)) {
        return Result<Unit, TransferFailure>::Ok(Unit{});
    }
    auto encoded = FrameCodec::Encode(outgoing);
    if (encoded.IsErr()) {
        return Result<Unit, TransferFailure>::Err(encoded.UnwrapErr());
    }
    {
        std::lock_guard guard(link_->lock);
        if (link_->closed[side_] || link_->closed[1 - side_] || !link_->up) {
            return Result<Unit, TransferFailure>::Err(TransferFailure::Transport("Link is down"));
        }
        link_->inbox[1 - side_].push_back(std::move(encoded).Unwrap());
        ++link_->frames_sent[side_];
    }
    link_->changed.notify_all();
    return Result<Unit, TransferFailure>::Ok(Unit{});
}

Result<pb::Frame, TransferFailure> InMemoryChannel::Receive(const std::chrono::milliseconds timeout) {
    std::unique_lock guard(link_->lock);
    auto& inbox = link_->inbox[side_];
    const bool ready = link_->changed.wait_for(guard, timeout, [&] {
        return !inbox.empty() || !link_->up || link_->closed[side_] || link_->closed[1 - side_];
    });
    if (!inbox.empty() && !link_->closed[side_]) {
        std::vector<uint8_t> bytes = std::move(inbox.front());
        inbox.pop_front();
        guard.unlock();
        return FrameCodec::Decode(bytes);
    }
    if (!ready) {
        return Result<pb::Frame, TransferFailure>::Err(TransferFailure::Timeout("No frame within timeout"));
    }
    return Result<pb::Frame, TransferFailure>::Err(TransferFailure::Transport("Link is down"));
}

Result<Unit, TransferFailure> InMemoryChannel::Reconnect(const std::chrono::milliseconds timeout) {
    std::unique_lock guard(link_->lock);
    if (link_->closed[side_]) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::Transport("Channel is closed"));
    }
    if (!link_->changed.wait_for(guard, timeout, [&] { return link_->up || link_->closed[side_]; }) ||
        link_->closed[side_]) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::Transport("Reconnect timed out"));
    }
    return Result<Unit, TransferFailure>::Ok(Unit{});
}

bool InMemoryChannel::IsOpen() const {
    std::lock_guard guard(link_->lock);
    return link_->up && !link_->closed[side_] && !link_->closed[1 - side_];
}

void InMemoryChannel::Close() {
    {
        std::lock_guard guard(link_->lock);
        link_->closed[side_] = true;
        link_->inbox[side_].clear();
    }
    link_->changed.notify_all();
}

void InMemoryChannel::Drop() {
    {
        std::lock_guard guard(link_->lock);
        link_->up = false;
    }
    TALLOW_LOG_DEBUG("In-memory link dropped");
    link_->changed.notify_all();
}

void InMemoryChannel::Restore() {
    {
        std::lock_guard guard(link_->lock);
        link_->up = true;
    }
    TALLOW_LOG_DEBUG("In-memory link restored");
    link_->changed.notify_all();
}

void InMemoryChannel::SetSendFilter(SendFilter filter) {
    std::lock_guard guard(link_->lock);
    link_->filters[side_] = std::move(filter);
}

uint64_t InMemoryChannel::FramesSent() const {
    std::lock_guard guard(link_->lock);
    return link_->frames_sent[side_];
}

}
