#pragma once
#include "tallow/interfaces/i_peer_channel.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace tallow::transfer::transport {

/**
 * @brief Loopback channel pair for tests and the example program
 *
 * Both ends share one link. Frames cross it encoded, so everything the
 * engine sends goes through FrameCodec exactly as on a real byte stream.
 * Drop() cuts the link for both ends: frames already queued can still be
 * received, new sends fail with Transport until Restore().
 */
class InMemoryChannel final : public interfaces::IPeerChannel {
public:
    /// Sees each outgoing frame of one end before it is queued; may modify
    /// it. Returning false loses the frame silently.
    using SendFilter = std::function<bool(tallow::proto::transfer::Frame&)>;

    static std::pair<std::shared_ptr<InMemoryChannel>, std::shared_ptr<InMemoryChannel>> CreatePair();

    ~InMemoryChannel() override;

    InMemoryChannel(const InMemoryChannel&) = delete;
    InMemoryChannel& operator=(const InMemoryChannel&) = delete;

    Result<Unit, TransferFailure> Send(const tallow::proto::transfer::Frame& frame) override;

    Result<tallow::proto::transfer::Frame, TransferFailure> Receive(std::chrono::milliseconds timeout) override;

    Result<Unit, TransferFailure> Reconnect(std::chrono::milliseconds timeout) override;

    [[nodiscard]] bool IsOpen() const override;

    void Close() override;

    void Drop();

    void Restore();

    void SetSendFilter(SendFilter filter);

    [[nodiscard]] uint64_t FramesSent() const;

private:
    struct Link;

    InMemoryChannel(std::shared_ptr<Link> link, int side) noexcept;

    std::shared_ptr<Link> link_;
    int side_;
};

}
