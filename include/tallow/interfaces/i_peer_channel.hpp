#pragma once
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "transfer/frame.pb.h"
#include <chrono>

namespace tallow::transfer::interfaces {

/**
 * @brief Duplex frame channel to one peer, owned by the transport collaborator
 *
 * The engine only needs Handshake frames to precede Chunk frames; Chunk
 * frames may arrive in any order. Receive returns Timeout when nothing
 * arrived in time and Transport once the link is gone. Implementations must
 * allow Send and Receive from different threads.
 */
class IPeerChannel {
public:
    virtual ~IPeerChannel() = default;

    [[nodiscard]] virtual Result<Unit, TransferFailure> Send(
        const tallow::proto::transfer::Frame& frame) = 0;

    [[nodiscard]] virtual Result<tallow::proto::transfer::Frame, TransferFailure> Receive(
        std::chrono::milliseconds timeout) = 0;

    /// Re-establish a broken link; Transport if it is not back within timeout.
    [[nodiscard]] virtual Result<Unit, TransferFailure> Reconnect(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;

    virtual void Close() = 0;
};

}
