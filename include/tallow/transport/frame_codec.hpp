#pragma once
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "transfer/frame.pb.h"
#include <cstdint>
#include <span>
#include <vector>

namespace tallow::transfer::transport {

/// Frame <-> bytes for byte-stream transports. Frames above kMaxFrameBytes
/// are rejected in both directions.
class FrameCodec {
public:
    static Result<std::vector<uint8_t>, TransferFailure> Encode(const tallow::proto::transfer::Frame& frame);

    static Result<tallow::proto::transfer::Frame, TransferFailure> Decode(std::span<const uint8_t> bytes);

private:
    FrameCodec() = delete;
};

}
