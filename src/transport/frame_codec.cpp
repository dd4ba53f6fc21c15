#include "tallow/transport/frame_codec.hpp"
#include "tallow/core/constants.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <format>
#include <string>

namespace tallow::transfer::transport {

namespace pb = tallow::proto::transfer;

Result<std::vector<uint8_t>, TransferFailure> FrameCodec::Encode(const pb::Frame& frame) {
    if (frame.type() == pb::FRAME_TYPE_UNSPECIFIED) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Encode("Frame type is not set"));
    }
    const size_t size = frame.ByteSizeLong();
    if (size > kMaxFrameBytes) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Encode(std::format("Frame of {} bytes exceeds the limit", size)));
    }
    std::string output;
    google::protobuf::io::StringOutputStream stream(&output);
    {
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!frame.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Encode("Failed to serialize frame"));
        }
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

Result<pb::Frame, TransferFailure> FrameCodec::Decode(std::span<const uint8_t> bytes) {
    if (bytes.empty() || bytes.size() > kMaxFrameBytes) {
        return Result<pb::Frame, TransferFailure>::Err(
            TransferFailure::Decode(std::format("Invalid frame size {}", bytes.size())));
    }
    pb::Frame frame;
    if (!frame.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<pb::Frame, TransferFailure>::Err(
            TransferFailure::Decode("Malformed frame"));
    }
    if (frame.type() == pb::FRAME_TYPE_UNSPECIFIED || frame.transfer_id().size() != kTransferIdBytes) {
        return Result<pb::Frame, TransferFailure>::Err(
            TransferFailure::Decode("Frame is missing its type or transfer id"));
    }
    return Result<pb::Frame, TransferFailure>::Ok(std::move(frame));
}

}
