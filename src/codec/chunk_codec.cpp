#include "tallow/codec/chunk_codec.hpp"
#include "tallow/configuration/transfer_config.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/core/logger.hpp"
#include <fcntl.h>
#include <format>
#include <unistd.h>

namespace tallow::transfer::codec {

using storage::FileIo;
using storage::ScopedFd;

namespace {
    constexpr size_t kHashBufferBytes = 1024 * 1024;
}

Result<ChunkLayout, TransferFailure> ChunkLayout::Create(const uint64_t file_size, const uint32_t chunk_size) {
    if (!configuration::TransferConfig::IsAllowedChunkSize(chunk_size)) {
        return Result<ChunkLayout, TransferFailure>::Err(
            TransferFailure::InvalidInput(std::format("Chunk size {} is not allowed", chunk_size)));
    }
    const uint64_t total = (file_size + chunk_size - 1) / chunk_size;
    if (total > kMaxChunkIndex) {
        return Result<ChunkLayout, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("File of {} bytes needs {} chunks, more than an index can address", file_size, total)));
    }
    return Result<ChunkLayout, TransferFailure>::Ok(
        ChunkLayout(file_size, chunk_size, static_cast<uint32_t>(total)));
}

uint32_t ChunkLayout::LengthOf(const uint32_t index) const noexcept {
    if (index >= total_chunks_) {
        return 0;
    }
    const uint64_t remaining = file_size_ - OffsetOf(index);
    return remaining < chunk_size_ ? static_cast<uint32_t>(remaining) : chunk_size_;
}

Result<std::unique_ptr<ChunkReader>, TransferFailure> ChunkReader::Open(
    const std::filesystem::path& path,
    const uint32_t chunk_size) {
    auto size_result = FileIo::FileSize(path);
    if (size_result.IsErr()) {
        return Result<std::unique_ptr<ChunkReader>, TransferFailure>::Err(size_result.UnwrapErr());
    }
    auto layout_result = ChunkLayout::Create(size_result.Unwrap(), chunk_size);
    if (layout_result.IsErr()) {
        return Result<std::unique_ptr<ChunkReader>, TransferFailure>::Err(layout_result.UnwrapErr());
    }
    auto fd_result = FileIo::Open(path, O_RDONLY);
    if (fd_result.IsErr()) {
        return Result<std::unique_ptr<ChunkReader>, TransferFailure>::Err(fd_result.UnwrapErr());
    }
    return Result<std::unique_ptr<ChunkReader>, TransferFailure>::Ok(
        std::unique_ptr<ChunkReader>(new ChunkReader(std::move(fd_result).Unwrap(), layout_result.Unwrap())));
}

Result<std::vector<uint8_t>, TransferFailure> ChunkReader::ReadChunk(const uint32_t index) const {
    const uint32_t length = layout_.LengthOf(index);
    if (length == 0) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Chunk {} is outside a {}-chunk file", index, layout_.TotalChunks())));
    }
    std::vector<uint8_t> chunk(length);
    auto read_result = FileIo::PreadAll(fd_.Get(), chunk, layout_.OffsetOf(index));
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(read_result.UnwrapErr());
    }
    if (read_result.Unwrap() != length) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Integrity(
                std::format("Source file shrank: chunk {} read {} of {} bytes", index, read_result.Unwrap(), length)));
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(chunk));
}

ChunkWriter::ChunkWriter(ScopedFd fd, std::filesystem::path destination,
                         std::filesystem::path partial_path, const ChunkLayout layout,
                         const bool sync_writes) noexcept
    : fd_(std::move(fd)),
      destination_(std::move(destination)),
      partial_path_(std::move(partial_path)),
      layout_(layout),
      sync_writes_(sync_writes) {}

std::filesystem::path ChunkWriter::PartialPathFor(const std::filesystem::path& destination) {
    std::filesystem::path partial = destination;
    partial += kPartialFileSuffix;
    return partial;
}

Result<std::unique_ptr<ChunkWriter>, TransferFailure> ChunkWriter::Open(
    const std::filesystem::path& destination,
    const ChunkLayout& layout,
    const bool sync_writes,
    const bool keep_existing) {
    const auto partial_path = PartialPathFor(destination);
    const int flags = O_CREAT | O_RDWR | (keep_existing ? 0 : O_TRUNC);
    auto fd_result = FileIo::Open(partial_path, flags);
    if (fd_result.IsErr()) {
        return Result<std::unique_ptr<ChunkWriter>, TransferFailure>::Err(fd_result.UnwrapErr());
    }
    auto fd = std::move(fd_result).Unwrap();
    if (::ftruncate(fd.Get(), static_cast<off_t>(layout.FileSize())) != 0) {
        return Result<std::unique_ptr<ChunkWriter>, TransferFailure>::Err(
            TransferFailure::Storage(
                std::format("Cannot size {} to {} bytes", partial_path.string(), layout.FileSize())));
    }
    return Result<std::unique_ptr<ChunkWriter>, TransferFailure>::Ok(
        std::unique_ptr<ChunkWriter>(new ChunkWriter(
            std::move(fd), destination, partial_path, layout, sync_writes)));
}

Result<Unit, TransferFailure> ChunkWriter::WriteChunk(const uint32_t index, std::span<const uint8_t> data) {
    const uint32_t expected = layout_.LengthOf(index);
    if (expected == 0 || data.size() != expected) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Integrity(
                std::format("Chunk {} has {} bytes, layout expects {}", index, data.size(), expected)));
    }
    auto write_result = FileIo::PwriteAll(fd_.Get(), data, layout_.OffsetOf(index));
    if (write_result.IsErr() || !sync_writes_) {
        return write_result;
    }
    return FileIo::Sync(fd_.Get(), true);
}

Result<Unit, TransferFailure> ChunkWriter::Finalize(const crypto::Sha256Digest& expected_file_hash) {
    if (auto sync_result = FileIo::Sync(fd_.Get(), false); sync_result.IsErr()) {
        return sync_result;
    }
    auto hash_result = ChunkHasher::HashFile(partial_path_);
    if (hash_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(hash_result.UnwrapErr());
    }
    if (hash_result.Unwrap() != expected_file_hash) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Integrity(
                std::format("Reassembled {} does not match the sender's file hash", destination_.filename().string())));
    }
    if (auto close_result = fd_.Close(); close_result.IsErr()) {
        return close_result;
    }
    auto rename_result = FileIo::RenameAtomically(partial_path_, destination_, true);
    if (rename_result.IsOk()) {
        TALLOW_LOG_DEBUG("Finalized {}", destination_.string());
    }
    return rename_result;
}

crypto::Sha256Digest ChunkHasher::HashChunk(std::span<const uint8_t> chunk) noexcept {
    return crypto::Digest::Sha256(chunk);
}

Result<crypto::Sha256Digest, TransferFailure> ChunkHasher::HashFile(const std::filesystem::path& path) {
    auto fd_result = FileIo::Open(path, O_RDONLY);
    if (fd_result.IsErr()) {
        return Result<crypto::Sha256Digest, TransferFailure>::Err(fd_result.UnwrapErr());
    }
    auto fd = std::move(fd_result).Unwrap();
    crypto::Sha256Stream stream;
    std::vector<uint8_t> buffer(kHashBufferBytes);
    uint64_t offset = 0;
    while (true) {
        auto read_result = FileIo::PreadAll(fd.Get(), buffer, offset);
        if (read_result.IsErr()) {
            return Result<crypto::Sha256Digest, TransferFailure>::Err(read_result.UnwrapErr());
        }
        const size_t got = read_result.Unwrap();
        if (got == 0) {
            break;
        }
        stream.Update(std::span<const uint8_t>(buffer.data(), got));
        offset += got;
        if (got < buffer.size()) {
            break;
        }
    }
    return Result<crypto::Sha256Digest, TransferFailure>::Ok(stream.Finish());
}

}
