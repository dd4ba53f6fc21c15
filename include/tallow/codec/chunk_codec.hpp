#pragma once

#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/crypto/digest.hpp"
#include "tallow/storage/file_io.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace tallow::transfer::codec {

/**
 * @brief Deterministic split of a file into fixed-size chunks
 *
 * total_chunks = ceil(file_size / chunk_size); only the last chunk may be
 * shorter. An empty file has no chunks.
 */
class ChunkLayout {
public:
    static Result<ChunkLayout, TransferFailure> Create(uint64_t file_size, uint32_t chunk_size);

    [[nodiscard]] uint64_t FileSize() const noexcept { return file_size_; }
    [[nodiscard]] uint32_t ChunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] uint32_t TotalChunks() const noexcept { return total_chunks_; }

    [[nodiscard]] uint64_t OffsetOf(uint32_t index) const noexcept {
        return static_cast<uint64_t>(index) * chunk_size_;
    }

    /// 0 for an index past the end.
    [[nodiscard]] uint32_t LengthOf(uint32_t index) const noexcept;

private:
    ChunkLayout(uint64_t file_size, uint32_t chunk_size, uint32_t total_chunks) noexcept
        : file_size_(file_size), chunk_size_(chunk_size), total_chunks_(total_chunks) {}

    uint64_t file_size_;
    uint32_t chunk_size_;
    uint32_t total_chunks_;
};

/// Random-access reads of a source file. ReadChunk may be called from
/// several workers at once.
class ChunkReader {
public:
    static Result<std::unique_ptr<ChunkReader>, TransferFailure> Open(
        const std::filesystem::path& path,
        uint32_t chunk_size);

    Result<std::vector<uint8_t>, TransferFailure> ReadChunk(uint32_t index) const;

    [[nodiscard]] const ChunkLayout& Layout() const noexcept { return layout_; }

private:
    ChunkReader(storage::ScopedFd fd, ChunkLayout layout) noexcept
        : fd_(std::move(fd)), layout_(layout) {}

    storage::ScopedFd fd_;
    ChunkLayout layout_;
};

/**
 * @brief Reassembles chunks into "<destination>.part" at their byte offsets
 *
 * The partial file is pre-sized, so chunks can land in any order and only
 * the chunk being written is held in memory. Finalize hashes the whole
 * partial file and renames it over the destination.
 */
class ChunkWriter {
public:
    /**
     * @param keep_existing Reuse a partial file left by an earlier run
     *        (resume); otherwise start from an empty one
     */
    static Result<std::unique_ptr<ChunkWriter>, TransferFailure> Open(
        const std::filesystem::path& destination,
        const ChunkLayout& layout,
        bool sync_writes,
        bool keep_existing);

    Result<Unit, TransferFailure> WriteChunk(uint32_t index, std::span<const uint8_t> data);

    /// Integrity failure leaves the partial file in place.
    Result<Unit, TransferFailure> Finalize(const crypto::Sha256Digest& expected_file_hash);

    [[nodiscard]] const std::filesystem::path& PartialPath() const noexcept { return partial_path_; }
    [[nodiscard]] const ChunkLayout& Layout() const noexcept { return layout_; }

    static std::filesystem::path PartialPathFor(const std::filesystem::path& destination);

private:
    ChunkWriter(storage::ScopedFd fd, std::filesystem::path destination,
                std::filesystem::path partial_path, ChunkLayout layout, bool sync_writes) noexcept;

    storage::ScopedFd fd_;
    std::filesystem::path destination_;
    std::filesystem::path partial_path_;
    ChunkLayout layout_;
    bool sync_writes_;
};

class ChunkHasher {
public:
    [[nodiscard]] static crypto::Sha256Digest HashChunk(std::span<const uint8_t> chunk) noexcept;

    /// Streams the file through SHA-256 without loading it whole.
    static Result<crypto::Sha256Digest, TransferFailure> HashFile(const std::filesystem::path& path);

private:
    ChunkHasher() = delete;
};

}
