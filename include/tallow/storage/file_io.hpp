#pragma once

#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace tallow::transfer::storage {

/// Owns a POSIX file descriptor; closes it on destruction.
class ScopedFd {
public:
    ScopedFd() noexcept = default;
    explicit ScopedFd(int fd) noexcept : fd_(fd) {}
    ~ScopedFd();

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.Release()) {}
    ScopedFd& operator=(ScopedFd&& other) noexcept;

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool IsValid() const noexcept { return fd_ >= 0; }
    int Release() noexcept;

    /// Close now and report the error close() returned.
    Result<Unit, TransferFailure> Close();

private:
    int fd_ = -1;
};

/**
 * @brief Thin POSIX file helpers with Storage failures
 *
 * Everything that must survive a crash goes through WriteFileAtomically
 * (temp file in the same directory, fsync, rename, directory fsync) or
 * through an explicit Sync on an open descriptor.
 */
class FileIo {
public:
    static Result<ScopedFd, TransferFailure> Open(const std::filesystem::path& path, int flags, unsigned mode = 0600);

    static Result<Unit, TransferFailure> WriteAll(int fd, std::span<const uint8_t> data);

    static Result<Unit, TransferFailure> PwriteAll(int fd, std::span<const uint8_t> data, uint64_t offset);

    /// Reads until output is full or end of file; returns the byte count.
    static Result<size_t, TransferFailure> PreadAll(int fd, std::span<uint8_t> output, uint64_t offset);

    static Result<Unit, TransferFailure> Sync(int fd, bool data_only);

    static Result<Unit, TransferFailure> SyncParentDirectory(const std::filesystem::path& path);

    static Result<Unit, TransferFailure> WriteFileAtomically(
        const std::filesystem::path& path,
        std::span<const uint8_t> data,
        bool sync);

    static Result<Unit, TransferFailure> RenameAtomically(
        const std::filesystem::path& from,
        const std::filesystem::path& to,
        bool sync);

    static Result<std::vector<uint8_t>, TransferFailure> ReadWholeFile(
        const std::filesystem::path& path,
        size_t max_bytes);

    static Result<uint64_t, TransferFailure> FileSize(const std::filesystem::path& path);

    /// Missing files are not an error.
    static Result<Unit, TransferFailure> RemoveIfExists(const std::filesystem::path& path);

private:
    FileIo() = delete;
};

}
