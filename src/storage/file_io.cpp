#include "tallow/storage/file_io.hpp"
#include "tallow/core/constants.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace tallow::transfer::storage {

namespace {
    TransferFailure ErrnoFailure(std::string_view operation, const std::filesystem::path& path, const int error) {
        return TransferFailure::Storage(
            std::format("{} {} failed: {}", operation, path.string(), std::strerror(error)));
    }

    TransferFailure ErrnoFailure(std::string_view operation, const int error) {
        return TransferFailure::Storage(
            std::format("{} failed: {}", operation, std::strerror(error)));
    }
}

ScopedFd::~ScopedFd() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

ScopedFd& ScopedFd::operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.Release();
    }
    return *this;
}

int ScopedFd::Release() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

Result<Unit, TransferFailure> ScopedFd::Close() {
    const int fd = Release();
    if (fd >= 0 && ::close(fd) != 0) {
        return Result<Unit, TransferFailure>::Err(ErrnoFailure("close", errno));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<ScopedFd, TransferFailure> FileIo::Open(const std::filesystem::path& path, const int flags, const unsigned mode) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, static_cast<mode_t>(mode));
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        const int error = errno;
        if (error == ENOENT) {
            return Result<ScopedFd, TransferFailure>::Err(
                TransferFailure::NotFound(std::format("{} does not exist", path.string())));
        }
        return Result<ScopedFd, TransferFailure>::Err(ErrnoFailure("open", path, error));
    }
    return Result<ScopedFd, TransferFailure>::Ok(ScopedFd(fd));
}

Result<Unit, TransferFailure> FileIo::WriteAll(const int fd, std::span<const uint8_t> data) {
    size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<Unit, TransferFailure>::Err(ErrnoFailure("write", errno));
        }
        if (written == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Storage("write made no progress"));
        }
        offset += static_cast<size_t>(written);
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> FileIo::PwriteAll(const int fd, std::span<const uint8_t> data, const uint64_t offset) {
    size_t done = 0;
    while (done < data.size()) {
        const ssize_t written = ::pwrite(fd, data.data() + done, data.size() - done,
                                         static_cast<off_t>(offset + done));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<Unit, TransferFailure>::Err(ErrnoFailure("pwrite", errno));
        }
        if (written == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Storage("pwrite made no progress"));
        }
        done += static_cast<size_t>(written);
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<size_t, TransferFailure> FileIo::PreadAll(const int fd, std::span<uint8_t> output, const uint64_t offset) {
    size_t done = 0;
    while (done < output.size()) {
        const ssize_t got = ::pread(fd, output.data() + done, output.size() - done,
                                    static_cast<off_t>(offset + done));
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<size_t, TransferFailure>::Err(ErrnoFailure("pread", errno));
        }
        if (got == 0) {
            break;
        }
        done += static_cast<size_t>(got);
    }
    return Result<size_t, TransferFailure>::Ok(done);
}

Result<Unit, TransferFailure> FileIo::Sync(const int fd, const bool data_only) {
    const int rc = data_only ? ::fdatasync(fd) : ::fsync(fd);
    if (rc != 0) {
        return Result<Unit, TransferFailure>::Err(ErrnoFailure(data_only ? "fdatasync" : "fsync", errno));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> FileIo::SyncParentDirectory(const std::filesystem::path& path) {
    std::filesystem::path directory = path.parent_path();
    if (directory.empty()) {
        directory = ".";
    }
    auto dir_result = Open(directory, O_RDONLY | O_DIRECTORY);
    if (dir_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(dir_result.UnwrapErr());
    }
    auto dir = std::move(dir_result).Unwrap();
    return Sync(dir.Get(), false);
}

Result<Unit, TransferFailure> FileIo::WriteFileAtomically(
    const std::filesystem::path& path,
    std::span<const uint8_t> data,
    const bool sync) {
    std::filesystem::path temp_path = path;
    temp_path += kTempSuffix;

    auto fd_result = Open(temp_path, O_CREAT | O_TRUNC | O_WRONLY);
    if (fd_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(fd_result.UnwrapErr());
    }
    auto fd = std::move(fd_result).Unwrap();
    auto write_result = WriteAll(fd.Get(), data);
    if (write_result.IsOk() && sync) {
        write_result = Sync(fd.Get(), false);
    }
    if (write_result.IsOk()) {
        write_result = fd.Close();
    }
    if (write_result.IsErr()) {
        fd = ScopedFd();
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return write_result;
    }
    return RenameAtomically(temp_path, path, sync);
}

Result<Unit, TransferFailure> FileIo::RenameAtomically(
    const std::filesystem::path& from,
    const std::filesystem::path& to,
    const bool sync) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return Result<Unit, TransferFailure>::Err(ErrnoFailure("rename", to, errno));
    }
    if (sync) {
        return SyncParentDirectory(to);
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, TransferFailure> FileIo::ReadWholeFile(
    const std::filesystem::path& path,
    const size_t max_bytes) {
    auto fd_result = Open(path, O_RDONLY);
    if (fd_result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(fd_result.UnwrapErr());
    }
    auto fd = std::move(fd_result).Unwrap();
    struct stat info {};
    if (::fstat(fd.Get(), &info) != 0) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(ErrnoFailure("fstat", path, errno));
    }
    if (info.st_size < 0 || static_cast<uint64_t>(info.st_size) > max_bytes) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Storage(
                std::format("{} is {} bytes, limit is {}", path.string(), info.st_size, max_bytes)));
    }
    std::vector<uint8_t> data(static_cast<size_t>(info.st_size));
    auto read_result = PreadAll(fd.Get(), data, 0);
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(read_result.UnwrapErr());
    }
    data.resize(read_result.Unwrap());
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(data));
}

Result<uint64_t, TransferFailure> FileIo::FileSize(const std::filesystem::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        const int error = errno;
        if (error == ENOENT) {
            return Result<uint64_t, TransferFailure>::Err(
                TransferFailure::NotFound(std::format("{} does not exist", path.string())));
        }
        return Result<uint64_t, TransferFailure>::Err(ErrnoFailure("stat", path, error));
    }
    if (!S_ISREG(info.st_mode)) {
        return Result<uint64_t, TransferFailure>::Err(
            TransferFailure::InvalidInput(std::format("{} is not a regular file", path.string())));
    }
    return Result<uint64_t, TransferFailure>::Ok(static_cast<uint64_t>(info.st_size));
}

Result<Unit, TransferFailure> FileIo::RemoveIfExists(const std::filesystem::path& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return Result<Unit, TransferFailure>::Err(ErrnoFailure("unlink", path, errno));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

}
