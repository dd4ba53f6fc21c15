#include "tallow/engine/file_names.hpp"
#include "tallow/codec/chunk_codec.hpp"
#include <format>
#include <system_error>

namespace tallow::transfer::engine {

namespace {

    constexpr size_t kMaxFileNameBytes = 255;
    constexpr int kMaxDuplicateSuffix = 10000;

    bool IsTaken(const std::filesystem::path& candidate) {
        std::error_code error;
        return std::filesystem::exists(candidate, error) ||
               std::filesystem::exists(codec::ChunkWriter::PartialPathFor(candidate), error);
    }

}

Result<std::string, TransferFailure> SanitizeFileName(std::string_view name) {
    if (name.find('\0') != std::string_view::npos) {
        return Result<std::string, TransferFailure>::Err(
            TransferFailure::InvalidInput("File name contains NUL"));
    }
    if (const size_t slash = name.find_last_of("/\\"); slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }
    if (name.empty() || name == "." || name == "..") {
        return Result<std::string, TransferFailure>::Err(
            TransferFailure::InvalidInput("File name has no usable final component"));
    }
    if (name.size() > kMaxFileNameBytes) {
        return Result<std::string, TransferFailure>::Err(
            TransferFailure::InvalidInput("File name is too long"));
    }
    return Result<std::string, TransferFailure>::Ok(std::string(name));
}

std::filesystem::path UniqueDestination(const std::filesystem::path& directory, const std::string& name) {
    std::filesystem::path candidate = directory / name;
    if (!IsTaken(candidate)) {
        return candidate;
    }
    const std::filesystem::path as_path(name);
    const std::string stem = as_path.stem().string();
    const std::string extension = as_path.extension().string();
    for (int n = 1; n < kMaxDuplicateSuffix; ++n) {
        candidate = directory / std::format("{} ({}){}", stem, n, extension);
        if (!IsTaken(candidate)) {
            return candidate;
        }
    }
    return directory / std::format("{} ({}){}", stem, kMaxDuplicateSuffix, extension);
}

}
