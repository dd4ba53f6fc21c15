#pragma once
#include "tallow/core/constants.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace tallow::transfer::configuration {

/// Engine-wide settings; per-transfer knobs live in TransferConfig.
struct EngineOptions {
    /// Where transfer records and journals are kept.
    std::filesystem::path state_directory;
    /// Where received files are written.
    std::filesystem::path download_directory;
    size_t event_queue_capacity = kDefaultEventQueueCapacity;
    /// fsync every record write and received chunk.
    bool sync_writes = true;
    /// Optional 32-byte key for the record digests.
    std::vector<uint8_t> store_integrity_key;

    [[nodiscard]] Result<Unit, TransferFailure> Validate() const {
        if (state_directory.empty() || download_directory.empty()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("State and download directories are required"));
        }
        if (event_queue_capacity == 0) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Event queue capacity must be positive"));
        }
        if (!store_integrity_key.empty() && store_integrity_key.size() != kStoreKeyBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput("Store integrity key must be 32 bytes"));
        }
        return Result<Unit, TransferFailure>::Ok(Unit{});
    }
};

}
