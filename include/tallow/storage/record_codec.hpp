#pragma once

#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/models/transfer_state.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tallow::transfer::storage {

struct DecodedRecord {
    models::TransferState state;
    uint64_t generation = 0;
};

struct JournalReplay {
    /// Prefix of the journal made of intact entries.
    size_t valid_bytes = 0;
    size_t applied_entries = 0;
    size_t stale_entries = 0;
    bool torn_tail = false;
};

/**
 * @brief Byte layout of persisted transfer records
 *
 * Record:  "TLWS" | u32 version | u32 length | TransferRecord | digest
 * Journal: repeated (u32 length | ChunkUpdate | digest)
 *
 * Lengths are big-endian. digest = BLAKE2b-256 over everything before it in
 * the record or entry, keyed with the store key when one is configured.
 */
class TransferRecordCodec {
public:
    static Result<std::vector<uint8_t>, TransferFailure> EncodeRecord(
        const models::TransferState& state,
        uint64_t generation,
        std::span<const uint8_t> store_key);

    static Result<DecodedRecord, TransferFailure> DecodeRecord(
        std::span<const uint8_t> bytes,
        std::span<const uint8_t> store_key);

    /// Entry carrying the listed chunks and the current ratchet checkpoint.
    static Result<std::vector<uint8_t>, TransferFailure> EncodeJournalEntry(
        const models::TransferState& state,
        std::span<const uint32_t> changed_indices,
        uint64_t generation,
        std::span<const uint8_t> store_key);

    /**
     * @brief Apply intact entries of the given generation onto state
     *
     * Stops at the first truncated or corrupt entry; what follows it is
     * reported through valid_bytes so the caller can cut it off.
     */
    static Result<JournalReplay, TransferFailure> ReplayJournal(
        std::span<const uint8_t> journal,
        std::span<const uint8_t> store_key,
        uint64_t generation,
        models::TransferState& state);

private:
    TransferRecordCodec() = delete;
};

}
