#include "tallow/storage/record_codec.hpp"
#include "tallow/codec/chunk_codec.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/crypto/digest.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "transfer/state.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/timestamp.pb.h>
#include <algorithm>
#include <chrono>
#include <format>
#include <string>

namespace tallow::transfer::storage {

using crypto::Digest;
using models::ChunkStatus;
using models::TransferState;
namespace proto = tallow::proto::transfer;

namespace {
    constexpr size_t kRecordHeaderBytes = 4 + 4 + 4;
    constexpr size_t kLengthPrefixBytes = 4;
    constexpr size_t kMaxRecordBytes = 512u * 1024u * 1024u;

    void AppendUint32BE(std::vector<uint8_t>& out, const uint32_t value) {
        out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    uint32_t ReadUint32BE(std::span<const uint8_t> bytes) {
        return (static_cast<uint32_t>(bytes[0]) << 24) |
               (static_cast<uint32_t>(bytes[1]) << 16) |
               (static_cast<uint32_t>(bytes[2]) << 8) |
               static_cast<uint32_t>(bytes[3]);
    }

    Result<std::string, TransferFailure> SerializeDeterministic(
        const google::protobuf::Message& message) {
        std::string output;
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::string, TransferFailure>::Err(
                TransferFailure::Encode("Failed to serialize transfer record"));
        }
        coded_out.Trim();
        return Result<std::string, TransferFailure>::Ok(std::move(output));
    }

    void SetTimestamp(google::protobuf::Timestamp* timestamp, const models::TimePoint time) {
        const auto since_epoch = time.time_since_epoch();
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
        timestamp->set_seconds(seconds.count());
        timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
    }

    models::TimePoint GetTimestamp(const google::protobuf::Timestamp& timestamp) {
        const auto since_epoch = std::chrono::seconds(timestamp.seconds()) +
                                 std::chrono::nanoseconds(timestamp.nanos());
        return models::TimePoint(std::chrono::duration_cast<models::Clock::duration>(since_epoch));
    }

    void ToProto(const models::RatchetCheckpoint& checkpoint, proto::RatchetCheckpoint* out) {
        out->set_root_key(checkpoint.root_key.data(), checkpoint.root_key.size());
        out->set_send_chain_key(checkpoint.send_chain_key.data(), checkpoint.send_chain_key.size());
        out->set_recv_chain_key(checkpoint.recv_chain_key.data(), checkpoint.recv_chain_key.size());
        out->set_send_counter(checkpoint.send_counter);
        out->set_recv_counter(checkpoint.recv_counter);
        out->set_epoch(checkpoint.epoch);
        out->set_epoch_base(checkpoint.epoch_base);
    }

    models::RatchetCheckpoint FromProto(const proto::RatchetCheckpoint& in) {
        models::RatchetCheckpoint checkpoint;
        checkpoint.root_key.assign(in.root_key().begin(), in.root_key().end());
        checkpoint.send_chain_key.assign(in.send_chain_key().begin(), in.send_chain_key().end());
        checkpoint.recv_chain_key.assign(in.recv_chain_key().begin(), in.recv_chain_key().end());
        checkpoint.send_counter = in.send_counter();
        checkpoint.recv_counter = in.recv_counter();
        checkpoint.epoch = in.epoch();
        checkpoint.epoch_base = in.epoch_base();
        return checkpoint;
    }

    void WipeString(std::string& value) {
        crypto::WipeQuietly(std::span(reinterpret_cast<uint8_t*>(value.data()), value.size()));
    }

    void WipeCheckpoint(proto::RatchetCheckpoint* checkpoint) {
        WipeString(*checkpoint->mutable_root_key());
        WipeString(*checkpoint->mutable_send_chain_key());
        WipeString(*checkpoint->mutable_recv_chain_key());
    }

    bool IsKnownChunkStatus(const uint32_t value) {
        return value <= static_cast<uint32_t>(ChunkStatus::Failed);
    }

    Result<std::vector<uint8_t>, TransferFailure> SealWithDigest(
        std::vector<uint8_t> body,
        std::span<const uint8_t> store_key) {
        auto digest_result = Digest::Blake2b(body, store_key);
        if (digest_result.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(digest_result.UnwrapErr());
        }
        const auto& digest = digest_result.Unwrap();
        body.insert(body.end(), digest.begin(), digest.end());
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(body));
    }

    Result<bool, TransferFailure> DigestMatches(
        std::span<const uint8_t> body,
        std::span<const uint8_t> digest,
        std::span<const uint8_t> store_key) {
        auto digest_result = Digest::Blake2b(body, store_key);
        if (digest_result.IsErr()) {
            return Result<bool, TransferFailure>::Err(digest_result.UnwrapErr());
        }
        auto equal_result = crypto::SodiumInterop::ConstantTimeEquals(digest_result.Unwrap(), digest);
        if (equal_result.IsErr()) {
            return Result<bool, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(equal_result.UnwrapErr()));
        }
        return Result<bool, TransferFailure>::Ok(equal_result.Unwrap());
    }

    Result<Unit, TransferFailure> ValidateRecord(const proto::TransferRecord& record) {
        if (record.transfer_id().size() != kTransferIdBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Decode("Record transfer id has the wrong size"));
        }
        if (record.direction() > static_cast<uint32_t>(models::TransferDirection::Receive) ||
            record.status() > static_cast<uint32_t>(models::TransferStatus::Aborted)) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Decode("Record direction or status out of range"));
        }
        auto layout_result = codec::ChunkLayout::Create(record.file_size(), record.chunk_size());
        if (layout_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Decode("Record layout is invalid: " + layout_result.UnwrapErr().message));
        }
        const size_t total = record.total_chunks();
        if (layout_result.Unwrap().TotalChunks() != total ||
            record.chunk_status().size() != total ||
            record.chunk_hashes().size() != total * kSha256Bytes ||
            static_cast<size_t>(record.ciphertext_lengths_size()) != total) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Decode("Record chunk table does not match its layout"));
        }
        for (const char status : record.chunk_status()) {
            if (!IsKnownChunkStatus(static_cast<uint8_t>(status))) {
                return Result<Unit, TransferFailure>::Err(
                    TransferFailure::Decode("Record holds an unknown chunk status"));
            }
        }
        if (!record.file_hash().empty() && record.file_hash().size() != kSha256Bytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Decode("Record file hash has the wrong size"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }
}

Result<std::vector<uint8_t>, TransferFailure> TransferRecordCodec::EncodeRecord(
    const TransferState& state,
    const uint64_t generation,
    std::span<const uint8_t> store_key) {
    if (state.chunks.size() != state.total_chunks) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidState("Chunk table does not match total chunk count"));
    }
    proto::TransferRecord record;
    record.set_transfer_id(state.transfer_id.Bytes().data(), state.transfer_id.Bytes().size());
    record.set_direction(static_cast<uint32_t>(state.direction));
    record.set_file_name(state.file_name);
    record.set_local_path(state.local_path);
    record.set_file_size(state.file_size);
    record.set_total_chunks(state.total_chunks);
    record.set_chunk_size(state.chunk_size);
    record.set_file_hash(state.file_hash.data(), state.file_hash.size());

    std::string statuses(state.total_chunks, '\0');
    std::string hashes(static_cast<size_t>(state.total_chunks) * kSha256Bytes, '\0');
    for (const auto& chunk : state.chunks) {
        statuses[chunk.index] = static_cast<char>(chunk.status);
        std::copy(chunk.plaintext_hash.begin(), chunk.plaintext_hash.end(),
                  hashes.begin() + static_cast<std::ptrdiff_t>(chunk.index) * kSha256Bytes);
        record.add_ciphertext_lengths(chunk.ciphertext_length);
    }
    record.set_chunk_status(std::move(statuses));
    record.set_chunk_hashes(std::move(hashes));
    ToProto(state.ratchet_checkpoint, record.mutable_checkpoint());
    record.set_status(static_cast<uint32_t>(state.status));
    if (state.abort_reason.has_value()) {
        record.mutable_abort_reason()->set_type(static_cast<uint32_t>(state.abort_reason->type));
        record.mutable_abort_reason()->set_message(state.abort_reason->message);
    }
    record.set_ratchet_window(state.ratchet_window);
    record.set_rekey_after_chunks(state.rekey_after_chunks);
    record.set_cleanup_after_days(state.cleanup_after_days);
    record.set_completion_grace_days(state.completion_grace_days);
    SetTimestamp(record.mutable_created_at(), state.created_at);
    SetTimestamp(record.mutable_last_updated_at(), state.last_updated_at);
    SetTimestamp(record.mutable_expires_at(), state.expires_at);
    record.set_generation(generation);

    auto serialized_result = SerializeDeterministic(record);
    WipeCheckpoint(record.mutable_checkpoint());
    if (serialized_result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(serialized_result.UnwrapErr());
    }
    auto serialized = std::move(serialized_result).Unwrap();

    std::vector<uint8_t> body;
    body.reserve(kRecordHeaderBytes + serialized.size() + kStoreDigestBytes);
    body.insert(body.end(), kRecordMagic.begin(), kRecordMagic.end());
    AppendUint32BE(body, kRecordFormatVersion);
    AppendUint32BE(body, static_cast<uint32_t>(serialized.size()));
    body.insert(body.end(), serialized.begin(), serialized.end());
    WipeString(serialized);
    return SealWithDigest(std::move(body), store_key);
}

Result<DecodedRecord, TransferFailure> TransferRecordCodec::DecodeRecord(
    std::span<const uint8_t> bytes,
    std::span<const uint8_t> store_key) {
    if (bytes.size() < kRecordHeaderBytes + kStoreDigestBytes || bytes.size() > kMaxRecordBytes) {
        return Result<DecodedRecord, TransferFailure>::Err(
            TransferFailure::Decode(std::format("Record size {} is out of range", bytes.size())));
    }
    if (!std::equal(kRecordMagic.begin(), kRecordMagic.end(), bytes.begin())) {
        return Result<DecodedRecord, TransferFailure>::Err(
            TransferFailure::Decode("Record magic mismatch"));
    }
    const uint32_t version = ReadUint32BE(bytes.subspan(4, 4));
    if (version != kRecordFormatVersion) {
        return Result<DecodedRecord, TransferFailure>::Err(
            TransferFailure::Decode(std::format("Unsupported record version {}", version)));
    }
    const uint32_t length = ReadUint32BE(bytes.subspan(8, 4));
    if (static_cast<size_t>(length) != bytes.size() - kRecordHeaderBytes - kStoreDigestBytes) {
        return Result<DecodedRecord, TransferFailure>::Err(
            TransferFailure::Decode("Record length does not match file size"));
    }
    const auto body = bytes.first(kRecordHeaderBytes + length);
    const auto digest = bytes.subspan(kRecordHeaderBytes + length, kStoreDigestBytes);
    auto matches_result = DigestMatches(body, digest, store_key);
    if (matches_result.IsErr()) {
        return Result<DecodedRecord, TransferFailure>::Err(matches_result.UnwrapErr());
    }
    if (!matches_result.Unwrap()) {
        return Result<DecodedRecord, TransferFailure>::Err(
            TransferFailure::Integrity("Record digest mismatch"));
    }

    proto::TransferRecord record;
    if (!record.ParseFromArray(bytes.data() + kRecordHeaderBytes, static_cast<int>(length))) {
        return Result<DecodedRecord, TransferFailure>::Err(
            TransferFailure::Decode("Record payload is not a TransferRecord"));
    }
    if (auto valid = ValidateRecord(record); valid.IsErr()) {
        WipeCheckpoint(record.mutable_checkpoint());
        return Result<DecodedRecord, TransferFailure>::Err(valid.UnwrapErr());
    }

    DecodedRecord decoded;
    TransferState& state = decoded.state;
    auto id_result = models::TransferId::FromBytes(
        std::span(reinterpret_cast<const uint8_t*>(record.transfer_id().data()), record.transfer_id().size()));
    if (id_result.IsErr()) {
        WipeCheckpoint(record.mutable_checkpoint());
        return Result<DecodedRecord, TransferFailure>::Err(id_result.UnwrapErr());
    }
    state.transfer_id = id_result.Unwrap();
    state.direction = static_cast<models::TransferDirection>(record.direction());
    state.file_name = record.file_name();
    state.local_path = record.local_path();
    state.file_size = record.file_size();
    state.total_chunks = record.total_chunks();
    state.chunk_size = record.chunk_size();
    std::copy(record.file_hash().begin(), record.file_hash().end(), state.file_hash.begin());
    state.chunks.resize(state.total_chunks);
    for (uint32_t i = 0; i < state.total_chunks; ++i) {
        auto& chunk = state.chunks[i];
        chunk.index = i;
        chunk.status = static_cast<ChunkStatus>(static_cast<uint8_t>(record.chunk_status()[i]));
        const auto hash_begin = record.chunk_hashes().begin() + static_cast<std::ptrdiff_t>(i) * kSha256Bytes;
        std::copy(hash_begin, hash_begin + kSha256Bytes, chunk.plaintext_hash.begin());
        chunk.ciphertext_length = record.ciphertext_lengths(static_cast<int>(i));
    }
    state.ratchet_checkpoint = FromProto(record.checkpoint());
    state.status = static_cast<models::TransferStatus>(record.status());
    if (record.has_abort_reason()) {
        state.abort_reason = models::AbortReason{
            static_cast<TransferFailureType>(record.abort_reason().type()),
            record.abort_reason().message()};
    }
    if (record.ratchet_window() != 0) {
        state.ratchet_window = record.ratchet_window();
    }
    if (record.rekey_after_chunks() != 0) {
        state.rekey_after_chunks = record.rekey_after_chunks();
    }
    state.cleanup_after_days = record.cleanup_after_days();
    state.completion_grace_days = record.completion_grace_days();
    state.created_at = GetTimestamp(record.created_at());
    state.last_updated_at = GetTimestamp(record.last_updated_at());
    state.expires_at = GetTimestamp(record.expires_at());
    decoded.generation = record.generation();
    WipeCheckpoint(record.mutable_checkpoint());
    return Result<DecodedRecord, TransferFailure>::Ok(std::move(decoded));
}

Result<std::vector<uint8_t>, TransferFailure> TransferRecordCodec::EncodeJournalEntry(
    const TransferState& state,
    std::span<const uint32_t> changed_indices,
    const uint64_t generation,
    std::span<const uint8_t> store_key) {
    proto::ChunkUpdate update;
    for (const uint32_t index : changed_indices) {
        if (index >= state.chunks.size()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::InvalidInput(std::format("Journal entry for unknown chunk {}", index)));
        }
        const auto& chunk = state.chunks[index];
        auto* entry = update.add_chunks();
        entry->set_index(chunk.index);
        entry->set_status(static_cast<uint32_t>(chunk.status));
        entry->set_plaintext_hash(chunk.plaintext_hash.data(), chunk.plaintext_hash.size());
        entry->set_ciphertext_length(chunk.ciphertext_length);
    }
    ToProto(state.ratchet_checkpoint, update.mutable_checkpoint());
    SetTimestamp(update.mutable_updated_at(), state.last_updated_at);
    update.set_generation(generation);

    auto serialized_result = SerializeDeterministic(update);
    WipeCheckpoint(update.mutable_checkpoint());
    if (serialized_result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(serialized_result.UnwrapErr());
    }
    auto serialized = std::move(serialized_result).Unwrap();
    if (serialized.size() > kMaxJournalEntryBytes) {
        WipeString(serialized);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Encode(std::format("Journal entry of {} bytes is too large", serialized.size())));
    }
    std::vector<uint8_t> body;
    body.reserve(kLengthPrefixBytes + serialized.size() + kStoreDigestBytes);
    AppendUint32BE(body, static_cast<uint32_t>(serialized.size()));
    body.insert(body.end(), serialized.begin(), serialized.end());
    WipeString(serialized);
    return SealWithDigest(std::move(body), store_key);
}

Result<JournalReplay, TransferFailure> TransferRecordCodec::ReplayJournal(
    std::span<const uint8_t> journal,
    std::span<const uint8_t> store_key,
    const uint64_t generation,
    TransferState& state) {
    JournalReplay replay;
    size_t offset = 0;
    while (offset < journal.size()) {
        const auto remaining = journal.subspan(offset);
        if (remaining.size() < kLengthPrefixBytes) {
            replay.torn_tail = true;
            break;
        }
        const uint32_t length = ReadUint32BE(remaining);
        const size_t entry_bytes = kLengthPrefixBytes + static_cast<size_t>(length) + kStoreDigestBytes;
        if (length > kMaxJournalEntryBytes || remaining.size() < entry_bytes) {
            replay.torn_tail = true;
            break;
        }
        const auto body = remaining.first(kLengthPrefixBytes + length);
        const auto digest = remaining.subspan(kLengthPrefixBytes + length, kStoreDigestBytes);
        auto matches_result = DigestMatches(body, digest, store_key);
        if (matches_result.IsErr()) {
            return Result<JournalReplay, TransferFailure>::Err(matches_result.UnwrapErr());
        }
        proto::ChunkUpdate update;
        if (!matches_result.Unwrap() ||
            !update.ParseFromArray(remaining.data() + kLengthPrefixBytes, static_cast<int>(length))) {
            replay.torn_tail = true;
            break;
        }
        offset += entry_bytes;
        replay.valid_bytes = offset;

        if (update.generation() != generation) {
            ++replay.stale_entries;
            WipeCheckpoint(update.mutable_checkpoint());
            continue;
        }
        for (const auto& entry : update.chunks()) {
            if (entry.index() >= state.chunks.size() || !IsKnownChunkStatus(entry.status()) ||
                entry.plaintext_hash().size() != kSha256Bytes) {
                WipeCheckpoint(update.mutable_checkpoint());
                return Result<JournalReplay, TransferFailure>::Err(
                    TransferFailure::Decode(
                        std::format("Journal entry references invalid chunk {}", entry.index())));
            }
            auto& chunk = state.chunks[entry.index()];
            chunk.status = static_cast<ChunkStatus>(entry.status());
            std::copy(entry.plaintext_hash().begin(), entry.plaintext_hash().end(), chunk.plaintext_hash.begin());
            chunk.ciphertext_length = entry.ciphertext_length();
        }
        if (update.has_checkpoint()) {
            state.ratchet_checkpoint = FromProto(update.checkpoint());
        }
        state.Touch(GetTimestamp(update.updated_at()));
        ++replay.applied_entries;
        WipeCheckpoint(update.mutable_checkpoint());
    }
    return Result<JournalReplay, TransferFailure>::Ok(replay);
}

}
