#include "tallow/engine/transfer_session.hpp"
#include "tallow/cipher/control_cipher.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/engine/file_names.hpp"
#include "tallow/negotiation/session_negotiator.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

namespace tallow::transfer::engine {

namespace pb = tallow::proto::transfer;
using models::ChunkStatus;
using models::TransferDirection;
using models::TransferStatus;

namespace {

    Result<std::vector<uint8_t>, TransferFailure> SerializeDeterministic(const google::protobuf::Message& message) {
        std::string output;
        google::protobuf::io::StringOutputStream stream(&output);
        {
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, TransferFailure>::Err(
                    TransferFailure::Encode("Failed to serialize sealed body"));
            }
        }
        std::vector<uint8_t> bytes(output.begin(), output.end());
        crypto::WipeQuietly(std::span(reinterpret_cast<uint8_t*>(output.data()), output.size()));
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(bytes));
    }

}

TransferFailure TransferSession::FailureFromWire(const uint32_t reason, const std::string& message) {
    if (reason > static_cast<uint32_t>(TransferFailureType::Cancelled)) {
        return TransferFailure::Generic(message);
    }
    return TransferFailure(static_cast<TransferFailureType>(reason), message);
}

std::optional<TransferFailure> TransferSession::RejectionIn(const pb::Frame& frame) {
    if (frame.type() != pb::FRAME_TYPE_HANDSHAKE) {
        return std::nullopt;
    }
    pb::Handshake handshake;
    if (!handshake.ParseFromString(frame.payload()) || !handshake.has_reject()) {
        return std::nullopt;
    }
    return FailureFromWire(handshake.reject().reason(), "Peer rejected: " + handshake.reject().message());
}

TransferProgress TransferProgress::FromState(const models::TransferState& state) {
    TransferProgress progress;
    progress.transfer_id = state.transfer_id;
    progress.direction = state.direction;
    progress.chunks_done = state.ChunksDone();
    progress.total_chunks = state.total_chunks;
    progress.bytes_done = state.BytesDone();
    progress.file_size = state.file_size;
    progress.missing_chunks = state.MissingChunks();
    progress.status = state.status;
    progress.abort_reason = state.abort_reason;
    return progress;
}

TransferSession::TransferSession(SessionContext context, const Origin origin, const models::TransferId transfer_id,
                                 std::shared_ptr<interfaces::IPeerChannel> channel,
                                 configuration::TransferConfig config)
    : context_(std::move(context)),
      origin_(origin),
      transfer_id_(transfer_id),
      transfer_id_bytes_(transfer_id.Bytes().begin(), transfer_id.Bytes().end()),
      config_(config),
      meter_(config.ProgressInterval()),
      channel_(std::move(channel)),
      pool_(std::make_unique<ChunkWorkerPool>(config.WorkerThreads())) {
    state_.transfer_id = transfer_id;
    state_.ratchet_window = config_.ReceiveWindow();
    state_.rekey_after_chunks = config_.RekeyAfterChunks();
    state_.cleanup_after_days = config_.CleanupAfterDays();
    state_.completion_grace_days = config_.CompletionGraceDays();
}

std::unique_ptr<TransferSession> TransferSession::ForOutgoing(
    SessionContext context,
    models::TransferId transfer_id,
    std::filesystem::path source,
    std::shared_ptr<interfaces::IPeerChannel> channel,
    configuration::TransferConfig config) {
    std::unique_ptr<TransferSession> session(new TransferSession(
        std::move(context), Origin::Outgoing, transfer_id, std::move(channel), config));
    session->source_path_ = std::move(source);
    session->state_.direction = TransferDirection::Send;
    return session;
}

std::unique_ptr<TransferSession> TransferSession::ForIncoming(
    SessionContext context,
    models::TransferId transfer_id,
    pb::Frame offer_frame,
    std::shared_ptr<interfaces::IPeerChannel> channel,
    configuration::TransferConfig config) {
    std::unique_ptr<TransferSession> session(new TransferSession(
        std::move(context), Origin::Incoming, transfer_id, std::move(channel), config));
    session->pending_frame_ = std::move(offer_frame);
    session->state_.direction = TransferDirection::Receive;
    return session;
}

std::unique_ptr<TransferSession> TransferSession::ForRecord(
    SessionContext context,
    models::TransferState state,
    std::shared_ptr<interfaces::IPeerChannel> channel,
    configuration::TransferConfig config,
    std::optional<pb::Frame> resume_frame) {
    const models::TransferId transfer_id = state.transfer_id;
    std::unique_ptr<TransferSession> session(new TransferSession(
        std::move(context), Origin::Record, transfer_id, std::move(channel), config));
    session->state_ = std::move(state);
    session->persisted_ = true;
    session->pending_frame_ = std::move(resume_frame);
    return session;
}

TransferSession::~TransferSession() {
    Shutdown();
    crypto::WipeQuietly(control_key_);
}

void TransferSession::Start() {
    running_ = true;
    thread_ = std::thread(&TransferSession::Run, this);
}

Result<Unit, TransferFailure> TransferSession::RequestPause() {
    const TransferStatus status = Status();
    if (!running_ || (status != TransferStatus::Transferring && status != TransferStatus::Resuming)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState(std::format("Cannot pause a transfer that is {}", models::ToString(status))));
    }
    {
        std::lock_guard guard(command_lock_);
        command_ = Command::Pause;
    }
    command_signal_.notify_all();
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::RequestResume(std::shared_ptr<interfaces::IPeerChannel> channel) {
    const TransferStatus status = Status();
    if (!running_ || status != TransferStatus::Paused) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState(std::format("Cannot resume a transfer that is {}", models::ToString(status))));
    }
    {
        std::lock_guard guard(command_lock_);
        if (channel) {
            channel_ = std::move(channel);
        }
        command_ = Command::Resume;
    }
    command_signal_.notify_all();
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::RequestCancel() {
    const TransferStatus status = Status();
    if (!running_ || models::IsTerminal(status)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState(std::format("Cannot cancel a transfer that is {}", models::ToString(status))));
    }
    {
        std::lock_guard guard(command_lock_);
        command_ = Command::Cancel;
    }
    command_signal_.notify_all();
    return Result<Unit, TransferFailure>::Ok(unit);
}

void TransferSession::Shutdown() {
    {
        std::lock_guard guard(command_lock_);
        shutdown_ = true;
    }
    command_signal_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

TransferProgress TransferSession::Progress() const {
    std::lock_guard guard(state_lock_);
    return TransferProgress::FromState(state_);
}

models::TransferStatus TransferSession::Status() const {
    std::lock_guard guard(state_lock_);
    return state_.status;
}

models::TransferDirection TransferSession::Direction() const {
    return state_.direction;
}

void TransferSession::Run() {
    auto begun = Begin();
    Step step = begun.IsOk() ? begun.Unwrap() : HandleFailure(begun.UnwrapErr());
    while (step != Step::Done) {
        StepResult next = StepResult::Ok(Step::Done);
        switch (step) {
            case Step::Transfer:
                next = Direction() == TransferDirection::Send ? SendLoop() : ReceiveLoop();
                break;
            case Step::Paused:
                next = StepResult::Ok(WaitWhilePaused());
                break;
            case Step::Resume:
                next = StepResult::Ok(ResumeWithBackoff());
                break;
            case Step::AnswerResume:
                next = StepResult::Ok(AnswerPendingResume());
                break;
            case Step::Done:
                break;
        }
        step = next.IsOk() ? next.Unwrap() : HandleFailure(next.UnwrapErr());
    }
    DrainWorkers();
    pool_->Stop();
    TALLOW_LOG_DEBUG("Session thread of {} finished in state {}",
                     transfer_id_.ToString(), models::ToString(Status()));
    running_ = false;
}

TransferSession::StepResult TransferSession::Begin() {
    switch (origin_) {
        case Origin::Outgoing:
            TALLOW_TRY(NegotiateAsSender());
            return StepResult::Ok(Step::Transfer);
        case Origin::Incoming:
            TALLOW_TRY(NegotiateAsReceiver());
            return StepResult::Ok(Step::Transfer);
        case Origin::Record:
            TALLOW_TRY(PrepareFromRecord());
            return StepResult::Ok(pending_frame_.has_value() ? Step::AnswerResume : Step::Resume);
    }
    return StepResult::Err(TransferFailure::InvalidState("Unknown session origin"));
}

TransferSession::Step TransferSession::HandleFailure(const TransferFailure& failure) {
    if (peer_terminated_) {
        return AbortTransfer(failure, false);
    }
    if (!established_ || !failure.IsRecoverable()) {
        return AbortTransfer(failure, true);
    }
    TALLOW_LOG_WARN("Transfer {} interrupted: {}", transfer_id_.ToString(), failure.Describe());
    interruption_ = failure;
    PauseTransfer(false);
    if (ShutdownRequested()) {
        return Step::Done;
    }
    return config_.AutoResume() ? Step::Resume : Step::Paused;
}

Result<Unit, TransferFailure> TransferSession::NegotiateAsSender() {
    EmitStatus();
    auto hash_result = codec::ChunkHasher::HashFile(source_path_);
    if (hash_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(hash_result.UnwrapErr());
    }
    auto reader_result = codec::ChunkReader::Open(source_path_, config_.ChunkSize());
    if (reader_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(reader_result.UnwrapErr());
    }
    reader_ = std::move(reader_result).Unwrap();
    const codec::ChunkLayout& layout = reader_->Layout();

    std::error_code error;
    const std::filesystem::path absolute = std::filesystem::absolute(source_path_, error);
    {
        std::lock_guard guard(state_lock_);
        state_.file_name = source_path_.filename().string();
        state_.local_path = (error ? source_path_ : absolute).string();
        state_.file_size = layout.FileSize();
        state_.total_chunks = layout.TotalChunks();
        state_.chunk_size = layout.ChunkSize();
        state_.file_hash = hash_result.Unwrap();
        state_.chunks.assign(layout.TotalChunks(), models::ChunkRecord{});
        for (uint32_t i = 0; i < layout.TotalChunks(); ++i) {
            state_.chunks[i].index = i;
        }
        state_.created_at = models::Clock::now();
    }

    auto initiator_result = negotiation::NegotiationInitiator::Start(
        transfer_id_bytes_, pb::HANDSHAKE_PURPOSE_INITIAL, 0);
    if (initiator_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(initiator_result.UnwrapErr());
    }
    auto initiator = std::move(initiator_result).Unwrap();
    pb::Handshake offer;
    *offer.mutable_offer() = initiator->Offer();
    TALLOW_TRY(SendHandshake(offer));

    using AcceptStep = Result<std::optional<pb::HandshakeAccept>, TransferFailure>;
    auto accept_result = AwaitFrame<pb::HandshakeAccept>(
        config_.HandshakeTimeout(),
        [this](const pb::Frame& frame) -> AcceptStep {
            if (frame.type() != pb::FRAME_TYPE_HANDSHAKE) {
                return AcceptStep::Ok(std::nullopt);
            }
            pb::Handshake handshake;
            if (!handshake.ParseFromString(frame.payload())) {
                return AcceptStep::Err(TransferFailure::Handshake("Malformed handshake frame"));
            }
            if (handshake.has_reject()) {
                peer_terminated_ = true;
                return AcceptStep::Err(
                    TransferFailure::Handshake("Peer rejected the handshake: " + handshake.reject().message()));
            }
            if (handshake.has_accept()) {
                return AcceptStep::Ok(handshake.accept());
            }
            return AcceptStep::Ok(std::nullopt);
        });
    if (accept_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(accept_result.UnwrapErr());
    }
    {
        auto secret_result = initiator->Finish(accept_result.Unwrap());
        if (secret_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(secret_result.UnwrapErr());
        }
        TALLOW_TRY(SeedRatchet(ratchet::RatchetRole::Initiator, secret_result.Unwrap()));
    }
    initiator.reset();
    TALLOW_TRY(SaveState());

    pb::Control control;
    pb::Manifest* manifest = control.mutable_manifest();
    manifest->set_file_name(state_.file_name);
    manifest->set_file_size(state_.file_size);
    manifest->set_chunk_size(state_.chunk_size);
    manifest->set_total_chunks(state_.total_chunks);
    manifest->set_file_hash(std::string(state_.file_hash.begin(), state_.file_hash.end()));
    manifest->set_ratchet_window(state_.ratchet_window);
    manifest->set_rekey_after_chunks(state_.rekey_after_chunks);
    TALLOW_TRY(SendControl(control));

    using AcceptedStep = Result<std::optional<Unit>, TransferFailure>;
    auto accepted = AwaitFrame<Unit>(
        config_.HandshakeTimeout(),
        [this](const pb::Frame& frame) -> AcceptedStep {
            if (auto rejection = RejectionIn(frame)) {
                peer_terminated_ = true;
                return AcceptedStep::Err(*rejection);
            }
            if (frame.type() != pb::FRAME_TYPE_CONTROL) {
                return AcceptedStep::Ok(std::nullopt);
            }
            auto control_result = OpenControl(frame);
            if (control_result.IsErr()) {
                return AcceptedStep::Err(control_result.UnwrapErr());
            }
            const pb::Control& reply = control_result.Unwrap();
            if (reply.has_manifest_accept()) {
                return AcceptedStep::Ok(unit);
            }
            if (reply.has_abort()) {
                peer_terminated_ = true;
                return AcceptedStep::Err(FailureFromWire(reply.abort().reason(), reply.abort().message()));
            }
            if (reply.has_cancel()) {
                peer_terminated_ = true;
                return AcceptedStep::Err(TransferFailure::Cancelled("Peer declined the transfer"));
            }
            return AcceptedStep::Ok(std::nullopt);
        });
    TALLOW_TRY(accepted);

    established_ = true;
    SetStatus(TransferStatus::Transferring);
    TALLOW_TRY(SaveState());
    RebuildSendQueue();
    EmitStatus();
    TALLOW_LOG_INFO("Transfer {} negotiated: sending {} ({} bytes in {} chunks)",
                    transfer_id_.ToString(), state_.file_name, state_.file_size, state_.total_chunks);
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::NegotiateAsReceiver() {
    EmitStatus();
    if (!pending_frame_.has_value()) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState("No handshake offer to answer"));
    }
    const pb::Frame frame = std::move(*pending_frame_);
    pending_frame_.reset();

    pb::Handshake handshake;
    if (frame.type() != pb::FRAME_TYPE_HANDSHAKE || !handshake.ParseFromString(frame.payload()) ||
        !handshake.has_offer()) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::Handshake("Expected a handshake offer"));
    }
    if (handshake.offer().purpose() != pb::HANDSHAKE_PURPOSE_INITIAL) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Handshake("A rekey offer cannot open a transfer"));
    }
    auto responder_result = negotiation::NegotiationResponder::Process(handshake.offer(), transfer_id_bytes_);
    if (responder_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(responder_result.UnwrapErr());
    }
    auto responder = std::move(responder_result).Unwrap();
    pb::Handshake reply;
    *reply.mutable_accept() = responder->Accept();
    TALLOW_TRY(SendHandshake(reply));

    {
        auto secret_result = responder->TakeSharedSecret();
        if (secret_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(secret_result.UnwrapErr());
        }
        TALLOW_TRY(SeedRatchet(ratchet::RatchetRole::Responder, secret_result.Unwrap()));
    }
    responder.reset();

    using ManifestStep = Result<std::optional<pb::Manifest>, TransferFailure>;
    auto manifest_result = AwaitFrame<pb::Manifest>(
        config_.HandshakeTimeout(),
        [this](const pb::Frame& incoming) -> ManifestStep {
            if (auto rejection = RejectionIn(incoming)) {
                peer_terminated_ = true;
                return ManifestStep::Err(*rejection);
            }
            if (incoming.type() != pb::FRAME_TYPE_CONTROL) {
                return ManifestStep::Ok(std::nullopt);
            }
            auto control_result = OpenControl(incoming);
            if (control_result.IsErr()) {
                return ManifestStep::Err(control_result.UnwrapErr());
            }
            const pb::Control& control = control_result.Unwrap();
            if (control.has_manifest()) {
                return ManifestStep::Ok(control.manifest());
            }
            if (control.has_abort()) {
                peer_terminated_ = true;
                return ManifestStep::Err(FailureFromWire(control.abort().reason(), control.abort().message()));
            }
            return ManifestStep::Ok(std::nullopt);
        });
    if (manifest_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(manifest_result.UnwrapErr());
    }
    TALLOW_TRY(AcceptManifest(manifest_result.Unwrap()));
    // Same chains and control key, rebuilt under the sender's limits.
    TALLOW_TRY(UpdateCheckpoint());
    TALLOW_TRY(RestoreRatchet());

    established_ = true;
    SetStatus(TransferStatus::Transferring);
    TALLOW_TRY(SaveState());
    pb::Control control;
    control.mutable_manifest_accept();
    TALLOW_TRY(SendControl(control));
    EmitStatus();
    TALLOW_LOG_INFO("Transfer {} negotiated: receiving {} ({} bytes in {} chunks) into {}",
                    transfer_id_.ToString(), state_.file_name, state_.file_size,
                    state_.total_chunks, state_.local_path);
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::AcceptManifest(const pb::Manifest& manifest) {
    if (!configuration::TransferConfig::IsAllowedChunkSize(manifest.chunk_size())) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(std::format("Manifest chunk size {} is not allowed", manifest.chunk_size())));
    }
    auto layout_result = codec::ChunkLayout::Create(manifest.file_size(), manifest.chunk_size());
    if (layout_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(layout_result.UnwrapErr());
    }
    const codec::ChunkLayout layout = layout_result.Unwrap();
    if (layout.TotalChunks() != manifest.total_chunks()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("Manifest chunk count does not match its file size"));
    }
    if (manifest.file_hash().size() != kSha256Bytes) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidInput("Manifest file hash has the wrong size"));
    }
    if (manifest.ratchet_window() == 0 || manifest.rekey_after_chunks() == 0) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidInput("Manifest ratchet limits are missing"));
    }
    auto name_result = SanitizeFileName(manifest.file_name());
    if (name_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(name_result.UnwrapErr());
    }
    const std::string name = std::move(name_result).Unwrap();

    std::error_code error;
    std::filesystem::create_directories(context_.download_directory, error);
    if (error) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Storage("Cannot create download directory: " + error.message()));
    }
    const std::filesystem::path destination = UniqueDestination(context_.download_directory, name);
    auto writer_result = codec::ChunkWriter::Open(destination, layout, context_.sync_writes, false);
    if (writer_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(writer_result.UnwrapErr());
    }
    writer_ = std::move(writer_result).Unwrap();

    std::lock_guard guard(state_lock_);
    state_.file_name = name;
    state_.local_path = destination.string();
    state_.file_size = layout.FileSize();
    state_.total_chunks = layout.TotalChunks();
    state_.chunk_size = layout.ChunkSize();
    std::copy(manifest.file_hash().begin(), manifest.file_hash().end(), state_.file_hash.begin());
    state_.chunks.assign(layout.TotalChunks(), models::ChunkRecord{});
    for (uint32_t i = 0; i < layout.TotalChunks(); ++i) {
        state_.chunks[i].index = i;
    }
    state_.ratchet_window = manifest.ratchet_window();
    state_.rekey_after_chunks = manifest.rekey_after_chunks();
    state_.created_at = models::Clock::now();
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::PrepareFromRecord() {
    if (models::IsTerminal(state_.status)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState(std::format("Transfer {} is already {}",
                                                      transfer_id_.ToString(), models::ToString(state_.status))));
    }
    if (Direction() == TransferDirection::Send) {
        auto reader_result = codec::ChunkReader::Open(state_.local_path, state_.chunk_size);
        if (reader_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(reader_result.UnwrapErr());
        }
        reader_ = std::move(reader_result).Unwrap();
        if (reader_->Layout().FileSize() != state_.file_size) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Integrity("Source file changed size since the transfer started"));
        }
        RebuildSendQueue();
    } else {
        auto layout_result = codec::ChunkLayout::Create(state_.file_size, state_.chunk_size);
        if (layout_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(layout_result.UnwrapErr());
        }
        auto writer_result = codec::ChunkWriter::Open(
            state_.local_path, layout_result.Unwrap(), context_.sync_writes, true);
        if (writer_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(writer_result.UnwrapErr());
        }
        writer_ = std::move(writer_result).Unwrap();
    }
    TALLOW_TRY(RestoreRatchet());
    established_ = true;
    EmitStatus();
    TALLOW_LOG_INFO("Transfer {} restored from its record at {}/{} chunks",
                    transfer_id_.ToString(), state_.ChunksDone(), state_.total_chunks);
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::SeedRatchet(const ratchet::RatchetRole role,
                                                           const crypto::SecureMemoryHandle& secret) {
    const ratchet::RatchetLimits limits{state_.ratchet_window, state_.rekey_after_chunks};
    auto engine_result = ratchet::RatchetEngine::Seed(role, secret, transfer_id_bytes_, limits);
    if (engine_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(engine_result.UnwrapErr());
    }
    ratchet_ = std::move(engine_result).Unwrap();
    TALLOW_TRY(RefreshControlKey());
    return UpdateCheckpoint();
}

Result<Unit, TransferFailure> TransferSession::RestoreRatchet() {
    const models::RatchetCheckpoint& checkpoint = state_.ratchet_checkpoint;
    const bool sending = Direction() == TransferDirection::Send;
    const uint64_t frontier = sending ? checkpoint.send_counter : checkpoint.recv_counter;
    std::vector<uint64_t> released;
    for (const models::ChunkRecord& chunk : state_.chunks) {
        if (chunk.index >= frontier && state_.IsChunkDone(chunk.index)) {
            released.push_back(chunk.index);
        }
    }
    const ratchet::RatchetLimits limits{state_.ratchet_window, state_.rekey_after_chunks};
    const std::span<const uint64_t> none;
    auto engine_result = ratchet::RatchetEngine::FromCheckpoint(
        sending ? ratchet::RatchetRole::Initiator : ratchet::RatchetRole::Responder,
        checkpoint, transfer_id_bytes_, limits,
        sending ? std::span<const uint64_t>(released) : none,
        sending ? none : std::span<const uint64_t>(released));
    if (engine_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(engine_result.UnwrapErr());
    }
    ratchet_ = std::move(engine_result).Unwrap();
    return RefreshControlKey();
}

Result<Unit, TransferFailure> TransferSession::RefreshControlKey() {
    auto key_result = ratchet_->DeriveControlKey();
    if (key_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(key_result.UnwrapErr());
    }
    crypto::WipeQuietly(control_key_);
    control_key_ = std::move(key_result).Unwrap();
    return Result<Unit, TransferFailure>::Ok(unit);
}

TransferSession::StepResult TransferSession::ContinueTransferring() {
    SetStatus(TransferStatus::Transferring);
    TALLOW_TRY(SaveState());
    EmitStatus();
    return StepResult::Ok(Step::Transfer);
}

TransferSession::Step TransferSession::PauseTransfer(const bool notify_peer) {
    DrainWorkers();
    SetStatus(TransferStatus::Paused);
    if (persisted_) {
        if (auto saved = SaveState(); saved.IsErr()) {
            TALLOW_LOG_ERROR("Transfer {} could not persist its paused state: {}",
                             transfer_id_.ToString(), saved.UnwrapErr().Describe());
        }
    }
    if (notify_peer) {
        pb::Control control;
        control.mutable_pause();
        if (auto sent = SendControl(control); sent.IsErr()) {
            TALLOW_LOG_WARN("Could not tell the peer that {} paused: {}",
                            transfer_id_.ToString(), sent.UnwrapErr().Describe());
        }
    }
    EmitStatus();
    TALLOW_LOG_INFO("Transfer {} paused at {}/{} chunks",
                    transfer_id_.ToString(), state_.ChunksDone(), state_.total_chunks);
    return Step::Paused;
}

TransferSession::Step TransferSession::AbortTransfer(const TransferFailure& failure, const bool notify_peer) {
    DrainWorkers();
    {
        std::lock_guard guard(state_lock_);
        state_.status = TransferStatus::Aborted;
        state_.abort_reason = models::AbortReason::FromFailure(failure);
    }
    if (persisted_) {
        if (auto saved = SaveState(); saved.IsErr()) {
            TALLOW_LOG_ERROR("Transfer {} could not persist its abort: {}",
                             transfer_id_.ToString(), saved.UnwrapErr().Describe());
        }
    }
    if (notify_peer && !peer_terminated_) {
        NotifyPeerOfAbort(failure);
    }
    EmitStatus();
    TALLOW_LOG_ERROR("Transfer {} aborted: {}", transfer_id_.ToString(), failure.Describe());
    return Step::Done;
}

void TransferSession::NotifyPeerOfAbort(const TransferFailure& failure) {
    Result<Unit, TransferFailure> sent = Result<Unit, TransferFailure>::Ok(unit);
    if (ratchet_ && !control_key_.empty()) {
        pb::Control control;
        if (failure.type == TransferFailureType::Cancelled) {
            control.mutable_cancel();
        } else {
            control.mutable_abort()->set_reason(static_cast<uint32_t>(failure.type));
            control.mutable_abort()->set_message(failure.message);
        }
        sent = SendControl(control);
    } else {
        pb::Handshake handshake;
        handshake.mutable_reject()->set_reason(static_cast<uint32_t>(failure.type));
        handshake.mutable_reject()->set_message(failure.message);
        sent = SendHandshake(handshake);
    }
    if (sent.IsErr()) {
        TALLOW_LOG_DEBUG("Peer of {} was not told about the abort: {}",
                         transfer_id_.ToString(), sent.UnwrapErr().Describe());
    }
}

std::optional<TransferSession::Step> TransferSession::HandlePeerTermination(
    const pb::Frame& frame,
    const pb::Control* control) {
    if (auto rejection = RejectionIn(frame)) {
        peer_terminated_ = true;
        return AbortTransfer(*rejection, false);
    }
    if (control == nullptr) {
        return std::nullopt;
    }
    switch (control->body_case()) {
        case pb::Control::kPause:
            TALLOW_LOG_INFO("Peer paused transfer {}", transfer_id_.ToString());
            return PauseTransfer(false);
        case pb::Control::kCancel:
            peer_terminated_ = true;
            return AbortTransfer(TransferFailure::Cancelled("Peer cancelled the transfer"), false);
        case pb::Control::kAbort:
            peer_terminated_ = true;
            return AbortTransfer(FailureFromWire(control->abort().reason(), control->abort().message()), false);
        default:
            return std::nullopt;
    }
}

TransferSession::Step TransferSession::WaitWhilePaused() {
    while (true) {
        switch (WaitForCommand(kPollSlice)) {
            case Command::Shutdown:
                return Step::Done;
            case Command::Cancel:
                return AbortTransfer(TransferFailure::Cancelled("Transfer cancelled"), true);
            case Command::Resume:
                return Step::Resume;
            case Command::Pause:
            case Command::None:
                break;
        }
        auto channel = Channel();
        if (!channel || !channel->IsOpen()) {
            continue;
        }
        auto frame_result = ReceiveFrame(std::chrono::milliseconds::zero());
        if (frame_result.IsErr()) {
            continue;
        }
        const pb::Frame& frame = frame_result.Unwrap();
        if (frame.type() == pb::FRAME_TYPE_HANDSHAKE) {
            if (auto step = HandlePeerTermination(frame, nullptr)) {
                return *step;
            }
            continue;
        }
        if (frame.type() != pb::FRAME_TYPE_CONTROL) {
            continue;
        }
        auto control_result = OpenControl(frame);
        if (control_result.IsErr()) {
            TALLOW_LOG_DEBUG("Paused transfer {} ignored a control frame: {}",
                             transfer_id_.ToString(), control_result.UnwrapErr().Describe());
            continue;
        }
        const pb::Control& control = control_result.Unwrap();
        if (control.has_resume_request()) {
            SetStatus(TransferStatus::Resuming);
            EmitStatus();
            if (auto answered = AnswerResumeRequest(control.resume_request()); answered.IsErr()) {
                TALLOW_LOG_WARN("Transfer {} refused a resume request: {}",
                                transfer_id_.ToString(), answered.UnwrapErr().Describe());
                SetStatus(TransferStatus::Paused);
                EmitStatus();
                continue;
            }
            auto next = ContinueTransferring();
            return next.IsOk() ? next.Unwrap() : HandleFailure(next.UnwrapErr());
        }
        if (control.has_pause()) {
            continue;
        }
        if (auto step = HandlePeerTermination(frame, &control)) {
            return *step;
        }
    }
}

TransferSession::Step TransferSession::ResumeWithBackoff() {
    SetStatus(TransferStatus::Resuming);
    if (auto saved = SaveState(); saved.IsErr()) {
        TALLOW_LOG_WARN("Transfer {} could not persist Resuming: {}",
                        transfer_id_.ToString(), saved.UnwrapErr().Describe());
    }
    EmitStatus();

    const uint32_t attempts = config_.MaxResumeAttempts();
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        switch (WaitForCommand(config_.BackoffBeforeAttempt(attempt))) {
            case Command::Shutdown:
                PauseTransfer(false);
                return Step::Done;
            case Command::Cancel:
                return AbortTransfer(TransferFailure::Cancelled("Transfer cancelled"), true);
            case Command::Pause:
                return PauseTransfer(false);
            case Command::Resume:
            case Command::None:
                break;
        }
        TALLOW_LOG_INFO("Transfer {} resume attempt {}/{}", transfer_id_.ToString(), attempt, attempts);

        std::optional<TransferFailure> failure;
        if (auto resumed = TryResume(); resumed.IsErr()) {
            failure = std::move(resumed).UnwrapErr();
        } else if (auto next = ContinueTransferring(); next.IsErr()) {
            failure = std::move(next).UnwrapErr();
        } else {
            TALLOW_LOG_INFO("Transfer {} resumed at {}/{} chunks",
                            transfer_id_.ToString(), state_.ChunksDone(), state_.total_chunks);
            return next.Unwrap();
        }

        if (peer_terminated_) {
            return AbortTransfer(*failure, false);
        }
        if (failure->type == TransferFailureType::Cancelled) {
            return AbortTransfer(*failure, true);
        }
        if (ShutdownRequested()) {
            PauseTransfer(false);
            return Step::Done;
        }
        if (!failure->IsRecoverable() && failure->type != TransferFailureType::Timeout) {
            return AbortTransfer(*failure, failure->type != TransferFailureType::NotFound);
        }
        TALLOW_LOG_WARN("Transfer {} resume attempt {} failed: {}",
                        transfer_id_.ToString(), attempt, failure->Describe());
        const bool storage_pending =
            interruption_.has_value() && interruption_->type == TransferFailureType::Storage;
        if (failure->IsRecoverable() && !storage_pending) {
            interruption_ = *failure;
            EmitStatus();
        }
    }
    // A local storage fault stays a storage fault; anything else is the link.
    const bool storage_fault = interruption_.has_value() && interruption_->type == TransferFailureType::Storage;
    const std::string message = std::format("Resume failed after {} attempts", attempts);
    return AbortTransfer(storage_fault ? TransferFailure::Storage(message) : TransferFailure::Transport(message),
                         false);
}

Result<Unit, TransferFailure> TransferSession::TryResume() {
    auto channel = Channel();
    if (!channel) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::Transport("No peer channel"));
    }
    TALLOW_TRY(channel->Reconnect(config_.ResumeTimeout()));
    DrainWorkers();
    TALLOW_TRY(UpdateCheckpoint());
    TALLOW_TRY(RestoreRatchet());

    pb::Control control;
    pb::ResumeRequest* request = control.mutable_resume_request();
    request->set_epoch(ratchet_->Epoch());
    request->set_total_chunks(state_.total_chunks);
    const std::vector<uint8_t> bitmap = state_.DoneBitmap();
    request->set_bitmap(std::string(bitmap.begin(), bitmap.end()));
    TALLOW_TRY(SendControl(control));

    using ResponseStep = Result<std::optional<pb::ResumeResponse>, TransferFailure>;
    auto response_result = AwaitFrame<pb::ResumeResponse>(
        config_.ResumeTimeout(),
        [this](const pb::Frame& frame) -> ResponseStep {
            if (auto rejection = RejectionIn(frame)) {
                if (rejection->type == TransferFailureType::NotFound) {
                    return ResponseStep::Err(TransferFailure::NotFound("Peer has no record of this transfer"));
                }
                peer_terminated_ = true;
                return ResponseStep::Err(*rejection);
            }
            if (frame.type() != pb::FRAME_TYPE_CONTROL) {
                return ResponseStep::Ok(std::nullopt);
            }
            auto control_result = OpenControl(frame);
            if (control_result.IsErr()) {
                TALLOW_LOG_DEBUG("Resuming transfer {} ignored a control frame: {}",
                                 transfer_id_.ToString(), control_result.UnwrapErr().Describe());
                return ResponseStep::Ok(std::nullopt);
            }
            const pb::Control& reply = control_result.Unwrap();
            if (reply.has_resume_response()) {
                return ResponseStep::Ok(reply.resume_response());
            }
            if (reply.has_resume_request()) {
                TALLOW_TRY(AnswerResumeRequest(reply.resume_request()));
                return ResponseStep::Ok(std::nullopt);
            }
            if (reply.has_cancel()) {
                peer_terminated_ = true;
                return ResponseStep::Err(TransferFailure::Cancelled("Peer cancelled the transfer"));
            }
            if (reply.has_abort()) {
                peer_terminated_ = true;
                return ResponseStep::Err(FailureFromWire(reply.abort().reason(), reply.abort().message()));
            }
            return ResponseStep::Ok(std::nullopt);
        });
    if (response_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(response_result.UnwrapErr());
    }
    const pb::ResumeResponse& response = response_result.Unwrap();
    if (!response.can_resume()) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState("Peer cannot resume this transfer"));
    }
    if (response.epoch() != ratchet_->Epoch()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState(std::format("Peer is in epoch {}, this side in {}",
                                                      response.epoch(), ratchet_->Epoch())));
    }
    if (Direction() == TransferDirection::Send) {
        TALLOW_TRY(ApplyPeerBitmap(response.bitmap()));
        RebuildSendQueue();
    }
    failures_.Reset();
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::AnswerResumeRequest(const pb::ResumeRequest& request) {
    DrainWorkers();
    const uint32_t total = state_.total_chunks;
    const bool acceptable = !models::IsTerminal(state_.status) &&
                            request.epoch() == ratchet_->Epoch() &&
                            request.total_chunks() == total &&
                            request.bitmap().size() == (static_cast<size_t>(total) + 7) / 8;
    if (acceptable && Direction() == TransferDirection::Send) {
        TALLOW_TRY(ApplyPeerBitmap(request.bitmap()));
    }
    pb::Control control;
    pb::ResumeResponse* response = control.mutable_resume_response();
    response->set_can_resume(acceptable);
    response->set_epoch(ratchet_->Epoch());
    const std::vector<uint8_t> bitmap = state_.DoneBitmap();
    response->set_bitmap(std::string(bitmap.begin(), bitmap.end()));
    TALLOW_TRY(SendControl(control));
    if (!acceptable) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState("Peer resume request does not match this transfer"));
    }
    if (Direction() == TransferDirection::Send) {
        RebuildSendQueue();
    }
    failures_.Reset();
    TALLOW_LOG_INFO("Transfer {} answered a resume request at {}/{} chunks",
                    transfer_id_.ToString(), state_.ChunksDone(), total);
    return Result<Unit, TransferFailure>::Ok(unit);
}

TransferSession::Step TransferSession::AnswerPendingResume() {
    const pb::Frame frame = std::move(*pending_frame_);
    pending_frame_.reset();
    auto control_result = OpenControl(frame);
    if (control_result.IsErr()) {
        return AbortTransfer(control_result.UnwrapErr(), true);
    }
    const pb::Control& control = control_result.Unwrap();
    if (!control.has_resume_request()) {
        return AbortTransfer(TransferFailure::InvalidInput("Expected a resume request"), true);
    }
    SetStatus(TransferStatus::Resuming);
    EmitStatus();
    if (auto answered = AnswerResumeRequest(control.resume_request()); answered.IsErr()) {
        return AbortTransfer(answered.UnwrapErr(), false);
    }
    auto next = ContinueTransferring();
    return next.IsOk() ? next.Unwrap() : HandleFailure(next.UnwrapErr());
}

Result<Unit, TransferFailure> TransferSession::ApplyPeerBitmap(const std::string& bitmap) {
    const std::vector<uint8_t> bits(bitmap.begin(), bitmap.end());
    std::vector<uint32_t> changed;
    for (uint32_t index = 0; index < state_.total_chunks; ++index) {
        if (!models::IsBitSet(bits, index) || state_.IsChunkDone(index)) {
            continue;
        }
        SetChunk(index, ChunkStatus::Acknowledged);
        TALLOW_TRY(ratchet_->ReleaseSend(index));
        changed.push_back(index);
    }
    if (!changed.empty()) {
        TALLOW_LOG_DEBUG("Peer confirmed {} more chunks of {}", changed.size(), transfer_id_.ToString());
        TALLOW_TRY(PersistChunks(changed));
        EmitProgress();
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

void TransferSession::RebuildSendQueue() {
    send_queue_.clear();
    in_flight_.clear();
    for (const uint32_t index : state_.MissingChunks()) {
        send_queue_.push_back(index);
    }
}

Result<Unit, TransferFailure> TransferSession::SendFrame(const pb::FrameType type, const std::string& payload) {
    auto channel = Channel();
    if (!channel) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::Transport("No peer channel"));
    }
    pb::Frame frame;
    frame.set_type(type);
    frame.set_transfer_id(std::string(transfer_id_bytes_.begin(), transfer_id_bytes_.end()));
    frame.set_payload(payload);
    return channel->Send(frame);
}

Result<Unit, TransferFailure> TransferSession::SendHandshake(const pb::Handshake& handshake) {
    return SendFrame(pb::FRAME_TYPE_HANDSHAKE, handshake.SerializeAsString());
}

Result<Unit, TransferFailure> TransferSession::SendControl(const pb::Control& control) {
    return SendSealed(pb::FRAME_TYPE_CONTROL, control);
}

Result<Unit, TransferFailure> TransferSession::SendAck(const std::vector<uint32_t>& indices) {
    pb::AckFrame ack;
    for (const uint32_t index : indices) {
        ack.add_indices(index);
    }
    return SendSealed(pb::FRAME_TYPE_ACK, ack);
}

Result<Unit, TransferFailure> TransferSession::SendSealed(const pb::FrameType type,
                                                          const google::protobuf::Message& body) {
    if (!ratchet_ || control_key_.empty()) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState("No control key yet"));
    }
    auto plaintext_result = SerializeDeterministic(body);
    if (plaintext_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(plaintext_result.UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(plaintext_result).Unwrap();
    auto sealed_result = cipher::ControlCipher::Seal(
        control_key_, transfer_id_bytes_, static_cast<uint32_t>(type), ratchet_->Epoch(), plaintext);
    crypto::WipeQuietly(plaintext);
    if (sealed_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(sealed_result.UnwrapErr());
    }
    const cipher::SealedControl& sealed = sealed_result.Unwrap();
    pb::SealedBody envelope;
    envelope.set_epoch(sealed.epoch);
    envelope.set_nonce(std::string(sealed.nonce.begin(), sealed.nonce.end()));
    envelope.set_ciphertext(std::string(sealed.ciphertext.begin(), sealed.ciphertext.end()));
    return SendFrame(type, envelope.SerializeAsString());
}

Result<std::vector<uint8_t>, TransferFailure> TransferSession::OpenSealed(const pb::Frame& frame) {
    if (!ratchet_ || control_key_.empty()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidState("No control key yet"));
    }
    pb::SealedBody envelope;
    if (!envelope.ParseFromString(frame.payload()) || envelope.nonce().size() != kAesGcmNonceBytes) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(TransferFailure::Decode("Malformed sealed body"));
    }
    if (envelope.epoch() != ratchet_->Epoch()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Authentication(std::format("Sealed body of epoch {} while in epoch {}",
                                                        envelope.epoch(), ratchet_->Epoch())));
    }
    cipher::SealedControl sealed;
    sealed.epoch = envelope.epoch();
    std::copy(envelope.nonce().begin(), envelope.nonce().end(), sealed.nonce.begin());
    sealed.ciphertext.assign(envelope.ciphertext().begin(), envelope.ciphertext().end());
    return cipher::ControlCipher::Open(control_key_, transfer_id_bytes_, static_cast<uint32_t>(frame.type()), sealed);
}

Result<pb::Control, TransferFailure> TransferSession::OpenControl(const pb::Frame& frame) {
    if (frame.type() != pb::FRAME_TYPE_CONTROL) {
        return Result<pb::Control, TransferFailure>::Err(TransferFailure::InvalidInput("Not a control frame"));
    }
    auto plaintext_result = OpenSealed(frame);
    if (plaintext_result.IsErr()) {
        return Result<pb::Control, TransferFailure>::Err(plaintext_result.UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(plaintext_result).Unwrap();
    pb::Control control;
    const bool parsed = control.ParseFromArray(plaintext.data(), static_cast<int>(plaintext.size()));
    crypto::WipeQuietly(plaintext);
    if (!parsed) {
        return Result<pb::Control, TransferFailure>::Err(TransferFailure::Decode("Malformed control body"));
    }
    return Result<pb::Control, TransferFailure>::Ok(std::move(control));
}

Result<pb::Frame, TransferFailure> TransferSession::ReceiveFrame(const std::chrono::milliseconds timeout) {
    auto channel = Channel();
    if (!channel) {
        return Result<pb::Frame, TransferFailure>::Err(TransferFailure::Transport("No peer channel"));
    }
    auto frame_result = channel->Receive(timeout);
    if (frame_result.IsErr()) {
        return frame_result;
    }
    const std::string& id = frame_result.Unwrap().transfer_id();
    if (!std::equal(id.begin(), id.end(), transfer_id_bytes_.begin(), transfer_id_bytes_.end(),
                    [](const char a, const uint8_t b) { return static_cast<uint8_t>(a) == b; })) {
        TALLOW_LOG_DEBUG("Transfer {} dropped a frame addressed to another transfer", transfer_id_.ToString());
        return Result<pb::Frame, TransferFailure>::Err(TransferFailure::Timeout("Frame for another transfer"));
    }
    return frame_result;
}

Result<Unit, TransferFailure> TransferSession::SaveState() {
    TALLOW_TRY(UpdateCheckpoint());
    {
        std::lock_guard guard(state_lock_);
        state_.Touch(models::Clock::now());
    }
    TALLOW_TRY(context_.store->Save(state_));
    persisted_ = true;
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::PersistChunks(const std::vector<uint32_t>& indices) {
    if (indices.empty()) {
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    TALLOW_TRY(UpdateCheckpoint());
    {
        std::lock_guard guard(state_lock_);
        state_.Touch(models::Clock::now());
    }
    return context_.store->RecordChunkUpdate(state_, indices);
}

Result<Unit, TransferFailure> TransferSession::UpdateCheckpoint() {
    if (!ratchet_) {
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    auto checkpoint_result = ratchet_->Checkpoint();
    if (checkpoint_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(checkpoint_result.UnwrapErr());
    }
    std::lock_guard guard(state_lock_);
    state_.ratchet_checkpoint = std::move(checkpoint_result).Unwrap();
    return Result<Unit, TransferFailure>::Ok(unit);
}

void TransferSession::SetStatus(const models::TransferStatus status) {
    if (status == TransferStatus::Transferring) {
        interruption_.reset();
    }
    std::lock_guard guard(state_lock_);
    state_.status = status;
}

void TransferSession::SetChunk(const uint32_t index, const models::ChunkStatus status) {
    std::lock_guard guard(state_lock_);
    models::ChunkRecord& chunk = state_.chunks[index];
    const bool was_done = state_.IsDoneStatus(chunk.status);
    const bool is_done = state_.IsDoneStatus(status);
    if (!was_done && is_done) {
        ++chunks_done_;
        bytes_done_ += state_.ChunkLength(index);
    } else if (was_done && !is_done) {
        --chunks_done_;
        bytes_done_ -= state_.ChunkLength(index);
    }
    chunk.status = status;
}

void TransferSession::RecountProgress() {
    chunks_done_ = state_.ChunksDone();
    bytes_done_ = state_.BytesDone();
}

void TransferSession::EmitStatus() {
    RecountProgress();
    TransferEvent event;
    event.transfer_id = transfer_id_;
    event.chunks_done = chunks_done_;
    event.total_chunks = state_.total_chunks;
    event.bytes_done = bytes_done_;
    event.status = state_.status;
    event.abort_reason = state_.abort_reason;
    if (interruption_.has_value() &&
        (state_.status == TransferStatus::Paused || state_.status == TransferStatus::Resuming)) {
        event.interruption = models::AbortReason::FromFailure(*interruption_);
    }
    meter_.Reset(ProgressMeter::SteadyClock::now(), event.chunks_done, event.bytes_done);
    context_.events->Publish(std::move(event));
}

void TransferSession::EmitProgress() {
    const uint32_t chunks_done = chunks_done_;
    const uint64_t bytes_done = bytes_done_;
    const auto rate = meter_.Sample(ProgressMeter::SteadyClock::now(), chunks_done, bytes_done);
    if (!rate.has_value()) {
        return;
    }
    TransferEvent event;
    event.transfer_id = transfer_id_;
    event.chunks_done = chunks_done;
    event.total_chunks = state_.total_chunks;
    event.bytes_done = bytes_done;
    event.bytes_per_second = *rate;
    event.status = state_.status;
    context_.events->Publish(std::move(event));
}

TransferSession::Command TransferSession::TakeCommand() {
    std::lock_guard guard(command_lock_);
    if (shutdown_) {
        return Command::Shutdown;
    }
    return std::exchange(command_, Command::None);
}

TransferSession::Command TransferSession::WaitForCommand(const std::chrono::milliseconds timeout) {
    std::unique_lock guard(command_lock_);
    command_signal_.wait_for(guard, timeout, [this] { return shutdown_ || command_ != Command::None; });
    if (shutdown_) {
        return Command::Shutdown;
    }
    return std::exchange(command_, Command::None);
}

bool TransferSession::ShutdownRequested() {
    std::lock_guard guard(command_lock_);
    return shutdown_;
}

bool TransferSession::CancelRequested() {
    std::lock_guard guard(command_lock_);
    return command_ == Command::Cancel;
}

std::shared_ptr<interfaces::IPeerChannel> TransferSession::Channel() {
    std::lock_guard guard(command_lock_);
    return channel_;
}

}
