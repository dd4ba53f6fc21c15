#include "tallow/engine/transfer_engine.hpp"
#include "tallow/codec/chunk_codec.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/crypto/kyber_interop.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include <format>
#include <system_error>

namespace tallow::transfer::engine {

namespace pb = tallow::proto::transfer;
using models::TransferDirection;
using models::TransferStatus;

namespace {

    pb::Frame RejectFrame(const std::string& transfer_id_bytes, const TransferFailure& failure) {
        pb::Handshake handshake;
        pb::HandshakeReject* reject = handshake.mutable_reject();
        reject->set_reason(static_cast<uint32_t>(failure.type));
        reject->set_message(failure.message);
        pb::Frame frame;
        frame.set_type(pb::FRAME_TYPE_HANDSHAKE);
        frame.set_transfer_id(transfer_id_bytes);
        frame.set_payload(handshake.SerializeAsString());
        return frame;
    }

    void SendReject(interfaces::IPeerChannel& channel, const std::string& transfer_id_bytes,
                    const TransferFailure& failure) {
        if (auto sent = channel.Send(RejectFrame(transfer_id_bytes, failure)); sent.IsErr()) {
            TALLOW_LOG_WARN("Could not deliver reject to peer: {}", sent.UnwrapErr().Describe());
        }
    }

    bool IsOffer(const pb::Frame& frame) {
        if (frame.type() != pb::FRAME_TYPE_HANDSHAKE) {
            return false;
        }
        pb::Handshake handshake;
        return handshake.ParseFromString(frame.payload()) && handshake.has_offer();
    }

}

TransferEngine::TransferEngine(configuration::EngineOptions options,
                               std::unique_ptr<storage::TransferStateStore> store,
                               std::unique_ptr<EventQueue> events)
    : options_(std::move(options)),
      store_(std::move(store)),
      events_(std::move(events)) {}

TransferEngine::~TransferEngine() {
    Shutdown();
}

Result<std::unique_ptr<TransferEngine>, TransferFailure> TransferEngine::Create(configuration::EngineOptions options) {
    using EngineResult = Result<std::unique_ptr<TransferEngine>, TransferFailure>;
    TALLOW_TRY(options.Validate());
    TALLOW_TRY(crypto::SodiumInterop::Initialize().MapErr(TransferFailure::FromSodiumFailure));
    TALLOW_TRY(crypto::KyberInterop::Initialize().MapErr(TransferFailure::FromSodiumFailure));

    std::error_code error;
    std::filesystem::create_directories(options.download_directory, error);
    if (error) {
        return EngineResult::Err(TransferFailure::Storage(
            std::format("Cannot create download directory {}: {}", options.download_directory.string(),
                        error.message())));
    }

    storage::StoreOptions store_options;
    store_options.directory = options.state_directory;
    store_options.sync_writes = options.sync_writes;
    store_options.integrity_key = options.store_integrity_key;
    auto store_result = storage::TransferStateStore::Open(std::move(store_options));
    if (store_result.IsErr()) {
        return EngineResult::Err(store_result.UnwrapErr());
    }

    auto events = std::make_unique<EventQueue>(options.event_queue_capacity);
    std::unique_ptr<TransferEngine> engine(
        new TransferEngine(std::move(options), std::move(store_result).Unwrap(), std::move(events)));

    if (auto swept = engine->CleanupExpired(); swept.IsErr()) {
        TALLOW_LOG_WARN("Startup cleanup of expired transfers failed: {}", swept.UnwrapErr().Describe());
    } else if (swept.Unwrap() > 0) {
        TALLOW_LOG_INFO("Removed {} expired transfer records", swept.Unwrap());
    }
    return EngineResult::Ok(std::move(engine));
}

SessionContext TransferEngine::Context() const {
    SessionContext context;
    context.store = store_.get();
    context.events = events_.get();
    context.download_directory = options_.download_directory;
    context.sync_writes = options_.sync_writes;
    return context;
}

Result<models::TransferId, TransferFailure> TransferEngine::Launch(std::unique_ptr<TransferSession> session) {
    const models::TransferId transfer_id = session->Id();
    std::vector<std::shared_ptr<TransferSession>> finished;
    {
        std::lock_guard guard(lock_);
        if (shut_down_) {
            return Result<models::TransferId, TransferFailure>::Err(
                TransferFailure::InvalidState("Engine is shut down"));
        }
        finished = TakeFinishedLocked();
        if (sessions_.contains(transfer_id)) {
            return Result<models::TransferId, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    std::format("Transfer {} is already active", transfer_id.ToString())));
        }
        session->Start();
        sessions_[transfer_id] = std::shared_ptr<TransferSession>(std::move(session));
    }
    return Result<models::TransferId, TransferFailure>::Ok(transfer_id);
}

std::vector<std::shared_ptr<TransferSession>> TransferEngine::TakeFinishedLocked() {
    std::vector<std::shared_ptr<TransferSession>> finished;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second->IsRunning()) {
            ++it;
            continue;
        }
        TALLOW_LOG_DEBUG("Releasing finished session {}", it->first.ToString());
        finished.push_back(std::move(it->second));
        it = sessions_.erase(it);
    }
    return finished;
}

std::shared_ptr<TransferSession> TransferEngine::FindSession(const models::TransferId& transfer_id) {
    std::vector<std::shared_ptr<TransferSession>> finished;
    std::lock_guard guard(lock_);
    finished = TakeFinishedLocked();
    const auto it = sessions_.find(transfer_id);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t TransferEngine::LiveSessionCount() {
    std::vector<std::shared_ptr<TransferSession>> finished;
    std::lock_guard guard(lock_);
    finished = TakeFinishedLocked();
    return sessions_.size();
}

Result<models::TransferId, TransferFailure> TransferEngine::StartSend(
    const std::span<const std::filesystem::path> files,
    std::shared_ptr<interfaces::IPeerChannel> channel,
    const configuration::TransferConfig& config) {
    using IdResult = Result<models::TransferId, TransferFailure>;
    if (files.size() != 1) {
        return IdResult::Err(TransferFailure::InvalidInput(
            std::format("Exactly one file per transfer is supported, got {}", files.size())));
    }
    if (!channel) {
        return IdResult::Err(TransferFailure::InvalidInput("Peer channel is required"));
    }
    TALLOW_TRY(config.Validate());

    const std::filesystem::path& source = files.front();
    std::error_code error;
    if (!std::filesystem::is_regular_file(source, error)) {
        return IdResult::Err(TransferFailure::InvalidInput(
            std::format("{} is not a readable regular file", source.string())));
    }

    const models::TransferId transfer_id = models::TransferId::Generate();
    TALLOW_LOG_INFO("Starting send of {} as transfer {}", source.filename().string(), transfer_id.ToString());
    return Launch(TransferSession::ForOutgoing(Context(), transfer_id, source, std::move(channel), config));
}

Result<models::TransferId, TransferFailure> TransferEngine::StartReceive(
    std::shared_ptr<interfaces::IPeerChannel> channel,
    const configuration::TransferConfig& config) {
    using IdResult = Result<models::TransferId, TransferFailure>;
    if (!channel) {
        return IdResult::Err(TransferFailure::InvalidInput("Peer channel is required"));
    }
    TALLOW_TRY(config.Validate());

    auto frame_result = channel->Receive(config.HandshakeTimeout());
    if (frame_result.IsErr()) {
        return IdResult::Err(frame_result.UnwrapErr());
    }
    pb::Frame frame = std::move(frame_result).Unwrap();
    const std::string id_bytes = frame.transfer_id();
    auto id_result = models::TransferId::FromBytes(
        std::span(reinterpret_cast<const uint8_t*>(id_bytes.data()), id_bytes.size()));
    if (id_result.IsErr()) {
        return IdResult::Err(TransferFailure::Handshake("First frame carries no valid transfer id"));
    }
    const models::TransferId transfer_id = id_result.Unwrap();

    if (IsOffer(frame)) {
        if (store_->Exists(transfer_id) || FindSession(transfer_id) != nullptr) {
            const TransferFailure failure = TransferFailure::Handshake(
                std::format("Transfer {} already exists", transfer_id.ToString()));
            SendReject(*channel, id_bytes, failure);
            return IdResult::Err(failure);
        }
        TALLOW_LOG_INFO("Accepting incoming transfer {}", transfer_id.ToString());
        return Launch(TransferSession::ForIncoming(Context(), transfer_id, std::move(frame), channel, config));
    }

    if (frame.type() != pb::FRAME_TYPE_CONTROL) {
        const TransferFailure failure = TransferFailure::Handshake("Expected a handshake offer or resume request");
        SendReject(*channel, id_bytes, failure);
        return IdResult::Err(failure);
    }
    if (std::shared_ptr<TransferSession> live = FindSession(transfer_id); live != nullptr && live->IsRunning()) {
        const TransferFailure failure = TransferFailure::InvalidState(
            std::format("Transfer {} is still running here", transfer_id.ToString()));
        SendReject(*channel, id_bytes, failure);
        return IdResult::Err(failure);
    }

    auto record_result = store_->Load(transfer_id);
    if (record_result.IsErr()) {
        const TransferFailure& load_failure = record_result.UnwrapErr();
        const TransferFailure failure = load_failure.type == TransferFailureType::NotFound
            ? TransferFailure::NotFound(std::format("Unknown transfer {}", transfer_id.ToString()))
            : load_failure;
        SendReject(*channel, id_bytes, failure);
        return IdResult::Err(failure);
    }
    models::TransferState state = std::move(record_result).Unwrap();
    if (models::IsTerminal(state.status)) {
        const TransferFailure failure = TransferFailure::InvalidState(
            std::format("Transfer {} is already {}", transfer_id.ToString(), models::ToString(state.status)));
        SendReject(*channel, id_bytes, failure);
        return IdResult::Err(failure);
    }
    TALLOW_LOG_INFO("Peer asked to resume transfer {}", transfer_id.ToString());
    return Launch(TransferSession::ForRecord(Context(), std::move(state), channel, config, std::move(frame)));
}

Result<Unit, TransferFailure> TransferEngine::Pause(const models::TransferId& transfer_id) {
    std::shared_ptr<TransferSession> session = FindSession(transfer_id);
    if (session == nullptr || !session->IsRunning()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::NotFound(std::format("No active transfer {}", transfer_id.ToString())));
    }
    return session->RequestPause();
}

Result<Unit, TransferFailure> TransferEngine::Resume(
    const models::TransferId& transfer_id,
    std::shared_ptr<interfaces::IPeerChannel> channel,
    const configuration::TransferConfig& config) {
    if (std::shared_ptr<TransferSession> session = FindSession(transfer_id); session != nullptr && session->IsRunning()) {
        return session->RequestResume(std::move(channel));
    }
    return ResumeFromRecord(transfer_id, std::move(channel), config);
}

Result<Unit, TransferFailure> TransferEngine::ResumeFromRecord(
    const models::TransferId& transfer_id,
    std::shared_ptr<interfaces::IPeerChannel> channel,
    const configuration::TransferConfig& config) {
    if (!channel) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("A peer channel is required to resume a stored transfer"));
    }
    TALLOW_TRY(config.Validate());
    auto record_result = store_->Load(transfer_id);
    if (record_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(record_result.UnwrapErr());
    }
    models::TransferState state = std::move(record_result).Unwrap();
    if (models::IsTerminal(state.status)) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState(
            std::format("Transfer {} is already {}", transfer_id.ToString(), models::ToString(state.status))));
    }
    TALLOW_LOG_INFO("Resuming stored transfer {} ({}/{} chunks done)",
                    transfer_id.ToString(), state.ChunksDone(), state.total_chunks);
    auto launched = Launch(TransferSession::ForRecord(Context(), std::move(state), std::move(channel), config,
                                                      std::nullopt));
    if (launched.IsErr()) {
        return Result<Unit, TransferFailure>::Err(launched.UnwrapErr());
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferEngine::Cancel(const models::TransferId& transfer_id) {
    if (std::shared_ptr<TransferSession> session = FindSession(transfer_id); session != nullptr && session->IsRunning()) {
        return session->RequestCancel();
    }
    return CancelRecord(transfer_id);
}

Result<Unit, TransferFailure> TransferEngine::CancelRecord(const models::TransferId& transfer_id) {
    auto record_result = store_->Load(transfer_id);
    if (record_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(record_result.UnwrapErr());
    }
    models::TransferState state = std::move(record_result).Unwrap();
    if (models::IsTerminal(state.status)) {
        return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState(
            std::format("Transfer {} is already {}", transfer_id.ToString(), models::ToString(state.status))));
    }
    state.status = TransferStatus::Aborted;
    state.abort_reason = models::AbortReason::FromFailure(TransferFailure::Cancelled("Transfer cancelled"));
    state.Touch(models::Clock::now());
    TALLOW_TRY(store_->Save(state));

    TransferEvent event;
    event.transfer_id = transfer_id;
    event.chunks_done = state.ChunksDone();
    event.total_chunks = state.total_chunks;
    event.bytes_done = state.BytesDone();
    event.status = state.status;
    event.abort_reason = state.abort_reason;
    events_->Publish(std::move(event));
    TALLOW_LOG_INFO("Cancelled stored transfer {}", transfer_id.ToString());
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<std::vector<models::ResumableSummary>, TransferFailure> TransferEngine::ListResumable() {
    auto records_result = store_->ListResumable(models::Clock::now());
    if (records_result.IsErr()) {
        return Result<std::vector<models::ResumableSummary>, TransferFailure>::Err(records_result.UnwrapErr());
    }
    std::vector<models::ResumableSummary> summaries;
    summaries.reserve(records_result.Unwrap().size());
    for (const models::TransferState& state : records_result.Unwrap()) {
        models::ResumableSummary summary = models::ResumableSummary::FromState(state);
        // The record lags the live session by at most the last journal write.
        if (std::shared_ptr<TransferSession> session = FindSession(state.transfer_id); session != nullptr) {
            const TransferProgress progress = session->Progress();
            summary.chunks_done = progress.chunks_done;
            summary.status = progress.status;
        }
        summaries.push_back(std::move(summary));
    }
    return Result<std::vector<models::ResumableSummary>, TransferFailure>::Ok(std::move(summaries));
}

Result<TransferProgress, TransferFailure> TransferEngine::GetProgress(const models::TransferId& transfer_id) {
    if (std::shared_ptr<TransferSession> session = FindSession(transfer_id); session != nullptr) {
        return Result<TransferProgress, TransferFailure>::Ok(session->Progress());
    }
    return store_->Load(transfer_id).Map(TransferProgress::FromState);
}

Result<Unit, TransferFailure> TransferEngine::Delete(const models::TransferId& transfer_id) {
    std::shared_ptr<TransferSession> finished;
    {
        std::lock_guard guard(lock_);
        if (const auto it = sessions_.find(transfer_id); it != sessions_.end()) {
            if (it->second->IsRunning() && !models::IsTerminal(it->second->Status())) {
                return Result<Unit, TransferFailure>::Err(TransferFailure::InvalidState(
                    std::format("Transfer {} is still active; cancel it first", transfer_id.ToString())));
            }
            finished = std::move(it->second);
            sessions_.erase(it);
        }
    }
    finished.reset();

    auto record_result = store_->Load(transfer_id);
    if (record_result.IsOk()) {
        RemovePartialFile(record_result.Unwrap());
    } else if (record_result.UnwrapErr().type != TransferFailureType::NotFound) {
        TALLOW_LOG_WARN("Transfer {} record unreadable, deleting it anyway: {}",
                        transfer_id.ToString(), record_result.UnwrapErr().Describe());
    }
    TALLOW_TRY(store_->Delete(transfer_id));
    TALLOW_LOG_INFO("Deleted transfer {}", transfer_id.ToString());
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<size_t, TransferFailure> TransferEngine::CleanupExpired(const models::TimePoint now) {
    return store_->CleanupExpired(now, [this](const models::TransferState& state) {
        if (std::shared_ptr<TransferSession> session = FindSession(state.transfer_id); session != nullptr) {
            TALLOW_LOG_WARN("Expired transfer {} is still running, keeping it", state.transfer_id.ToString());
            return false;
        }
        RemovePartialFile(state);
        return true;
    });
}

void TransferEngine::RemovePartialFile(const models::TransferState& state) const {
    if (state.direction != TransferDirection::Receive || state.status == TransferStatus::Completed ||
        state.local_path.empty()) {
        return;
    }
    const std::filesystem::path partial = codec::ChunkWriter::PartialPathFor(state.local_path);
    std::error_code error;
    if (std::filesystem::remove(partial, error)) {
        TALLOW_LOG_DEBUG("Removed partial download {}", partial.string());
    } else if (error) {
        TALLOW_LOG_WARN("Could not remove partial download {}: {}", partial.string(), error.message());
    }
}

void TransferEngine::Shutdown() {
    std::unordered_map<models::TransferId, std::shared_ptr<TransferSession>> sessions;
    {
        std::lock_guard guard(lock_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        sessions.swap(sessions_);
    }
    for (auto& [transfer_id, session] : sessions) {
        session->Shutdown();
    }
    TALLOW_LOG_DEBUG("Engine shut down with {} sessions", sessions.size());
}

}
