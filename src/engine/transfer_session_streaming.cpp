#include "tallow/engine/transfer_session.hpp"
#include "tallow/core/constants.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/negotiation/session_negotiator.hpp"
#include <format>

namespace tallow::transfer::engine {

namespace pb = tallow::proto::transfer;
using models::ChunkStatus;
using models::TransferStatus;

namespace {

    constexpr std::chrono::milliseconds kBusyPoll{5};

    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    template<typename T>
    bool IsReady(const std::future<T>& future) {
        return future.wait_for(std::chrono::seconds::zero()) == std::future_status::ready;
    }

}

TransferSession::StepResult TransferSession::SendLoop() {
    auto last_heard = std::chrono::steady_clock::now();
    while (true) {
        switch (TakeCommand()) {
            case Command::Pause:
                return StepResult::Ok(PauseTransfer(true));
            case Command::Cancel:
                return StepResult::Ok(AbortTransfer(TransferFailure::Cancelled("Transfer cancelled"), true));
            case Command::Shutdown:
                PauseTransfer(true);
                return StepResult::Ok(Step::Done);
            case Command::Resume:
            case Command::None:
                break;
        }
        if (send_queue_.empty() && in_flight_.empty() && encrypting_.empty() &&
            chunks_done_ == state_.total_chunks) {
            return AwaitCompletion();
        }
        if (!send_queue_.empty() && in_flight_.empty() && encrypting_.empty() &&
            ratchet_->NeedsRotation(send_queue_.front())) {
            TALLOW_TRY(RunRekeyAsSender());
            continue;
        }
        TALLOW_TRY(FillSendWindow());
        TALLOW_TRY(FlushEncrypted());

        auto frame_result = ReceiveFrame(encrypting_.empty() ? kPollSlice : kBusyPoll);
        const auto now = std::chrono::steady_clock::now();
        if (frame_result.IsErr()) {
            if (frame_result.UnwrapErr().type != TransferFailureType::Timeout) {
                return StepResult::Err(std::move(frame_result).UnwrapErr());
            }
            if (!in_flight_.empty() && now - last_heard > config_.ResumeTimeout()) {
                return StepResult::Err(TransferFailure::Transport("Peer stopped acknowledging chunks"));
            }
            continue;
        }
        last_heard = now;
        auto handled = HandleSenderFrame(frame_result.Unwrap());
        if (handled.IsErr()) {
            return StepResult::Err(std::move(handled).UnwrapErr());
        }
        if (handled.Unwrap().has_value()) {
            return StepResult::Ok(*handled.Unwrap());
        }
    }
}

Result<Unit, TransferFailure> TransferSession::FillSendWindow() {
    const uint32_t max_in_flight = config_.MaxInFlightChunks();
    while (!send_queue_.empty() && in_flight_.size() + encrypting_.size() < max_in_flight) {
        const uint32_t index = send_queue_.front();
        if (state_.IsChunkDone(index) || in_flight_.contains(index)) {
            send_queue_.pop_front();
            continue;
        }
        if (ratchet_->NeedsRotation(index) ||
            index >= ratchet_->SendChain().Frontier() + state_.ratchet_window) {
            break;
        }
        auto key_result = ratchet_->DeriveSendKey(index);
        if (key_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(key_result.UnwrapErr());
        }
        send_queue_.pop_front();
        auto submitted = pool_->Submit(
            [this, index, key = std::move(key_result).Unwrap()]() -> Result<EncryptedChunk, TransferFailure> {
                auto plaintext_result = reader_->ReadChunk(index);
                if (plaintext_result.IsErr()) {
                    return Result<EncryptedChunk, TransferFailure>::Err(plaintext_result.UnwrapErr());
                }
                std::vector<uint8_t> plaintext = std::move(plaintext_result).Unwrap();
                EncryptedChunk chunk;
                chunk.index = index;
                chunk.plaintext_hash = codec::ChunkHasher::HashChunk(plaintext);
                auto sealed_result = cipher::ChunkCipher::Encrypt(key, transfer_id_bytes_, index, plaintext);
                crypto::WipeQuietly(plaintext);
                if (sealed_result.IsErr()) {
                    return Result<EncryptedChunk, TransferFailure>::Err(sealed_result.UnwrapErr());
                }
                chunk.sealed = std::move(sealed_result).Unwrap();
                return Result<EncryptedChunk, TransferFailure>::Ok(std::move(chunk));
            });
        if (submitted.IsErr()) {
            return Result<Unit, TransferFailure>::Err(submitted.UnwrapErr());
        }
        encrypting_.push_back(PendingEncrypt{index, std::move(submitted).Unwrap()});
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::FlushEncrypted() {
    std::vector<uint32_t> sent;
    while (!encrypting_.empty() && IsReady(encrypting_.front().result)) {
        PendingEncrypt pending = std::move(encrypting_.front());
        encrypting_.pop_front();
        auto chunk_result = pending.result.get();
        if (chunk_result.IsErr()) {
            send_queue_.push_front(pending.index);
            return Result<Unit, TransferFailure>::Err(chunk_result.UnwrapErr());
        }
        const EncryptedChunk& chunk = chunk_result.Unwrap();
        if (state_.IsChunkDone(chunk.index)) {
            continue;
        }
        const models::ChunkRecord& record = state_.chunks[chunk.index];
        if (record.plaintext_hash != crypto::Sha256Digest{} && record.plaintext_hash != chunk.plaintext_hash) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Integrity(std::format("Chunk {} of the source changed after it was sent", chunk.index)));
        }

        pb::ChunkFrame frame;
        frame.set_index(chunk.index);
        frame.set_epoch(ratchet_->Epoch());
        frame.set_ciphertext(std::string(chunk.sealed.ciphertext.begin(), chunk.sealed.ciphertext.end()));
        frame.set_tag(std::string(chunk.sealed.tag.begin(), chunk.sealed.tag.end()));
        if (auto result = SendFrame(pb::FRAME_TYPE_CHUNK, frame.SerializeAsString()); result.IsErr()) {
            send_queue_.push_front(chunk.index);
            return result;
        }
        {
            std::lock_guard guard(state_lock_);
            models::ChunkRecord& updated = state_.chunks[chunk.index];
            updated.status = ChunkStatus::Sent;
            updated.plaintext_hash = chunk.plaintext_hash;
            updated.ciphertext_length = static_cast<uint32_t>(chunk.sealed.ciphertext.size());
        }
        in_flight_.insert(chunk.index);
        sent.push_back(chunk.index);
    }
    return PersistChunks(sent);
}

TransferSession::MaybeStep TransferSession::HandleSenderFrame(const pb::Frame& frame) {
    switch (frame.type()) {
        case pb::FRAME_TYPE_ACK: {
            auto plaintext_result = OpenSealed(frame);
            if (plaintext_result.IsErr()) {
                TALLOW_LOG_WARN("Transfer {} rejected an acknowledgement: {}",
                                transfer_id_.ToString(), plaintext_result.UnwrapErr().Describe());
                return MaybeStep::Ok(std::nullopt);
            }
            const std::vector<uint8_t>& plaintext = plaintext_result.Unwrap();
            pb::AckFrame ack;
            if (!ack.ParseFromArray(plaintext.data(), static_cast<int>(plaintext.size()))) {
                TALLOW_LOG_WARN("Transfer {} received a malformed acknowledgement", transfer_id_.ToString());
                return MaybeStep::Ok(std::nullopt);
            }
            TALLOW_TRY(ApplyAck(ack));
            return MaybeStep::Ok(std::nullopt);
        }
        case pb::FRAME_TYPE_HANDSHAKE:
            return MaybeStep::Ok(HandlePeerTermination(frame, nullptr));
        case pb::FRAME_TYPE_CONTROL: {
            auto control_result = OpenControl(frame);
            if (control_result.IsErr()) {
                TALLOW_LOG_WARN("Transfer {} rejected a control frame: {}",
                                transfer_id_.ToString(), control_result.UnwrapErr().Describe());
                return MaybeStep::Ok(std::nullopt);
            }
            const pb::Control& control = control_result.Unwrap();
            if (control.has_retransmit()) {
                const auto& indices = control.retransmit().indices();
                for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
                    const uint32_t index = *it;
                    if (index >= state_.total_chunks || state_.IsChunkDone(index)) {
                        continue;
                    }
                    TALLOW_LOG_DEBUG("Peer asked for chunk {} of {} again", index, transfer_id_.ToString());
                    in_flight_.erase(index);
                    send_queue_.push_front(index);
                }
                return MaybeStep::Ok(std::nullopt);
            }
            if (control.has_resume_request()) {
                TALLOW_TRY(AnswerResumeRequest(control.resume_request()));
                return MaybeStep::Ok(std::nullopt);
            }
            if (control.has_complete()) {
                auto finished = FinishSending(control.complete());
                if (finished.IsErr()) {
                    return MaybeStep::Err(std::move(finished).UnwrapErr());
                }
                return MaybeStep::Ok(finished.Unwrap());
            }
            return MaybeStep::Ok(HandlePeerTermination(frame, &control));
        }
        default:
            return MaybeStep::Ok(std::nullopt);
    }
}

Result<Unit, TransferFailure> TransferSession::ApplyAck(const pb::AckFrame& ack) {
    std::vector<uint32_t> acknowledged;
    for (const uint32_t index : ack.indices()) {
        if (index >= state_.total_chunks || state_.IsChunkDone(index)) {
            continue;
        }
        if (state_.chunks[index].status != ChunkStatus::Sent) {
            TALLOW_LOG_WARN("Transfer {} ignored an acknowledgement for unsent chunk {}",
                            transfer_id_.ToString(), index);
            continue;
        }
        SetChunk(index, ChunkStatus::Acknowledged);
        TALLOW_TRY(ratchet_->ReleaseSend(index));
        in_flight_.erase(index);
        acknowledged.push_back(index);
    }
    if (acknowledged.empty()) {
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    TALLOW_TRY(PersistChunks(acknowledged));
    EmitProgress();
    return Result<Unit, TransferFailure>::Ok(unit);
}

TransferSession::StepResult TransferSession::AwaitCompletion() {
    TALLOW_LOG_DEBUG("Transfer {}: all {} chunks acknowledged, waiting for the peer to confirm",
                     transfer_id_.ToString(), state_.total_chunks);
    using CompleteStep = Result<std::optional<pb::Complete>, TransferFailure>;
    auto complete_result = AwaitFrame<pb::Complete>(
        config_.ResumeTimeout(),
        [this](const pb::Frame& frame) -> CompleteStep {
            if (auto rejection = RejectionIn(frame)) {
                peer_terminated_ = true;
                return CompleteStep::Err(*rejection);
            }
            if (frame.type() != pb::FRAME_TYPE_CONTROL) {
                return CompleteStep::Ok(std::nullopt);
            }
            auto control_result = OpenControl(frame);
            if (control_result.IsErr()) {
                TALLOW_LOG_DEBUG("Transfer {} ignored a control frame: {}",
                                 transfer_id_.ToString(), control_result.UnwrapErr().Describe());
                return CompleteStep::Ok(std::nullopt);
            }
            const pb::Control& control = control_result.Unwrap();
            if (control.has_complete()) {
                return CompleteStep::Ok(control.complete());
            }
            if (control.has_resume_request()) {
                TALLOW_TRY(AnswerResumeRequest(control.resume_request()));
                return CompleteStep::Ok(std::nullopt);
            }
            if (control.has_cancel()) {
                peer_terminated_ = true;
                return CompleteStep::Err(TransferFailure::Cancelled("Peer cancelled the transfer"));
            }
            if (control.has_abort()) {
                peer_terminated_ = true;
                return CompleteStep::Err(FailureFromWire(control.abort().reason(), control.abort().message()));
            }
            return CompleteStep::Ok(std::nullopt);
        });
    if (complete_result.IsErr()) {
        if (complete_result.UnwrapErr().type == TransferFailureType::Timeout) {
            return StepResult::Err(TransferFailure::Transport("Peer did not confirm completion"));
        }
        return StepResult::Err(std::move(complete_result).UnwrapErr());
    }
    return FinishSending(complete_result.Unwrap());
}

TransferSession::StepResult TransferSession::FinishSending(const pb::Complete& complete) {
    if (chunks_done_ != state_.total_chunks) {
        return StepResult::Err(
            TransferFailure::Integrity("Peer reported completion before every chunk was acknowledged"));
    }
    const std::string& hash = complete.file_hash();
    if (hash.size() != kSha256Bytes || !std::equal(hash.begin(), hash.end(), state_.file_hash.begin(),
                                                   [](const char a, const uint8_t b) {
                                                       return static_cast<uint8_t>(a) == b;
                                                   })) {
        return StepResult::Err(TransferFailure::Integrity("Peer reassembled a file with a different hash"));
    }
    // The receiver's hash covers every chunk, so each one is now verified end to end.
    for (uint32_t index = 0; index < state_.total_chunks; ++index) {
        SetChunk(index, ChunkStatus::Verified);
    }
    SetStatus(TransferStatus::Completed);
    TALLOW_TRY(SaveState());
    EmitStatus();
    TALLOW_LOG_INFO("Transfer {} completed: {} delivered ({} bytes)",
                    transfer_id_.ToString(), state_.file_name, state_.file_size);
    return StepResult::Ok(Step::Done);
}

Result<Unit, TransferFailure> TransferSession::RunRekeyAsSender() {
    const uint64_t base = ratchet_->SendChain().Ceiling();
    const uint32_t next_epoch = ratchet_->Epoch() + 1;
    TALLOW_LOG_INFO("Transfer {} rotating keys at chunk {} into epoch {}",
                    transfer_id_.ToString(), base, next_epoch);
    auto initiator_result = negotiation::NegotiationInitiator::Start(
        negotiation::NegotiationContext(transfer_id_bytes_, next_epoch), pb::HANDSHAKE_PURPOSE_REKEY, base);
    if (initiator_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(initiator_result.UnwrapErr());
    }
    auto initiator = std::move(initiator_result).Unwrap();
    pb::Control control;
    *control.mutable_rekey_offer() = initiator->Offer();
    TALLOW_TRY(SendControl(control));

    using AcceptStep = Result<std::optional<pb::HandshakeAccept>, TransferFailure>;
    auto accept_result = AwaitFrame<pb::HandshakeAccept>(
        config_.HandshakeTimeout(),
        [this](const pb::Frame& frame) -> AcceptStep {
            if (auto rejection = RejectionIn(frame)) {
                peer_terminated_ = true;
                return AcceptStep::Err(*rejection);
            }
            if (frame.type() != pb::FRAME_TYPE_CONTROL) {
                return AcceptStep::Ok(std::nullopt);
            }
            auto control_result = OpenControl(frame);
            if (control_result.IsErr()) {
                return AcceptStep::Ok(std::nullopt);
            }
            const pb::Control& reply = control_result.Unwrap();
            if (reply.has_rekey_accept()) {
                return AcceptStep::Ok(reply.rekey_accept());
            }
            if (reply.has_cancel()) {
                peer_terminated_ = true;
                return AcceptStep::Err(TransferFailure::Cancelled("Peer cancelled the transfer"));
            }
            if (reply.has_abort()) {
                peer_terminated_ = true;
                return AcceptStep::Err(TransferFailure::Handshake("Peer aborted the key rotation: " +
                                                                  reply.abort().message()));
            }
            return AcceptStep::Ok(std::nullopt);
        });
    if (accept_result.IsErr()) {
        if (accept_result.UnwrapErr().type == TransferFailureType::Timeout) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::Transport("Peer did not answer the key rotation"));
        }
        return Result<Unit, TransferFailure>::Err(accept_result.UnwrapErr());
    }
    {
        auto secret_result = initiator->Finish(accept_result.Unwrap());
        if (secret_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(secret_result.UnwrapErr());
        }
        TALLOW_TRY(ratchet_->Reseed(secret_result.Unwrap(), base));
    }
    initiator.reset();
    TALLOW_TRY(RefreshControlKey());
    TALLOW_TRY(SaveState());
    TALLOW_LOG_INFO("Transfer {} entered epoch {}", transfer_id_.ToString(), ratchet_->Epoch());
    return Result<Unit, TransferFailure>::Ok(unit);
}

TransferSession::StepResult TransferSession::ReceiveLoop() {
    auto last_heard = std::chrono::steady_clock::now();
    while (true) {
        switch (TakeCommand()) {
            case Command::Pause:
                return StepResult::Ok(PauseTransfer(true));
            case Command::Cancel:
                return StepResult::Ok(AbortTransfer(TransferFailure::Cancelled("Transfer cancelled"), true));
            case Command::Shutdown:
                PauseTransfer(true);
                return StepResult::Ok(Step::Done);
            case Command::Resume:
            case Command::None:
                break;
        }
        TALLOW_TRY(ProcessDecrypted(false));
        if (decrypting_.empty() && chunks_done_ == state_.total_chunks) {
            return FinishReceiving();
        }

        auto frame_result = ReceiveFrame(decrypting_.empty() ? kPollSlice : kBusyPoll);
        const auto now = std::chrono::steady_clock::now();
        if (frame_result.IsErr()) {
            if (frame_result.UnwrapErr().type != TransferFailureType::Timeout) {
                return StepResult::Err(std::move(frame_result).UnwrapErr());
            }
            if (decrypting_.empty() && now - last_heard > config_.ResumeTimeout()) {
                return StepResult::Err(TransferFailure::Transport("Peer stopped sending chunks"));
            }
            continue;
        }
        last_heard = now;
        auto handled = HandleReceiverFrame(frame_result.Unwrap());
        if (handled.IsErr()) {
            return StepResult::Err(std::move(handled).UnwrapErr());
        }
        if (handled.Unwrap().has_value()) {
            return StepResult::Ok(*handled.Unwrap());
        }
    }
}

TransferSession::MaybeStep TransferSession::HandleReceiverFrame(const pb::Frame& frame) {
    switch (frame.type()) {
        case pb::FRAME_TYPE_CHUNK:
            TALLOW_TRY(AcceptChunk(frame));
            return MaybeStep::Ok(std::nullopt);
        case pb::FRAME_TYPE_HANDSHAKE:
            return MaybeStep::Ok(HandlePeerTermination(frame, nullptr));
        case pb::FRAME_TYPE_CONTROL: {
            auto control_result = OpenControl(frame);
            if (control_result.IsErr()) {
                TALLOW_LOG_WARN("Transfer {} rejected a control frame: {}",
                                transfer_id_.ToString(), control_result.UnwrapErr().Describe());
                return MaybeStep::Ok(std::nullopt);
            }
            const pb::Control& control = control_result.Unwrap();
            if (control.has_rekey_offer()) {
                TALLOW_TRY(RunRekeyAsReceiver(control.rekey_offer()));
                return MaybeStep::Ok(std::nullopt);
            }
            if (control.has_resume_request()) {
                TALLOW_TRY(AnswerResumeRequest(control.resume_request()));
                return MaybeStep::Ok(std::nullopt);
            }
            return MaybeStep::Ok(HandlePeerTermination(frame, &control));
        }
        default:
            return MaybeStep::Ok(std::nullopt);
    }
}

Result<Unit, TransferFailure> TransferSession::AcceptChunk(const pb::Frame& frame) {
    pb::ChunkFrame chunk;
    if (!chunk.ParseFromString(frame.payload()) || chunk.tag().size() != kAesGcmTagBytes) {
        TALLOW_LOG_WARN("Transfer {} dropped a malformed chunk frame", transfer_id_.ToString());
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    const uint32_t index = chunk.index();
    if (index >= state_.total_chunks) {
        TALLOW_LOG_WARN("Transfer {} dropped chunk {} past the end of the file", transfer_id_.ToString(), index);
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    if (chunk.epoch() != ratchet_->Epoch()) {
        TALLOW_LOG_DEBUG("Transfer {} dropped chunk {} of epoch {}", transfer_id_.ToString(), index, chunk.epoch());
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    if (state_.IsChunkDone(index)) {
        return SendAck({index});
    }
    if (decrypting_indices_.contains(index)) {
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    auto key_result = ratchet_->DeriveRecvKey(index);
    if (key_result.IsErr()) {
        TALLOW_LOG_WARN("Transfer {} refused chunk {}: {}",
                        transfer_id_.ToString(), index, key_result.UnwrapErr().Describe());
        return Result<Unit, TransferFailure>::Ok(unit);
    }
    SetChunk(index, ChunkStatus::Received);
    auto submitted = pool_->Submit(
        [this, index, key = std::move(key_result).Unwrap(), chunk = std::move(chunk)]()
            -> Result<DecryptedChunk, TransferFailure> {
            auto opened_result = cipher::ChunkCipher::Decrypt(
                key, transfer_id_bytes_, index, AsBytes(chunk.ciphertext()), AsBytes(chunk.tag()));
            if (opened_result.IsErr()) {
                return Result<DecryptedChunk, TransferFailure>::Err(opened_result.UnwrapErr());
            }
            cipher::OpenedChunk opened = std::move(opened_result).Unwrap();
            auto written = writer_->WriteChunk(index, opened.plaintext);
            crypto::WipeQuietly(opened.plaintext);
            if (written.IsErr()) {
                return Result<DecryptedChunk, TransferFailure>::Err(written.UnwrapErr());
            }
            return Result<DecryptedChunk, TransferFailure>::Ok(DecryptedChunk{
                index, opened.plaintext_hash, static_cast<uint32_t>(chunk.ciphertext().size())});
        });
    if (submitted.IsErr()) {
        return Result<Unit, TransferFailure>::Err(submitted.UnwrapErr());
    }
    decrypting_.push_back(PendingDecrypt{index, std::move(submitted).Unwrap()});
    decrypting_indices_.insert(index);
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::ProcessDecrypted(const bool wait_all) {
    std::vector<uint32_t> verified;
    std::vector<uint32_t> failed;
    std::vector<uint32_t> retransmit;
    std::optional<TransferFailure> fatal;

    while (!decrypting_.empty() && (wait_all || IsReady(decrypting_.front().result))) {
        PendingDecrypt pending = std::move(decrypting_.front());
        decrypting_.pop_front();
        decrypting_indices_.erase(pending.index);
        auto chunk_result = pending.result.get();
        if (chunk_result.IsOk()) {
            const DecryptedChunk& chunk = chunk_result.Unwrap();
            {
                std::lock_guard guard(state_lock_);
                models::ChunkRecord& record = state_.chunks[chunk.index];
                record.plaintext_hash = chunk.plaintext_hash;
                record.ciphertext_length = chunk.ciphertext_length;
            }
            SetChunk(chunk.index, ChunkStatus::Verified);
            failures_.RecordSuccess(chunk.index);
            verified.push_back(chunk.index);
            if (auto released = ratchet_->ReleaseRecv(chunk.index); released.IsErr() && !fatal) {
                fatal = released.UnwrapErr();
            }
            continue;
        }

        const TransferFailure& failure = chunk_result.UnwrapErr();
        if (!failure.IsChunkLocal()) {
            SetChunk(pending.index, ChunkStatus::Pending);
            if (!fatal) {
                fatal = failure;
            }
            continue;
        }
        const uint32_t count = failures_.RecordFailure(pending.index);
        SetChunk(pending.index, ChunkStatus::Failed);
        failed.push_back(pending.index);
        TALLOW_LOG_WARN("Transfer {}: chunk {} failed verification ({} of {}): {}",
                        transfer_id_.ToString(), pending.index, count, kMaxConsecutiveChunkFailures,
                        failure.Describe());
        if (failures_.LimitReached(pending.index)) {
            if (!fatal) {
                fatal = TransferFailure(failure.type,
                                        std::format("Chunk {} failed {} times: {}", pending.index, count,
                                                    failure.message));
            }
            continue;
        }
        retransmit.push_back(pending.index);
    }

    std::vector<uint32_t> changed = verified;
    changed.insert(changed.end(), failed.begin(), failed.end());
    // Persisted before the ack leaves, so the sender never holds an ack for
    // a chunk this side could forget.
    TALLOW_TRY(PersistChunks(changed));
    if (!verified.empty()) {
        EmitProgress();
        TALLOW_TRY(SendAck(verified));
    }
    if (fatal.has_value()) {
        return Result<Unit, TransferFailure>::Err(*fatal);
    }
    if (!retransmit.empty()) {
        pb::Control control;
        for (const uint32_t index : retransmit) {
            control.mutable_retransmit()->add_indices(index);
        }
        TALLOW_TRY(SendControl(control));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> TransferSession::RunRekeyAsReceiver(const pb::HandshakeOffer& offer) {
    TALLOW_TRY(ProcessDecrypted(true));
    const uint64_t base = ratchet_->RecvChain().Ceiling();
    if (offer.purpose() != pb::HANDSHAKE_PURPOSE_REKEY || offer.rekey_at_index() != base ||
        ratchet_->RecvChain().Frontier() < base) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Handshake(std::format("Unexpected key rotation at chunk {}", offer.rekey_at_index())));
    }
    const uint32_t next_epoch = ratchet_->Epoch() + 1;
    auto responder_result = negotiation::NegotiationResponder::Process(
        offer, negotiation::NegotiationContext(transfer_id_bytes_, next_epoch));
    if (responder_result.IsErr()) {
        return Result<Unit, TransferFailure>::Err(responder_result.UnwrapErr());
    }
    auto responder = std::move(responder_result).Unwrap();
    pb::Control control;
    *control.mutable_rekey_accept() = responder->Accept();
    TALLOW_TRY(SendControl(control));

    {
        auto secret_result = responder->TakeSharedSecret();
        if (secret_result.IsErr()) {
            return Result<Unit, TransferFailure>::Err(secret_result.UnwrapErr());
        }
        TALLOW_TRY(ratchet_->Reseed(secret_result.Unwrap(), base));
    }
    responder.reset();
    TALLOW_TRY(RefreshControlKey());
    TALLOW_TRY(SaveState());
    failures_.Reset();
    TALLOW_LOG_INFO("Transfer {} entered epoch {} at chunk {}", transfer_id_.ToString(), ratchet_->Epoch(), base);
    return Result<Unit, TransferFailure>::Ok(unit);
}

TransferSession::StepResult TransferSession::FinishReceiving() {
    TALLOW_TRY(writer_->Finalize(state_.file_hash));
    SetStatus(TransferStatus::Completed);
    TALLOW_TRY(SaveState());
    pb::Control control;
    control.mutable_complete()->set_file_hash(std::string(state_.file_hash.begin(), state_.file_hash.end()));
    if (auto sent = SendControl(control); sent.IsErr()) {
        TALLOW_LOG_WARN("Transfer {} completed but the peer was not told: {}",
                        transfer_id_.ToString(), sent.UnwrapErr().Describe());
    }
    EmitStatus();
    TALLOW_LOG_INFO("Transfer {} completed: {} bytes written to {}",
                    transfer_id_.ToString(), state_.file_size, state_.local_path);
    return StepResult::Ok(Step::Done);
}

void TransferSession::DrainWorkers() {
    for (auto it = encrypting_.rbegin(); it != encrypting_.rend(); ++it) {
        it->result.wait();
        send_queue_.push_front(it->index);
    }
    encrypting_.clear();
    if (decrypting_.empty()) {
        return;
    }
    if (auto processed = ProcessDecrypted(true); processed.IsErr()) {
        TALLOW_LOG_WARN("Transfer {} finished its outstanding chunks with: {}",
                        transfer_id_.ToString(), processed.UnwrapErr().Describe());
    }
}

}
