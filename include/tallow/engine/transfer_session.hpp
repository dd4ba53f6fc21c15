#pragma once
#include "tallow/cipher/chunk_cipher.hpp"
#include "tallow/codec/chunk_codec.hpp"
#include "tallow/configuration/transfer_config.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/engine/chunk_worker_pool.hpp"
#include "tallow/engine/event_queue.hpp"
#include "tallow/interfaces/i_peer_channel.hpp"
#include "tallow/models/transfer_state.hpp"
#include "tallow/ratchet/ratchet_engine.hpp"
#include "tallow/storage/transfer_state_store.hpp"
#include "transfer/frame.pb.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace tallow::transfer::engine {

struct TransferProgress {
    models::TransferId transfer_id;
    models::TransferDirection direction = models::TransferDirection::Send;
    uint32_t chunks_done = 0;
    uint32_t total_chunks = 0;
    uint64_t bytes_done = 0;
    uint64_t file_size = 0;
    std::vector<uint32_t> missing_chunks;
    models::TransferStatus status = models::TransferStatus::Negotiating;
    std::optional<models::AbortReason> abort_reason;

    [[nodiscard]] static TransferProgress FromState(const models::TransferState& state);
};

/// Engine-owned collaborators every session uses. They outlive all sessions.
struct SessionContext {
    storage::TransferStateStore* store = nullptr;
    EventQueue* events = nullptr;
    std::filesystem::path download_directory;
    bool sync_writes = true;
};

/**
 * @brief Drives one transfer through its whole lifecycle on its own thread
 *
 *   Negotiating -> Transferring -> Completed
 *                      |   ^
 *                      v   |
 *                    Paused -> Resuming -> Transferring
 *
 * Any state may end in Aborted. The session thread is the single writer of
 * the ratchet and of the transfer state; chunk encryption, decryption and
 * file I/O run on a small worker pool. Every chunk status change is written
 * to the state store before it is acknowledged to the peer, so a crash at any
 * point leaves a record that resumes without resending confirmed chunks.
 *
 * Transport and storage faults pause the transfer. With auto resume the
 * session reconnects up to max_resume_attempts times with exponential
 * backoff, then aborts and keeps the record. Handshake faults and repeated
 * chunk authentication failures abort immediately.
 *
 * Public methods are thread-safe; they post commands the session thread
 * picks up between frames.
 */
class TransferSession {
public:
    static std::unique_ptr<TransferSession> ForOutgoing(
        SessionContext context,
        models::TransferId transfer_id,
        std::filesystem::path source,
        std::shared_ptr<interfaces::IPeerChannel> channel,
        configuration::TransferConfig config);

    /// offer_frame is the peer's initial Handshake frame.
    static std::unique_ptr<TransferSession> ForIncoming(
        SessionContext context,
        models::TransferId transfer_id,
        tallow::proto::transfer::Frame offer_frame,
        std::shared_ptr<interfaces::IPeerChannel> channel,
        configuration::TransferConfig config);

    /**
     * @brief Continue a persisted transfer
     *
     * With resume_frame (the peer's ResumeRequest) the session answers it;
     * otherwise it reconnects and asks the peer itself.
     */
    static std::unique_ptr<TransferSession> ForRecord(
        SessionContext context,
        models::TransferState state,
        std::shared_ptr<interfaces::IPeerChannel> channel,
        configuration::TransferConfig config,
        std::optional<tallow::proto::transfer::Frame> resume_frame);

    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void Start();

    Result<Unit, TransferFailure> RequestPause();

    /// channel replaces the current one when given.
    Result<Unit, TransferFailure> RequestResume(std::shared_ptr<interfaces::IPeerChannel> channel = nullptr);

    Result<Unit, TransferFailure> RequestCancel();

    /// Pauses (persisting in-flight work) and joins the session thread.
    void Shutdown();

    [[nodiscard]] TransferProgress Progress() const;

    [[nodiscard]] models::TransferStatus Status() const;

    /// False once the session thread has finished.
    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(); }

    [[nodiscard]] const models::TransferId& Id() const noexcept { return transfer_id_; }

private:
    enum class Origin {
        Outgoing,
        Incoming,
        Record
    };

    enum class Command {
        None,
        Pause,
        Resume,
        Cancel,
        Shutdown
    };

    enum class Step {
        Transfer,
        Paused,
        Resume,
        AnswerResume,
        Done
    };

    static constexpr std::chrono::milliseconds kPollSlice{50};

    using StepResult = Result<Step, TransferFailure>;
    using MaybeStep = Result<std::optional<Step>, TransferFailure>;

    struct EncryptedChunk {
        uint32_t index = 0;
        crypto::Sha256Digest plaintext_hash{};
        cipher::SealedChunk sealed;
    };

    struct DecryptedChunk {
        uint32_t index = 0;
        crypto::Sha256Digest plaintext_hash{};
        uint32_t ciphertext_length = 0;
    };

    struct PendingEncrypt {
        uint32_t index;
        std::future<Result<EncryptedChunk, TransferFailure>> result;
    };

    struct PendingDecrypt {
        uint32_t index;
        std::future<Result<DecryptedChunk, TransferFailure>> result;
    };

    TransferSession(SessionContext context, Origin origin, models::TransferId transfer_id,
                    std::shared_ptr<interfaces::IPeerChannel> channel,
                    configuration::TransferConfig config);

    void Run();
    StepResult Begin();
    Step HandleFailure(const TransferFailure& failure);

    // Negotiation
    Result<Unit, TransferFailure> NegotiateAsSender();
    Result<Unit, TransferFailure> NegotiateAsReceiver();
    Result<Unit, TransferFailure> AcceptManifest(const tallow::proto::transfer::Manifest& manifest);
    Result<Unit, TransferFailure> PrepareFromRecord();
    Result<Unit, TransferFailure> SeedRatchet(ratchet::RatchetRole role, const crypto::SecureMemoryHandle& secret);
    Result<Unit, TransferFailure> RestoreRatchet();
    Result<Unit, TransferFailure> RefreshControlKey();

    // Streaming
    StepResult SendLoop();
    StepResult ReceiveLoop();
    MaybeStep HandleSenderFrame(const tallow::proto::transfer::Frame& frame);
    MaybeStep HandleReceiverFrame(const tallow::proto::transfer::Frame& frame);
    Result<Unit, TransferFailure> FillSendWindow();
    Result<Unit, TransferFailure> FlushEncrypted();
    Result<Unit, TransferFailure> ApplyAck(const tallow::proto::transfer::AckFrame& ack);
    Result<Unit, TransferFailure> AcceptChunk(const tallow::proto::transfer::Frame& frame);
    Result<Unit, TransferFailure> ProcessDecrypted(bool wait_all);
    StepResult AwaitCompletion();
    StepResult FinishSending(const tallow::proto::transfer::Complete& complete);
    StepResult FinishReceiving();
    Result<Unit, TransferFailure> RunRekeyAsSender();
    Result<Unit, TransferFailure> RunRekeyAsReceiver(const tallow::proto::transfer::HandshakeOffer& offer);
    void DrainWorkers();

    // Pause, resume, abort
    StepResult ContinueTransferring();
    Step PauseTransfer(bool notify_peer);
    Step AbortTransfer(const TransferFailure& failure, bool notify_peer);
    Step WaitWhilePaused();
    Step ResumeWithBackoff();
    Result<Unit, TransferFailure> TryResume();
    Result<Unit, TransferFailure> AnswerResumeRequest(const tallow::proto::transfer::ResumeRequest& request);
    Step AnswerPendingResume();
    Result<Unit, TransferFailure> ApplyPeerBitmap(const std::string& bitmap);
    void RebuildSendQueue();
    /// Pause, Cancel, Abort and Reject from the peer, common to every phase.
    std::optional<Step> HandlePeerTermination(const tallow::proto::transfer::Frame& frame,
                                              const tallow::proto::transfer::Control* control);

    // Frames
    Result<Unit, TransferFailure> SendFrame(tallow::proto::transfer::FrameType type, const std::string& payload);
    Result<Unit, TransferFailure> SendHandshake(const tallow::proto::transfer::Handshake& handshake);
    Result<Unit, TransferFailure> SendControl(const tallow::proto::transfer::Control& control);
    Result<Unit, TransferFailure> SendAck(const std::vector<uint32_t>& indices);
    Result<Unit, TransferFailure> SendSealed(tallow::proto::transfer::FrameType type,
                                             const google::protobuf::Message& body);
    Result<std::vector<uint8_t>, TransferFailure> OpenSealed(const tallow::proto::transfer::Frame& frame);
    Result<tallow::proto::transfer::Control, TransferFailure> OpenControl(const tallow::proto::transfer::Frame& frame);
    void NotifyPeerOfAbort(const TransferFailure& failure);

    static TransferFailure FailureFromWire(uint32_t reason, const std::string& message);
    /// The peer's reason when frame is a HandshakeReject.
    static std::optional<TransferFailure> RejectionIn(const tallow::proto::transfer::Frame& frame);
    Result<tallow::proto::transfer::Frame, TransferFailure> ReceiveFrame(std::chrono::milliseconds timeout);

    /**
     * @brief Receive until handler yields a value
     *
     * Fails with Timeout after timeout, and with Transport when the engine
     * is shutting down or Cancelled when the user cancels meanwhile.
     */
    template<typename T, typename Handler>
    Result<T, TransferFailure> AwaitFrame(std::chrono::milliseconds timeout, Handler&& handler);

    // State
    Result<Unit, TransferFailure> SaveState();
    Result<Unit, TransferFailure> PersistChunks(const std::vector<uint32_t>& indices);
    Result<Unit, TransferFailure> UpdateCheckpoint();
    void SetStatus(models::TransferStatus status);
    /// Keeps chunks_done_ and bytes_done_ in step with the chunk table.
    void SetChunk(uint32_t index, models::ChunkStatus status);
    void RecountProgress();
    void EmitStatus();
    void EmitProgress();
    [[nodiscard]] models::TransferDirection Direction() const;

    // Commands
    Command TakeCommand();
    Command WaitForCommand(std::chrono::milliseconds timeout);
    [[nodiscard]] bool ShutdownRequested();
    [[nodiscard]] bool CancelRequested();
    std::shared_ptr<interfaces::IPeerChannel> Channel();

    SessionContext context_;
    Origin origin_;
    models::TransferId transfer_id_;
    std::vector<uint8_t> transfer_id_bytes_;
    configuration::TransferConfig config_;
    std::filesystem::path source_path_;
    std::optional<tallow::proto::transfer::Frame> pending_frame_;

    mutable std::mutex state_lock_;
    models::TransferState state_;
    bool established_ = false;
    bool persisted_ = false;
    bool peer_terminated_ = false;
    std::optional<TransferFailure> interruption_;
    uint32_t chunks_done_ = 0;
    uint64_t bytes_done_ = 0;

    std::unique_ptr<ratchet::RatchetEngine> ratchet_;
    std::vector<uint8_t> control_key_;
    std::unique_ptr<codec::ChunkReader> reader_;
    std::unique_ptr<codec::ChunkWriter> writer_;
    cipher::ChunkFailureTracker failures_;
    ProgressMeter meter_;

    std::deque<uint32_t> send_queue_;
    std::set<uint32_t> in_flight_;
    std::deque<PendingEncrypt> encrypting_;
    std::deque<PendingDecrypt> decrypting_;
    std::set<uint32_t> decrypting_indices_;

    std::mutex command_lock_;
    std::condition_variable command_signal_;
    Command command_ = Command::None;
    bool shutdown_ = false;
    std::shared_ptr<interfaces::IPeerChannel> channel_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::unique_ptr<ChunkWorkerPool> pool_;
};

template<typename T, typename Handler>
Result<T, TransferFailure> TransferSession::AwaitFrame(const std::chrono::milliseconds timeout, Handler&& handler) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (ShutdownRequested()) {
            return Result<T, TransferFailure>::Err(TransferFailure::Transport("Engine shutting down"));
        }
        if (CancelRequested()) {
            return Result<T, TransferFailure>::Err(TransferFailure::Cancelled("Transfer cancelled"));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Result<T, TransferFailure>::Err(TransferFailure::Timeout("Peer did not answer in time"));
        }
        const auto slice = std::min<std::chrono::milliseconds>(
            kPollSlice, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        auto frame_result = ReceiveFrame(slice);
        if (frame_result.IsErr()) {
            if (frame_result.UnwrapErr().type == TransferFailureType::Timeout) {
                continue;
            }
            return Result<T, TransferFailure>::Err(std::move(frame_result).UnwrapErr());
        }
        auto handled = handler(frame_result.Unwrap());
        if (handled.IsErr()) {
            return Result<T, TransferFailure>::Err(std::move(handled).UnwrapErr());
        }
        if (handled.Unwrap().has_value()) {
            return Result<T, TransferFailure>::Ok(std::move(*handled.Unwrap()));
        }
    }
}

}
