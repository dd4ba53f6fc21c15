#pragma once
#include "tallow/configuration/engine_options.hpp"
#include "tallow/configuration/transfer_config.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include "tallow/engine/event_queue.hpp"
#include "tallow/engine/transfer_session.hpp"
#include "tallow/interfaces/i_peer_channel.hpp"
#include "tallow/models/transfer_id.hpp"
#include "tallow/models/transfer_state.hpp"
#include "tallow/storage/transfer_state_store.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace tallow::transfer::engine {

/**
 * @brief Application-facing control surface of the transfer engine
 *
 * Owns the state store, the event queue and every live TransferSession. One
 * engine per process is the expected setup, but nothing here is global:
 * tests run several engines side by side, one per simulated peer.
 *
 * **Usage Example**:
 * ```cpp
 * auto engine = TransferEngine::Create(options).Unwrap();
 * auto id = engine->StartSend(std::vector{path}, channel, TransferConfig::Default());
 * while (auto event = engine->Events().WaitNext(std::chrono::seconds(1))) { ... }
 * ```
 *
 * Every method is thread-safe.
 */
class TransferEngine {
public:
    /**
     * @brief Open the state store and sweep expired records
     *
     * Also initializes libsodium and binds liboqs randomness to it.
     */
    static Result<std::unique_ptr<TransferEngine>, TransferFailure> Create(configuration::EngineOptions options);

    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * @brief Offer one file to the peer on channel
     *
     * Returns as soon as the session thread is started; negotiation runs in
     * the background and is reported on the event stream.
     *
     * @return New transfer id, InvalidInput for anything but exactly one
     *         readable regular file or an invalid config
     */
    Result<models::TransferId, TransferFailure> StartSend(
        std::span<const std::filesystem::path> files,
        std::shared_ptr<interfaces::IPeerChannel> channel,
        const configuration::TransferConfig& config);

    /**
     * @brief Accept whatever the peer opens on channel
     *
     * Waits up to the handshake timeout for the first frame. A handshake
     * offer starts a new incoming transfer; a resume request for a known
     * record continues it. A resume request for an unknown transfer is
     * answered with a reject and fails with NotFound.
     */
    Result<models::TransferId, TransferFailure> StartReceive(
        std::shared_ptr<interfaces::IPeerChannel> channel,
        const configuration::TransferConfig& config = configuration::TransferConfig::Default());

    Result<Unit, TransferFailure> Pause(const models::TransferId& transfer_id);

    /**
     * @brief Continue a paused transfer
     *
     * A live paused session is woken up, on channel if one is given. A
     * transfer that only exists as a record (after a restart) gets a new
     * session that reconnects on channel and asks the peer to resume.
     */
    Result<Unit, TransferFailure> Resume(
        const models::TransferId& transfer_id,
        std::shared_ptr<interfaces::IPeerChannel> channel = nullptr,
        const configuration::TransferConfig& config = configuration::TransferConfig::Default());

    /// Aborts with reason Cancelled; the record is kept until Delete or expiry.
    Result<Unit, TransferFailure> Cancel(const models::TransferId& transfer_id);

    Result<std::vector<models::ResumableSummary>, TransferFailure> ListResumable();

    Result<TransferProgress, TransferFailure> GetProgress(const models::TransferId& transfer_id);

    /// Drops the record and any partial download. Live transfers must end first.
    Result<Unit, TransferFailure> Delete(const models::TransferId& transfer_id);

    /// Removes records that expired by now, with their partial downloads.
    /// Records of sessions still running here are kept.
    /// @return Number of records removed
    Result<size_t, TransferFailure> CleanupExpired(models::TimePoint now = models::Clock::now());

    [[nodiscard]] EventQueue& Events() noexcept { return *events_; }

    /// Sessions whose thread is still alive. Finished ones are released here
    /// and on every lookup; their progress is served from the store after.
    [[nodiscard]] size_t LiveSessionCount();

    /// Pauses every live session, persisting its progress. Idempotent.
    void Shutdown();

private:
    TransferEngine(configuration::EngineOptions options,
                   std::unique_ptr<storage::TransferStateStore> store,
                   std::unique_ptr<EventQueue> events);

    SessionContext Context() const;

    Result<models::TransferId, TransferFailure> Launch(std::unique_ptr<TransferSession> session);

    /// Live session for transfer_id, or nullptr.
    std::shared_ptr<TransferSession> FindSession(const models::TransferId& transfer_id);

    /// Moves out every session whose thread has exited. Caller holds lock_
    /// and drops the result after releasing it.
    std::vector<std::shared_ptr<TransferSession>> TakeFinishedLocked();

    Result<Unit, TransferFailure> ResumeFromRecord(
        const models::TransferId& transfer_id,
        std::shared_ptr<interfaces::IPeerChannel> channel,
        const configuration::TransferConfig& config);

    Result<Unit, TransferFailure> CancelRecord(const models::TransferId& transfer_id);

    void RemovePartialFile(const models::TransferState& state) const;

    configuration::EngineOptions options_;
    std::unique_ptr<storage::TransferStateStore> store_;
    std::unique_ptr<EventQueue> events_;
    mutable std::mutex lock_;
    bool shut_down_ = false;
    std::unordered_map<models::TransferId, std::shared_ptr<TransferSession>> sessions_;
};

}
