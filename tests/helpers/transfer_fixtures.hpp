#pragma once

#include <catch2/catch_test_macros.hpp>
#include "tallow/codec/chunk_codec.hpp"
#include "tallow/configuration/engine_options.hpp"
#include "tallow/configuration/transfer_config.hpp"
#include "tallow/crypto/kyber_interop.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/engine/transfer_engine.hpp"
#include "tallow/storage/transfer_state_store.hpp"
#include "transfer/frame.pb.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace tallow::transfer::test_helpers {

inline void InitializeCrypto() {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    REQUIRE(crypto::KyberInterop::Initialize().IsOk());
}

/// Fresh directory under the system temp dir, removed on scope exit.
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix) {
        static std::atomic<uint32_t> counter{0};
        std::random_device device;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(device()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> RandomBytes(size_t size, uint32_t seed) {
    std::mt19937 generator(seed);
    std::vector<uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(generator() & 0xFF);
    }
    return data;
}

inline void WriteFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    REQUIRE(out.good());
}

inline std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    REQUIRE(in.good());
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::filesystem::path WriteRandomFile(const std::filesystem::path& path, size_t size, uint32_t seed) {
    WriteFile(path, RandomBytes(size, seed));
    return path;
}

inline crypto::Sha256Digest HashOf(const std::filesystem::path& path) {
    auto hash = codec::ChunkHasher::HashFile(path);
    REQUIRE(hash.IsOk());
    return hash.Unwrap();
}

/// Short timeouts so failure paths run in test time.
inline configuration::TransferConfig FastConfig() {
    auto config = configuration::TransferConfig::Default();
    config.WithResumeTimeout(std::chrono::milliseconds(1500))
        .WithResumeBackoffBase(std::chrono::milliseconds(20))
        .WithHandshakeTimeout(std::chrono::milliseconds(5000))
        .WithProgressInterval(std::chrono::milliseconds(0))
        .WithStorageRetryBackoff(std::chrono::milliseconds(1));
    return config;
}

struct Peer {
    std::filesystem::path root;
    std::unique_ptr<engine::TransferEngine> engine;

    [[nodiscard]] std::filesystem::path Downloads() const { return root / "downloads"; }
    [[nodiscard]] std::filesystem::path State() const { return root / "state"; }
};

inline Peer MakePeer(const std::filesystem::path& root) {
    configuration::EngineOptions options;
    options.state_directory = root / "state";
    options.download_directory = root / "downloads";
    options.sync_writes = false;
    auto engine_result = engine::TransferEngine::Create(options);
    REQUIRE(engine_result.IsOk());
    return Peer{root, std::move(engine_result).Unwrap()};
}

/// Stored record of a peer whose engine is shut down.
inline models::TransferState LoadRecord(const Peer& peer, const models::TransferId& transfer_id) {
    storage::StoreOptions options;
    options.directory = peer.State();
    options.sync_writes = false;
    auto store = storage::TransferStateStore::Open(std::move(options));
    REQUIRE(store.IsOk());
    auto record = store.Unwrap()->Load(transfer_id);
    REQUIRE(record.IsOk());
    return std::move(record).Unwrap();
}

/// Polls until predicate holds; false on timeout.
inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline bool WaitForStatus(engine::TransferEngine& engine, const models::TransferId& transfer_id,
                          models::TransferStatus status,
                          std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
    return WaitUntil([&] {
        auto progress = engine.GetProgress(transfer_id);
        return progress.IsOk() && progress.Unwrap().status == status;
    }, timeout);
}

inline bool WaitForChunks(engine::TransferEngine& engine, const models::TransferId& transfer_id,
                          uint32_t chunks_done,
                          std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
    return WaitUntil([&] {
        auto progress = engine.GetProgress(transfer_id);
        return progress.IsOk() && progress.Unwrap().chunks_done >= chunks_done;
    }, timeout);
}

inline bool WaitForTerminal(engine::TransferEngine& engine, const models::TransferId& transfer_id,
                            std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
    return WaitUntil([&] {
        auto progress = engine.GetProgress(transfer_id);
        return progress.IsOk() && models::IsTerminal(progress.Unwrap().status);
    }, timeout);
}

/// Index of a Chunk frame; nullopt for every other frame type.
inline std::optional<uint32_t> ChunkIndexOf(const tallow::proto::transfer::Frame& frame) {
    if (frame.type() != tallow::proto::transfer::FRAME_TYPE_CHUNK) {
        return std::nullopt;
    }
    tallow::proto::transfer::ChunkFrame chunk;
    if (!chunk.ParseFromString(frame.payload())) {
        return std::nullopt;
    }
    return chunk.index();
}

/// Sender filter that silently loses every chunk at or past limit while
/// closed, so a test can stop a transfer at a known point.
class ChunkGate {
public:
    explicit ChunkGate(uint32_t limit) : limit_(limit) {}

    bool Pass(const tallow::proto::transfer::Frame& frame) const {
        const auto index = ChunkIndexOf(frame);
        return !index.has_value() || *index < limit_ || open_.load();
    }

    void Open() { open_.store(true); }

private:
    uint32_t limit_;
    std::atomic<bool> open_{false};
};

}
