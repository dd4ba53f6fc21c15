/**
 * @file transfer_loopback_example.cpp
 * @brief Send one file between two engines over an in-memory channel pair
 */

#include "tallow/codec/chunk_codec.hpp"
#include "tallow/core/logger.hpp"
#include "tallow/engine/transfer_engine.hpp"
#include "tallow/transport/in_memory_channel.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <vector>

using namespace tallow::transfer;

namespace {

bool WriteRandomFile(const std::filesystem::path& path, size_t size) {
    std::mt19937 generator(20240611u);
    std::vector<char> data(size);
    for (auto& byte : data) {
        byte = static_cast<char>(generator() & 0xFF);
    }
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return out.good();
}

std::unique_ptr<engine::TransferEngine> MakeEngine(const std::filesystem::path& root) {
    configuration::EngineOptions options;
    options.state_directory = root / "state";
    options.download_directory = root / "downloads";
    auto engine_result = engine::TransferEngine::Create(options);
    if (engine_result.IsErr()) {
        std::cerr << "Failed to create engine: " << engine_result.UnwrapErr().Describe() << std::endl;
        return nullptr;
    }
    return std::move(engine_result).Unwrap();
}

}

int main() {
    Logger::Options log_options;
    log_options.level = spdlog::level::info;
    Logger::Init(log_options);

    const auto workspace = std::filesystem::temp_directory_path() / "tallow_loopback_example";
    std::filesystem::remove_all(workspace);
    std::filesystem::create_directories(workspace);

    const auto source = workspace / "payload.bin";
    if (!WriteRandomFile(source, 3u * 1024u * 1024u + 123u)) {
        std::cerr << "Failed to write " << source << std::endl;
        return 1;
    }

    auto sender = MakeEngine(workspace / "alice");
    auto receiver = MakeEngine(workspace / "bob");
    if (!sender || !receiver) {
        return 1;
    }

    auto [alice_end, bob_end] = transport::InMemoryChannel::CreatePair();
    auto config = configuration::TransferConfig::Default();
    config.WithChunkSize(kChunkSize128K);

    const std::vector<std::filesystem::path> files{source};
    auto send_result = sender->StartSend(files, alice_end, config);
    if (send_result.IsErr()) {
        std::cerr << "StartSend failed: " << send_result.UnwrapErr().Describe() << std::endl;
        return 1;
    }
    auto receive_result = receiver->StartReceive(bob_end, config);
    if (receive_result.IsErr()) {
        std::cerr << "StartReceive failed: " << receive_result.UnwrapErr().Describe() << std::endl;
        return 1;
    }
    const models::TransferId transfer_id = send_result.Unwrap();
    std::cout << "Transfer " << transfer_id.ToString() << " started" << std::endl;

    bool sender_done = false;
    bool receiver_done = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
    while (!(sender_done && receiver_done) && std::chrono::steady_clock::now() < deadline) {
        if (auto event = receiver->Events().WaitNext(std::chrono::milliseconds(100))) {
            std::cout << "  receiver " << models::ToString(event->status) << " "
                      << event->chunks_done << "/" << event->total_chunks;
            if (event->bytes_per_second > 0.0) {
                std::cout << " at " << static_cast<uint64_t>(event->bytes_per_second / 1024.0) << " KiB/s";
            }
            std::cout << std::endl;
            if (models::IsTerminal(event->status)) {
                receiver_done = true;
            }
        }
        while (auto event = sender->Events().Poll()) {
            if (models::IsTerminal(event->status)) {
                sender_done = true;
            }
        }
    }

    auto progress = receiver->GetProgress(transfer_id);
    if (progress.IsErr() || progress.Unwrap().status != models::TransferStatus::Completed) {
        std::cerr << "Transfer did not complete" << std::endl;
        return 1;
    }

    const auto received = workspace / "bob" / "downloads" / "payload.bin";
    auto source_hash = codec::ChunkHasher::HashFile(source);
    auto received_hash = codec::ChunkHasher::HashFile(received);
    if (source_hash.IsErr() || received_hash.IsErr() || source_hash.Unwrap() != received_hash.Unwrap()) {
        std::cerr << "Received file does not match the source" << std::endl;
        return 1;
    }
    std::cout << "Received " << received << " intact" << std::endl;

    sender->Shutdown();
    receiver->Shutdown();
    return 0;
}
