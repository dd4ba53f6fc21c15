#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tallow::transfer {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;

inline constexpr size_t kKyberPublicKeyBytes = 1184;
inline constexpr size_t kKyberSecretKeyBytes = 2400;
inline constexpr size_t kKyberCiphertextBytes = 1088;
inline constexpr size_t kKyberSharedSecretBytes = 32;

inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kControlKeyBytes = 32;
inline constexpr size_t kHmacBytes = 32;
inline constexpr size_t kSha256Bytes = 32;
inline constexpr size_t kStoreDigestBytes = 32;
inline constexpr size_t kStoreKeyBytes = 32;
inline constexpr size_t kTransferIdBytes = 16;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;
inline constexpr size_t kOpenSslErrorBufferBytes = 256;

// Chunk indices are u32 on the wire and in the record.
inline constexpr uint64_t kMaxChunkIndex = 0xFFFFFFFFull;
inline constexpr uint32_t kChunkSize16K = 16u * 1024u;
inline constexpr uint32_t kChunkSize32K = 32u * 1024u;
inline constexpr uint32_t kChunkSize64K = 64u * 1024u;
inline constexpr uint32_t kChunkSize128K = 128u * 1024u;
inline constexpr uint32_t kChunkSize256K = 256u * 1024u;
inline constexpr std::array<uint32_t, 5> kAllowedChunkSizes = {
    kChunkSize16K, kChunkSize32K, kChunkSize64K, kChunkSize128K, kChunkSize256K};
inline constexpr uint32_t kDefaultChunkSize = kChunkSize64K;

inline constexpr uint32_t kMaxConsecutiveChunkFailures = 3;
inline constexpr uint32_t kDefaultReceiveWindow = 256;
inline constexpr uint32_t kDefaultMaxInFlightChunks = 16;
inline constexpr uint64_t kDefaultRekeyAfterChunks = 1ull << 20;
inline constexpr uint32_t kDefaultMaxResumeAttempts = 3;
inline constexpr uint32_t kDefaultCleanupAfterDays = 7;
inline constexpr std::chrono::milliseconds kDefaultResumeTimeout{30000};
inline constexpr std::chrono::milliseconds kDefaultResumeBackoffBase{500};
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{30000};
inline constexpr std::chrono::milliseconds kDefaultProgressInterval{200};
inline constexpr std::chrono::milliseconds kDefaultStorageRetryBackoff{50};
inline constexpr uint32_t kDefaultStorageRetryAttempts = 3;
inline constexpr uint32_t kDefaultWorkerThreads = 2;
inline constexpr size_t kDefaultEventQueueCapacity = 1024;

inline constexpr std::string_view kHybridSaltPrefix = "Tallow-PQ-Hybrid-v1::";
inline constexpr std::string_view kRootInfo = "Tallow-Root";
inline constexpr std::string_view kRootRotationInfo = "Tallow-Root-Rotation";
inline constexpr std::string_view kChainInitInfo = "Tallow-ChainInit";
inline constexpr std::string_view kChainInfo = "Tallow-Chain";
inline constexpr std::string_view kMessageInfo = "Tallow-Msg";
inline constexpr std::string_view kControlKeyInfo = "Tallow-Control";
inline constexpr std::string_view kKeyConfirmInfo = "Tallow-KeyConfirm";
inline constexpr std::string_view kChunkAadLabel = "tallow-chunk-v1";
inline constexpr std::string_view kControlAadLabel = "tallow-control-v1";

// Durable record layout
inline constexpr std::array<uint8_t, 4> kRecordMagic = {'T', 'L', 'W', 'S'};
inline constexpr uint32_t kRecordFormatVersion = 1;
inline constexpr uint32_t kMaxJournalEntryBytes = 16384;
inline constexpr uint32_t kJournalCompactionThreshold = 512;
inline constexpr std::string_view kRecordSuffix = ".tstate";
inline constexpr std::string_view kJournalSuffix = ".journal";
inline constexpr std::string_view kTempSuffix = ".tmp";
inline constexpr std::string_view kPartialFileSuffix = ".part";

inline constexpr size_t kMaxFrameBytes = 512u * 1024u;

}
