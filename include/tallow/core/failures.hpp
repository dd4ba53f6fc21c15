#pragma once
#include <string>
#include <string_view>
#include <cstdint>
namespace tallow::transfer {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};

/// Numeric values are persisted as abort reasons; append only.
enum class TransferFailureType : uint32_t {
    Generic = 0,
    KeyGeneration = 1,
    DeriveKey = 2,
    InvalidInput = 3,
    Handshake = 4,
    Authentication = 5,
    Integrity = 6,
    Transport = 7,
    Storage = 8,
    RatchetExhausted = 9,
    Decode = 10,
    Encode = 11,
    ReplayAttack = 12,
    InvalidState = 13,
    NotFound = 14,
    Timeout = 15,
    Cancelled = 16
};

[[nodiscard]] inline std::string_view ToString(TransferFailureType type) noexcept;

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

class TransferFailure {
public:
    TransferFailureType type;
    std::string message;
    TransferFailure(const TransferFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    /// Transport and storage faults leave the persisted record usable, so the
    /// session pauses instead of aborting.
    [[nodiscard]] bool IsRecoverable() const noexcept {
        return type == TransferFailureType::Transport ||
               type == TransferFailureType::Storage;
    }
    /// Faults that condemn a single chunk rather than the session.
    [[nodiscard]] bool IsChunkLocal() const noexcept {
        return type == TransferFailureType::Authentication ||
               type == TransferFailureType::Integrity;
    }
    [[nodiscard]] std::string Describe() const {
        return std::string(ToString(type)) + ": " + message;
    }

    static TransferFailure Generic(std::string msg) {
        return {TransferFailureType::Generic, std::move(msg)};
    }
    static TransferFailure KeyGeneration(std::string msg) {
        return {TransferFailureType::KeyGeneration, std::move(msg)};
    }
    static TransferFailure DeriveKey(std::string msg) {
        return {TransferFailureType::DeriveKey, std::move(msg)};
    }
    static TransferFailure InvalidInput(std::string msg) {
        return {TransferFailureType::InvalidInput, std::move(msg)};
    }
    static TransferFailure Handshake(std::string msg) {
        return {TransferFailureType::Handshake, std::move(msg)};
    }
    static TransferFailure Authentication(std::string msg) {
        return {TransferFailureType::Authentication, std::move(msg)};
    }
    static TransferFailure Integrity(std::string msg) {
        return {TransferFailureType::Integrity, std::move(msg)};
    }
    static TransferFailure Transport(std::string msg) {
        return {TransferFailureType::Transport, std::move(msg)};
    }
    static TransferFailure Storage(std::string msg) {
        return {TransferFailureType::Storage, std::move(msg)};
    }
    static TransferFailure RatchetExhausted(std::string msg) {
        return {TransferFailureType::RatchetExhausted, std::move(msg)};
    }
    static TransferFailure Decode(std::string msg) {
        return {TransferFailureType::Decode, std::move(msg)};
    }
    static TransferFailure Encode(std::string msg) {
        return {TransferFailureType::Encode, std::move(msg)};
    }
    static TransferFailure ReplayAttack(std::string msg) {
        return {TransferFailureType::ReplayAttack, std::move(msg)};
    }
    static TransferFailure InvalidState(std::string msg) {
        return {TransferFailureType::InvalidState, std::move(msg)};
    }
    static TransferFailure NotFound(std::string msg) {
        return {TransferFailureType::NotFound, std::move(msg)};
    }
    static TransferFailure Timeout(std::string msg) {
        return {TransferFailureType::Timeout, std::move(msg)};
    }
    static TransferFailure Cancelled(std::string msg) {
        return {TransferFailureType::Cancelled, std::move(msg)};
    }
    static TransferFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

inline std::string_view ToString(const TransferFailureType type) noexcept {
    switch (type) {
        case TransferFailureType::Generic: return "Generic";
        case TransferFailureType::KeyGeneration: return "KeyGeneration";
        case TransferFailureType::DeriveKey: return "DeriveKey";
        case TransferFailureType::InvalidInput: return "InvalidInput";
        case TransferFailureType::Handshake: return "HandshakeError";
        case TransferFailureType::Authentication: return "AuthenticationError";
        case TransferFailureType::Integrity: return "IntegrityError";
        case TransferFailureType::Transport: return "TransportError";
        case TransferFailureType::Storage: return "StorageError";
        case TransferFailureType::RatchetExhausted: return "RatchetExhaustionError";
        case TransferFailureType::Decode: return "Decode";
        case TransferFailureType::Encode: return "Encode";
        case TransferFailureType::ReplayAttack: return "ReplayAttack";
        case TransferFailureType::InvalidState: return "InvalidState";
        case TransferFailureType::NotFound: return "NotFound";
        case TransferFailureType::Timeout: return "Timeout";
        case TransferFailureType::Cancelled: return "Cancelled";
    }
    return "Unknown";
}
}
