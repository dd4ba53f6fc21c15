#include "tallow/models/transfer_id.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include <algorithm>
#include <format>

namespace tallow::transfer::models {

namespace {
    constexpr size_t kCanonicalLength = 36;
    constexpr std::array<size_t, 4> kDashPositions = {8, 13, 18, 23};

    int HexValue(const char c) noexcept {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    bool IsDashPosition(const size_t position) noexcept {
        for (const size_t dash : kDashPositions) {
            if (dash == position) {
                return true;
            }
        }
        return false;
    }
}

TransferId TransferId::Generate() {
    Bytes16 bytes{};
    crypto::SodiumInterop::FillRandom(bytes);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return TransferId(bytes);
}

Result<TransferId, TransferFailure> TransferId::Parse(const std::string_view text) {
    if (text.size() != kCanonicalLength) {
        return Result<TransferId, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Transfer id must be {} characters, got {}", kCanonicalLength, text.size())));
    }
    Bytes16 bytes{};
    size_t out = 0;
    int high = -1;
    for (size_t i = 0; i < text.size(); ++i) {
        if (IsDashPosition(i)) {
            if (text[i] != '-') {
                return Result<TransferId, TransferFailure>::Err(
                    TransferFailure::InvalidInput("Transfer id has misplaced separators"));
            }
            continue;
        }
        const int nibble = HexValue(text[i]);
        if (nibble < 0) {
            return Result<TransferId, TransferFailure>::Err(
                TransferFailure::InvalidInput("Transfer id contains a non-hex character"));
        }
        if (high < 0) {
            high = nibble;
        } else {
            bytes[out++] = static_cast<uint8_t>((high << 4) | nibble);
            high = -1;
        }
    }
    return Result<TransferId, TransferFailure>::Ok(TransferId(bytes));
}

Result<TransferId, TransferFailure> TransferId::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kTransferIdBytes) {
        return Result<TransferId, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("Transfer id must be {} bytes, got {}", kTransferIdBytes, bytes.size())));
    }
    Bytes16 copy{};
    std::copy(bytes.begin(), bytes.end(), copy.begin());
    return Result<TransferId, TransferFailure>::Ok(TransferId(copy));
}

std::string TransferId::ToString() const {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string text;
    text.reserve(kCanonicalLength);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text.push_back(kHex[bytes_[i] >> 4]);
        text.push_back(kHex[bytes_[i] & 0x0F]);
    }
    return text;
}

bool TransferId::IsNil() const noexcept {
    for (const uint8_t byte : bytes_) {
        if (byte != 0) {
            return false;
        }
    }
    return true;
}

}
