#pragma once

#include "tallow/core/constants.hpp"
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace tallow::transfer::models {

/// 128-bit random transfer identifier in UUID v4 layout.
class TransferId {
public:
    using Bytes16 = std::array<uint8_t, kTransferIdBytes>;

    TransferId() noexcept = default;

    [[nodiscard]] static TransferId Generate();

    /// Accepts the canonical 8-4-4-4-12 hex form, either case.
    [[nodiscard]] static Result<TransferId, TransferFailure> Parse(std::string_view text);

    [[nodiscard]] static Result<TransferId, TransferFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] bool IsNil() const noexcept;

    bool operator==(const TransferId& other) const noexcept = default;
    auto operator<=>(const TransferId& other) const noexcept = default;

private:
    explicit TransferId(const Bytes16& bytes) noexcept : bytes_(bytes) {}

    Bytes16 bytes_{};
};

}

template<>
struct std::hash<tallow::transfer::models::TransferId> {
    size_t operator()(const tallow::transfer::models::TransferId& id) const noexcept {
        size_t value = 0;
        for (const uint8_t byte : id.Bytes()) {
            value = value * 131u + byte;
        }
        return value;
    }
};
