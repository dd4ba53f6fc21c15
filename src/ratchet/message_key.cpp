#include "tallow/ratchet/message_key.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include <algorithm>

namespace tallow::transfer::ratchet {

MessageKey::MessageKey(const uint64_t index, const uint32_t epoch, std::span<const uint8_t> key_bytes) noexcept
    : index_(index), epoch_(epoch) {
    std::copy_n(key_bytes.begin(), std::min(key_bytes.size(), key_.size()), key_.begin());
}

MessageKey::MessageKey(MessageKey&& other) noexcept
    : index_(other.index_), epoch_(other.epoch_), key_(other.key_) {
    other.Wipe();
}

MessageKey& MessageKey::operator=(MessageKey&& other) noexcept {
    if (this != &other) {
        index_ = other.index_;
        epoch_ = other.epoch_;
        key_ = other.key_;
        other.Wipe();
    }
    return *this;
}

MessageKey::~MessageKey() {
    Wipe();
}

void MessageKey::Wipe() noexcept {
    crypto::WipeQuietly(key_);
}

}
