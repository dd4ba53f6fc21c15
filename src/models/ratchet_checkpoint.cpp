#include "tallow/models/ratchet_checkpoint.hpp"
#include "tallow/crypto/sodium_interop.hpp"

namespace tallow::transfer::models {

RatchetCheckpoint& RatchetCheckpoint::operator=(const RatchetCheckpoint& other) {
    if (this != &other) {
        Wipe();
        root_key = other.root_key;
        send_chain_key = other.send_chain_key;
        recv_chain_key = other.recv_chain_key;
        send_counter = other.send_counter;
        recv_counter = other.recv_counter;
        epoch = other.epoch;
        epoch_base = other.epoch_base;
    }
    return *this;
}

RatchetCheckpoint& RatchetCheckpoint::operator=(RatchetCheckpoint&& other) noexcept {
    if (this != &other) {
        Wipe();
        root_key = std::move(other.root_key);
        send_chain_key = std::move(other.send_chain_key);
        recv_chain_key = std::move(other.recv_chain_key);
        send_counter = other.send_counter;
        recv_counter = other.recv_counter;
        epoch = other.epoch;
        epoch_base = other.epoch_base;
    }
    return *this;
}

RatchetCheckpoint::~RatchetCheckpoint() {
    Wipe();
}

void RatchetCheckpoint::Wipe() noexcept {
    crypto::WipeQuietly(root_key);
    crypto::WipeQuietly(send_chain_key);
    crypto::WipeQuietly(recv_chain_key);
    root_key.clear();
    send_chain_key.clear();
    recv_chain_key.clear();
}

}
