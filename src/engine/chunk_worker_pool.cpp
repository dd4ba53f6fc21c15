#include "tallow/engine/chunk_worker_pool.hpp"
#include <algorithm>

namespace tallow::transfer::engine {

ChunkWorkerPool::ChunkWorkerPool(const uint32_t thread_count) {
    const uint32_t count = std::max<uint32_t>(1, thread_count);
    workers_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ChunkWorkerPool::WorkerLoop, this);
    }
}

ChunkWorkerPool::~ChunkWorkerPool() {
    Stop();
}

void ChunkWorkerPool::Stop() {
    {
        std::lock_guard guard(lock_);
        stopping_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ChunkWorkerPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock guard(lock_);
            wake_.wait(guard, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

}
