#pragma once
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace tallow::transfer::engine {

/**
 * @brief Fixed set of threads for chunk transformation
 *
 * Read/encrypt on the sending side and decrypt/write on the receiving side
 * run here, each chunk as one task with its own message key. Key derivation
 * stays on the session thread. Stop() finishes queued tasks before joining.
 */
class ChunkWorkerPool {
public:
    explicit ChunkWorkerPool(uint32_t thread_count);
    ~ChunkWorkerPool();

    ChunkWorkerPool(const ChunkWorkerPool&) = delete;
    ChunkWorkerPool& operator=(const ChunkWorkerPool&) = delete;

    /// Fails with InvalidState once the pool is stopping.
    template<typename F>
    Result<std::future<std::invoke_result_t<F>>, TransferFailure> Submit(F&& task) {
        using ReturnType = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        std::future<ReturnType> future = packaged->get_future();
        {
            std::lock_guard guard(lock_);
            if (stopping_) {
                return Result<std::future<ReturnType>, TransferFailure>::Err(
                    TransferFailure::InvalidState("Worker pool is stopping"));
            }
            tasks_.emplace_back([packaged]() { (*packaged)(); });
        }
        wake_.notify_one();
        return Result<std::future<ReturnType>, TransferFailure>::Ok(std::move(future));
    }

    void Stop();

    [[nodiscard]] size_t ThreadCount() const noexcept { return workers_.size(); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex lock_;
    std::condition_variable wake_;
    bool stopping_ = false;
};

}
