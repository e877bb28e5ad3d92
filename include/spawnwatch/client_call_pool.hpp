// === Client Call Pool ========================================================
//
// Fixed set of threads that run blocking client calls so the caller can stop
// waiting once its timeout passes. A call that overruns keeps its thread until
// the client returns; while every thread is taken new calls are refused
// rather than queued behind it.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace spawnwatch {

class ClientCallPool final {
  public:
    /**
     * @brief Start @p thread_count call threads.
     *
     * @throws std::invalid_argument when @p thread_count is zero.
     */
    explicit ClientCallPool(std::size_t thread_count);
    ~ClientCallPool();

    ClientCallPool(const ClientCallPool&) = delete;
    ClientCallPool& operator=(const ClientCallPool&) = delete;

    /**
     * @brief Run @p call on a free thread.
     *
     * Returns nullopt when every thread is already running or holding a call,
     * or when the pool is shutting down.
     */
    template <typename Result>
    std::optional<std::future<Result>> try_submit(std::function<Result()> call) {
        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();
        {
            std::scoped_lock lock(mutex_);
            if (flag_stopping_ || taken_count_ >= list_threads_.size()) {
                return std::nullopt;
            }
            ++taken_count_;
            queue_calls_.emplace([this, call = std::move(call), promise]() {
                std::optional<Result> value;
                std::exception_ptr error;
                try {
                    value.emplace(call());
                } catch (...) {
                    error = std::current_exception();
                }
                // Free the slot before the caller can observe the result.
                release_slot();
                if (error) {
                    promise->set_exception(error);
                } else {
                    promise->set_value(std::move(*value));
                }
            });
        }
        cv_call_.notify_one();
        return future;
    }

    [[nodiscard]] std::size_t size() const noexcept;
    /** @brief Calls queued or still running. */
    [[nodiscard]] std::size_t taken() const;

  private:
    void run_loop();
    void release_slot();

    std::vector<std::thread> list_threads_;
    std::queue<std::function<void()>> queue_calls_;
    mutable std::mutex mutex_;
    std::condition_variable cv_call_;
    std::size_t taken_count_{};
    bool flag_stopping_{};
};

}  // namespace spawnwatch
