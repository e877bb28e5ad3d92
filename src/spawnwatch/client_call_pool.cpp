#include "spawnwatch/client_call_pool.hpp"

#include <stdexcept>

namespace spawnwatch {

ClientCallPool::ClientCallPool(std::size_t thread_count) {
    if (thread_count == 0) {
        throw std::invalid_argument("ClientCallPool requires at least one thread");
    }
    list_threads_.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        list_threads_.emplace_back(&ClientCallPool::run_loop, this);
    }
}

ClientCallPool::~ClientCallPool() {
    {
        std::scoped_lock lock(mutex_);
        flag_stopping_ = true;
    }
    cv_call_.notify_all();
    // Clients receive their timeout, so an overrunning call still returns.
    for (std::thread& call_thread : list_threads_) {
        if (call_thread.joinable()) {
            call_thread.join();
        }
    }
}

std::size_t ClientCallPool::size() const noexcept {
    return list_threads_.size();
}

std::size_t ClientCallPool::taken() const {
    std::scoped_lock lock(mutex_);
    return taken_count_;
}

void ClientCallPool::run_loop() {
    for (;;) {
        std::function<void()> call;
        {
            std::unique_lock lock(mutex_);
            cv_call_.wait(lock, [this]() { return flag_stopping_ || !queue_calls_.empty(); });
            if (queue_calls_.empty()) {
                return;
            }
            call = std::move(queue_calls_.front());
            queue_calls_.pop();
        }
        call();
    }
}

void ClientCallPool::release_slot() {
    std::scoped_lock lock(mutex_);
    --taken_count_;
}

}  // namespace spawnwatch
