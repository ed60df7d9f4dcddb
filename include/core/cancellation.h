#pragma once

/**
 * @file cancellation.h
 * @brief Cooperative cancellation shared between a turn and its engine calls
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace samaira {

/**
 * @brief Cancellation flag that engines poll and waits can block on
 *
 * Copies share state; cancelling any copy cancels all of them.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /// Raw flag for C callbacks (whisper abort, curl progress)
    const std::atomic<bool>* flag() const { return &state_->cancelled; }

    /**
     * @brief Sleep for up to `duration`, waking early on cancellation
     * @return True if the full duration elapsed without cancellation
     */
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};

} // namespace samaira
