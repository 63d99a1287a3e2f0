#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace mpu {

/**
 * @brief Shared cancellation flag with an interruptible wait
 *
 * Copies share state: cancelling any copy cancels all of them. Workers use
 * wait_for() for retry backoff so a cancellation cuts the delay short.
 *
 * THREAD SAFETY: all methods may be called from any thread.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for up to @p timeout
     * @return true if the token was (or became) cancelled
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

} // namespace mpu
