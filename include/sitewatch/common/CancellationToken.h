#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace sitewatch::common {

// Cooperative cancellation flag shared between an operator-facing handle and
// the code doing the work. Copies refer to the same underlying state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool isCancelled() const {
        return state_->cancelled.load();
    }

    // Blocks for `duration` or until cancelled; returns false when cancelled.
    bool waitFor(std::chrono::milliseconds duration) const {
        if (duration.count() <= 0) {
            return !isCancelled();
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};

} // namespace sitewatch::common
