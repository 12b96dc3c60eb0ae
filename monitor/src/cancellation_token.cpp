#include "cancellation_token.hpp"

namespace monitor {

    void CancellationToken::cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool CancellationToken::waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    }

    void CancellationToken::reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(false);
    }

} // namespace monitor
