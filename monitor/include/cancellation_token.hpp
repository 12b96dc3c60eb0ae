#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace monitor {

    // Stop request shared between the monitor thread and its owner.
    // waitFor() is the loop's cancellable suspension point.
    class CancellationToken {
    public:
        void cancel();
        bool isCancelled() const { return cancelled_.load(); }

        // Sleeps up to `timeout`; returns true as soon as cancel() is called
        bool waitFor(std::chrono::milliseconds timeout);

        // Re-arms the token for a restart
        void reset();

    private:
        std::atomic<bool> cancelled_{false};
        std::mutex mutex_;
        std::condition_variable cv_;
    };

} // namespace monitor
