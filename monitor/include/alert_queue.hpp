#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include <cstddef>

#include "alert.hpp"

namespace monitor {

    // Multi-producer, multi-consumer channel from the monitor to the presentation layer.
    // Oldest alerts are dropped once `capacity` is reached.
    class AlertQueue {
    public:
        explicit AlertQueue(std::size_t capacity = 10000);

        void push(Alert alert);

        std::optional<Alert> tryPop();
        // Blocks up to `timeout` for an alert
        std::optional<Alert> waitPop(std::chrono::milliseconds timeout);
        // Everything queued right now, oldest first
        std::vector<Alert> drain();

        std::size_t size() const;
        std::size_t droppedCount() const;

    private:
        const std::size_t capacity_;
        std::deque<Alert> alerts_;
        std::size_t dropped_ = 0;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };

} // namespace monitor
