#include "alert_queue.hpp"
#include "logging.hpp"

#include <stdexcept>
#include <utility>

namespace monitor {

    AlertQueue::AlertQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("AlertQueue capacity must be positive.");
        }
    }

    void AlertQueue::push(Alert alert) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (alerts_.size() >= capacity_) {
                alerts_.pop_front();
                if (++dropped_ == 1) {
                    core::logging::getLogger()->warn("Alert queue full ({}), dropping oldest alerts.", capacity_);
                }
            }
            alerts_.push_back(std::move(alert));
        }
        cv_.notify_one();
    }

    std::optional<Alert> AlertQueue::tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (alerts_.empty()) {
            return std::nullopt;
        }
        Alert alert = std::move(alerts_.front());
        alerts_.pop_front();
        return alert;
    }

    std::optional<Alert> AlertQueue::waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !alerts_.empty(); })) {
            return std::nullopt;
        }
        Alert alert = std::move(alerts_.front());
        alerts_.pop_front();
        return alert;
    }

    std::vector<Alert> AlertQueue::drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Alert> result(std::make_move_iterator(alerts_.begin()), std::make_move_iterator(alerts_.end()));
        alerts_.clear();
        return result;
    }

    std::size_t AlertQueue::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alerts_.size();
    }

    std::size_t AlertQueue::droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

} // namespace monitor
