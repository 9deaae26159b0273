/**
 * @file progress_channel.cpp
 * @brief Implementation of the transfer event stream
 */

#include "kcenon/cloud_sync/transfer/progress_channel.h"

#include <cmath>

namespace kcenon::cloud_sync {

progress_channel::progress_channel(progress_callback sink)
    : sink_(std::move(sink)) {}

auto progress_channel::push(transfer_progress_event event) -> bool {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        if (event.type == progress_event_type::progress) {
            if (!event.percent || !std::isfinite(*event.percent)) {
                return false;
            }
            if (last_percent_ && *event.percent < *last_percent_) {
                return false;
            }
            last_percent_ = event.percent;
        } else {
            terminal_ = true;
            closed_ = true;
        }

        queue_.push_back(event);
        ++accepted_;
    }
    cv_.notify_all();

    if (sink_) {
        sink_(event);
    }
    return true;
}

void progress_channel::close() {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto progress_channel::receive() -> std::optional<transfer_progress_event> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto progress_channel::receive_for(std::chrono::milliseconds timeout)
    -> std::optional<transfer_progress_event> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return std::nullopt;
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto progress_channel::try_receive() -> std::optional<transfer_progress_event> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

auto progress_channel::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto progress_channel::has_terminal() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_;
}

auto progress_channel::last_percent() const -> std::optional<double> {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_percent_;
}

auto progress_channel::accepted_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_;
}

}  // namespace kcenon::cloud_sync
