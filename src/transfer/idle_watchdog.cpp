/**
 * @file idle_watchdog.cpp
 * @brief Implementation of the idle watchdog
 */

#include "kcenon/cloud_sync/transfer/idle_watchdog.h"

#include <mutex>

#include "kcenon/cloud_sync/core/logging.h"

namespace kcenon::cloud_sync {

struct idle_watchdog::state : std::enable_shared_from_this<idle_watchdog::state> {
    std::shared_ptr<timer_service> timers;
    std::chrono::milliseconds interval;
    expiry_callback on_expired;

    mutable std::mutex mutex;
    clock::time_point last_progress{clock::now()};
    timer_service::timer_id timer{0};
    uint64_t generation{0};
    std::size_t expired{0};
    bool started{false};
    bool armed{false};
    bool stopped{false};

    // Requires mutex held
    void arm(clock::duration delay) {
        std::weak_ptr<state> weak = shared_from_this();
        auto gen = generation;
        timer = timers->schedule(delay, [weak, gen] {
            if (auto self = weak.lock()) {
                self->fire(gen);
            }
        });
    }

    void fire(uint64_t gen) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (gen != generation || !armed || stopped) {
                return;
            }
            auto deadline = last_progress + interval;
            auto now = clock::now();
            if (now < deadline) {
                arm(deadline - now);
                return;
            }
            armed = false;
            ++expired;
        }

        CS_LOG_DEBUG(log_category::watchdog,
                     "Idle interval of " + std::to_string(interval.count()) +
                         "ms elapsed without progress");
        on_expired();
    }
};

idle_watchdog::idle_watchdog(std::shared_ptr<timer_service> timers,
                             std::chrono::milliseconds interval,
                             expiry_callback on_expired)
    : state_(std::make_shared<state>()) {
    state_->timers = std::move(timers);
    state_->interval = interval;
    state_->on_expired = std::move(on_expired);
}

idle_watchdog::~idle_watchdog() {
    stop();
}

void idle_watchdog::start() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->started || state_->stopped) {
        return;
    }
    state_->started = true;
    state_->armed = true;
    state_->last_progress = clock::now();
    state_->arm(state_->interval);
}

void idle_watchdog::touch() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->last_progress = clock::now();
}

void idle_watchdog::suspend() {
    timer_service::timer_id pending = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->armed) {
            return;
        }
        state_->armed = false;
        ++state_->generation;
        pending = state_->timer;
    }
    state_->timers->discard(pending);
}

void idle_watchdog::resume() {
    timer_service::timer_id stale = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopped) {
            return;
        }
        stale = state_->timer;
        state_->started = true;
        state_->armed = true;
        ++state_->generation;
        state_->last_progress = clock::now();
        state_->arm(state_->interval);
    }
    state_->timers->discard(stale);
}

void idle_watchdog::stop() {
    timer_service::timer_id pending = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopped) {
            return;
        }
        state_->stopped = true;
        state_->armed = false;
        ++state_->generation;
        pending = state_->timer;
    }
    state_->timers->discard(pending);
}

auto idle_watchdog::is_armed() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->armed;
}

auto idle_watchdog::last_progress_at() const -> clock::time_point {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->last_progress;
}

auto idle_watchdog::interval() const -> std::chrono::milliseconds {
    return state_->interval;
}

auto idle_watchdog::expired_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->expired;
}

}  // namespace kcenon::cloud_sync
