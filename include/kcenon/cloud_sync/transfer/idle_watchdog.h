/**
 * @file idle_watchdog.h
 * @brief Detection of stalled transfers by absence of progress
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_IDLE_WATCHDOG_H
#define KCENON_CLOUD_SYNC_TRANSFER_IDLE_WATCHDOG_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include "kcenon/cloud_sync/core/timer_service.h"

namespace kcenon::cloud_sync {

/**
 * @brief Fires once when no progress was observed within the idle interval
 *
 * touch() only records the time of the last progress; the timer re-checks
 * that timestamp when it fires and re-arms itself for the remaining time.
 * After expiry the watchdog stays disarmed until resume().
 *
 * The expiry callback runs on the timer thread without any watchdog lock
 * held. It must stay short.
 */
class idle_watchdog {
public:
    using clock = std::chrono::steady_clock;
    using expiry_callback = std::function<void()>;

    idle_watchdog(std::shared_ptr<timer_service> timers,
                  std::chrono::milliseconds interval,
                  expiry_callback on_expired);
    ~idle_watchdog();

    idle_watchdog(const idle_watchdog&) = delete;
    auto operator=(const idle_watchdog&) -> idle_watchdog& = delete;

    /**
     * @brief Arm the watchdog; no-op once started or stopped
     */
    void start();

    /**
     * @brief Record forward progress
     */
    void touch();

    /**
     * @brief Disarm temporarily (retry backoff in progress)
     */
    void suspend();

    /**
     * @brief Re-arm with a fresh interval after suspend() or expiry
     */
    void resume();

    /**
     * @brief Disarm permanently; no expiry callback starts afterwards
     */
    void stop();

    [[nodiscard]] auto is_armed() const -> bool;

    [[nodiscard]] auto last_progress_at() const -> clock::time_point;

    [[nodiscard]] auto interval() const -> std::chrono::milliseconds;

    [[nodiscard]] auto expired_count() const -> std::size_t;

private:
    struct state;
    std::shared_ptr<state> state_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_IDLE_WATCHDOG_H
